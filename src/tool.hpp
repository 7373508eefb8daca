#pragma once
#include <string>
#include <memory>
#include <vector>

namespace engram {

class MemoryManager; // forward declaration

struct ToolSpec {
    std::string name;
    std::string description;
    std::string parameters_json; // JSON schema for parameters
};

struct ToolResult {
    bool success;
    std::string output;
};

class Tool {
public:
    virtual ~Tool() = default;
    virtual ToolResult execute(const std::string& args_json) = 0;
    virtual std::string tool_name() const = 0;
    virtual std::string description() const = 0;
    virtual std::string parameters_json() const = 0;

    ToolSpec spec() const {
        return ToolSpec{tool_name(), description(), parameters_json()};
    }
};

// Base for tools that operate on the memory manager.
class MemoryAwareTool : public Tool {
public:
    void set_manager(MemoryManager* manager) { manager_ = manager; }

protected:
    MemoryManager* manager_ = nullptr;
};

// Create every registered tool, wired to the given manager.
std::vector<std::unique_ptr<Tool>> create_memory_tools(MemoryManager* manager);

} // namespace engram
