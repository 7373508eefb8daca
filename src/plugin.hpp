#pragma once
#include "tool.hpp"
#include "similarity_index.hpp"
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <unordered_map>
#include <mutex>

namespace engram {

struct Config; // forward declaration

// Factory function types
using ToolFactory = std::function<std::unique_ptr<Tool>()>;

using IndexFactory = std::function<std::unique_ptr<SimilarityIndex>(
    const Config& config, const std::string& collection)>;

// Central registry for self-registering plugins.
// All methods are thread-safe.
class PluginRegistry {
public:
    static PluginRegistry& instance();

    // Registration
    void register_tool(const std::string& name, ToolFactory factory);
    void register_index(const std::string& name, IndexFactory factory);

    // Creation
    std::unique_ptr<Tool> create_tool(const std::string& name) const;
    std::vector<std::unique_ptr<Tool>> create_all_tools() const;

    std::unique_ptr<SimilarityIndex> create_index(const std::string& name,
                                                  const Config& config,
                                                  const std::string& collection) const;

    // Query
    std::vector<std::string> tool_names() const;
    std::vector<std::string> index_names() const;
    bool has_tool(const std::string& name) const;
    bool has_index(const std::string& name) const;

private:
    PluginRegistry() = default;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ToolFactory> tools_;
    std::unordered_map<std::string, IndexFactory> indexes_;
};

// ── Self-registrar helpers (used at file scope in each plugin .cpp) ──

struct ToolRegistrar {
    ToolRegistrar(const std::string& name, ToolFactory factory) {
        PluginRegistry::instance().register_tool(name, std::move(factory));
    }
};

struct IndexRegistrar {
    IndexRegistrar(const std::string& name, IndexFactory factory) {
        PluginRegistry::instance().register_index(name, std::move(factory));
    }
};

} // namespace engram
