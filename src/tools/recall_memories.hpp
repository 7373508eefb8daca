#pragma once
#include "../tool.hpp"

namespace engram {

class RecallMemoriesTool : public MemoryAwareTool {
public:
    ToolResult execute(const std::string& args_json) override;
    std::string tool_name() const override { return "recall_memories"; }
    std::string description() const override;
    std::string parameters_json() const override;
};

} // namespace engram
