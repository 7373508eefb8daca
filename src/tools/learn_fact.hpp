#pragma once
#include "../tool.hpp"

namespace engram {

class LearnFactTool : public MemoryAwareTool {
public:
    ToolResult execute(const std::string& args_json) override;
    std::string tool_name() const override { return "learn_fact"; }
    std::string description() const override;
    std::string parameters_json() const override;
};

} // namespace engram
