#pragma once
#include "../tool.hpp"

namespace engram {

class LearnUserPreferenceTool : public MemoryAwareTool {
public:
    ToolResult execute(const std::string& args_json) override;
    std::string tool_name() const override { return "learn_user_preference"; }
    std::string description() const override;
    std::string parameters_json() const override;
};

} // namespace engram
