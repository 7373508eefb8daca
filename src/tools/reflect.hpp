#pragma once
#include "../tool.hpp"

namespace engram {

class ReflectTool : public MemoryAwareTool {
public:
    ToolResult execute(const std::string& args_json) override;
    std::string tool_name() const override { return "reflect"; }
    std::string description() const override;
    std::string parameters_json() const override;
};

} // namespace engram
