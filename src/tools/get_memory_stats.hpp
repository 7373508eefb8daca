#pragma once
#include "../tool.hpp"

namespace engram {

class GetMemoryStatsTool : public MemoryAwareTool {
public:
    ToolResult execute(const std::string& args_json) override;
    std::string tool_name() const override { return "get_memory_stats"; }
    std::string description() const override;
    std::string parameters_json() const override;
};

} // namespace engram
