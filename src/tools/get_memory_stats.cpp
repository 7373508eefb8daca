#include "get_memory_stats.hpp"
#include "memory_tool_util.hpp"
#include "../memory_manager.hpp"
#include "../plugin.hpp"
#include <sstream>

static engram::ToolRegistrar reg_get_memory_stats("get_memory_stats",
    []() { return std::make_unique<engram::GetMemoryStatsTool>(); });

namespace engram {

ToolResult GetMemoryStatsTool::execute(const std::string& args_json) {
    nlohmann::json args;
    if (auto err = parse_memory_tool_args(manager_, args_json.empty() ? "{}" : args_json, args)) {
        return *err;
    }

    MemoryStats stats;
    try {
        stats = manager_->get_stats();
    } catch (const std::exception& e) {
        return ToolResult{false, std::string("Failed to read memory stats: ") + e.what()};
    }

    std::ostringstream ss;
    ss << "Memory Statistics:\n"
       << "  Episodic memories: " << stats.episodic_count << "\n"
       << "  Semantic memories: " << stats.semantic_count << "\n"
       << "  Long-term memories: " << stats.longterm_count << "\n"
       << "  Current session turns: " << stats.working_turns << "\n"
       << "  Retrieved memories in context: " << stats.working_retrieved;
    return ToolResult{true, ss.str()};
}

std::string GetMemoryStatsTool::description() const {
    return "Get statistics about the memory system";
}

std::string GetMemoryStatsTool::parameters_json() const {
    return R"json({"type":"object","properties":{}})json";
}

} // namespace engram
