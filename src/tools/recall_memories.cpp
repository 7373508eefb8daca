#include "recall_memories.hpp"
#include "memory_tool_util.hpp"
#include "../memory_manager.hpp"
#include "../plugin.hpp"
#include <algorithm>
#include <sstream>

static engram::ToolRegistrar reg_recall_memories("recall_memories",
    []() { return std::make_unique<engram::RecallMemoriesTool>(); });

namespace engram {

ToolResult RecallMemoriesTool::execute(const std::string& args_json) {
    nlohmann::json args;
    if (auto err = parse_memory_tool_args(manager_, args_json, args)) return *err;
    if (auto err = require_string(args, "query")) return *err;

    std::string query = args["query"].get<std::string>();

    uint32_t limit = 5;
    if (args.contains("limit") && args["limit"].is_number_unsigned()) {
        limit = std::clamp(args["limit"].get<uint32_t>(), 1u, 50u);
    }

    std::vector<Tier> tiers;
    for (const auto& name : string_list(args, "memory_types")) {
        if (name == "episodic" || name == "semantic" || name == "longterm") {
            tiers.push_back(tier_from_string(name));
        }
    }

    std::vector<MemoryEntry> results;
    try {
        results = manager_->recall(query, limit, tiers, true);
    } catch (const std::exception& e) {
        return ToolResult{false, std::string("Failed to recall memories: ") + e.what()};
    }

    if (results.empty()) {
        return ToolResult{true, "No memories found for '" + query + "'"};
    }

    std::ostringstream ss;
    ss << "Found " << results.size() << " memories:";
    for (const auto& entry : results) {
        ss << "\n[" << tier_to_string(entry.tier) << "] " << entry.content;
    }
    return ToolResult{true, ss.str()};
}

std::string RecallMemoriesTool::description() const {
    return "Search memories for information relevant to a topic or question";
}

std::string RecallMemoriesTool::parameters_json() const {
    return R"json({"type":"object","properties":{"query":{"type":"string","description":"What to search for"},"memory_types":{"type":"array","items":{"type":"string","enum":["episodic","semantic","longterm"]},"description":"Which memory stores to search (default: all)"},"limit":{"type":"integer","description":"Maximum memories to return (default: 5)"}},"required":["query"]})json";
}

} // namespace engram
