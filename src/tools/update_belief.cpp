#include "update_belief.hpp"
#include "memory_tool_util.hpp"
#include "../memory_manager.hpp"
#include "../plugin.hpp"

static engram::ToolRegistrar reg_update_belief("update_belief",
    []() { return std::make_unique<engram::UpdateBeliefTool>(); });

namespace engram {

ToolResult UpdateBeliefTool::execute(const std::string& args_json) {
    nlohmann::json args;
    if (auto err = parse_memory_tool_args(manager_, args_json, args)) return *err;
    if (auto err = require_string(args, "belief")) return *err;

    MemoryInput input;
    input.content = args["belief"].get<std::string>();
    input.importance = 1.0;
    input.tags = {"belief", "value", "core"};

    LongTermDetails details;
    details.type = ConsolidationType::CoreBelief;

    try {
        // Link the belief being replaced, if one matches
        std::string replaced;
        std::string replaces = string_or(args, "replaces", "");
        if (!trim(replaces).empty()) {
            auto old = manager_->longterm().recall(replaces, 1, ConsolidationType::CoreBelief);
            if (!old.empty()) {
                replaced = old.front().id;
                details.source_memories.push_back(replaced);
            }
        }

        auto entry = manager_->longterm().store(input, details);
        std::string out = "Updated core belief: '" + preview(input.content) + "' (id: " + entry.id + ")";
        if (!replaced.empty()) out += ", evolved from " + replaced;
        return ToolResult{true, out};
    } catch (const std::exception& e) {
        return ToolResult{false, std::string("Failed to update belief: ") + e.what()};
    }
}

std::string UpdateBeliefTool::description() const {
    return "Add or update a core belief about yourself or your values. Use sparingly";
}

std::string UpdateBeliefTool::parameters_json() const {
    return R"json({"type":"object","properties":{"belief":{"type":"string","description":"The belief or value to store"},"replaces":{"type":"string","description":"Optional description of the old belief this replaces"}},"required":["belief"]})json";
}

} // namespace engram
