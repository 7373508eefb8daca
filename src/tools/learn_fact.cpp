#include "learn_fact.hpp"
#include "memory_tool_util.hpp"
#include "../memory_manager.hpp"
#include "../plugin.hpp"
#include <sstream>

static engram::ToolRegistrar reg_learn_fact("learn_fact",
    []() { return std::make_unique<engram::LearnFactTool>(); });

namespace engram {

ToolResult LearnFactTool::execute(const std::string& args_json) {
    nlohmann::json args;
    if (auto err = parse_memory_tool_args(manager_, args_json, args)) return *err;
    if (auto err = require_string(args, "fact")) return *err;

    MemoryInput input;
    input.content = args["fact"].get<std::string>();
    input.importance = 0.6;

    SemanticDetails details;
    details.category = category_from_string(string_or(args, "category", "world_knowledge"));
    details.confidence = clamp01(number_or(args, "confidence", 0.8));
    if (args.contains("supersedes") && args["supersedes"].is_string()) {
        details.supersedes = args["supersedes"].get<std::string>();
    }

    try {
        auto entry = manager_->remember(input, details);
        std::ostringstream ss;
        ss << "Learned: '" << preview(input.content) << "' (category: "
           << category_to_string(details.category) << ", confidence: "
           << details.confidence << ", id: " << entry.id << ")";
        if (details.supersedes) ss << ", replacing " << *details.supersedes;
        return ToolResult{true, ss.str()};
    } catch (const std::exception& e) {
        return ToolResult{false, std::string("Failed to learn fact: ") + e.what()};
    }
}

std::string LearnFactTool::description() const {
    return "Store a fact or piece of knowledge about the user, projects, or the world";
}

std::string LearnFactTool::parameters_json() const {
    return R"json({"type":"object","properties":{"fact":{"type":"string","description":"The fact or knowledge to remember"},"category":{"type":"string","enum":["user_preference","user_fact","project_info","technical","relationship","world_knowledge","learned_behavior"],"description":"Category of this knowledge (default: world_knowledge)"},"confidence":{"type":"number","minimum":0.0,"maximum":1.0,"description":"Confidence in this fact, 0.0 to 1.0 (default: 0.8)"},"supersedes":{"type":"string","description":"Optional id of an existing fact this one replaces"}},"required":["fact"]})json";
}

} // namespace engram
