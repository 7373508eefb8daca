#include "remember_experience.hpp"
#include "memory_tool_util.hpp"
#include "../memory_manager.hpp"
#include "../plugin.hpp"
#include <sstream>

static engram::ToolRegistrar reg_remember_experience("remember_experience",
    []() { return std::make_unique<engram::RememberExperienceTool>(); });

namespace engram {

ToolResult RememberExperienceTool::execute(const std::string& args_json) {
    nlohmann::json args;
    if (auto err = parse_memory_tool_args(manager_, args_json, args)) return *err;
    if (auto err = require_string(args, "content")) return *err;

    MemoryInput input;
    input.content = args["content"].get<std::string>();
    input.importance = clamp01(number_or(args, "importance", 0.5));
    input.valence = valence_from_string(string_or(args, "emotion", "neutral"));
    input.tags = string_list(args, "tags");

    try {
        auto entry = manager_->remember(input, EpisodicDetails{});
        std::ostringstream ss;
        ss << "Stored experience: '" << preview(input.content)
           << "' (importance: " << input.importance << ", id: " << entry.id << ")";
        return ToolResult{true, ss.str()};
    } catch (const std::exception& e) {
        return ToolResult{false, std::string("Failed to store experience: ") + e.what()};
    }
}

std::string RememberExperienceTool::description() const {
    return "Store an experience or event that happened, to recall significant moments later";
}

std::string RememberExperienceTool::parameters_json() const {
    return R"json({"type":"object","properties":{"content":{"type":"string","description":"What happened - describe the experience"},"importance":{"type":"number","minimum":0.0,"maximum":1.0,"description":"How important this is, 0.0 (trivial) to 1.0 (very important). Default: 0.5"},"emotion":{"type":"string","enum":["positive","negative","neutral","mixed"],"description":"Emotional tone of the experience"},"tags":{"type":"array","items":{"type":"string"},"description":"Tags to categorize this memory"}},"required":["content"]})json";
}

} // namespace engram
