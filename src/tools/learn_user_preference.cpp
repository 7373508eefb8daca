#include "learn_user_preference.hpp"
#include "memory_tool_util.hpp"
#include "../memory_manager.hpp"
#include "../plugin.hpp"
#include <sstream>

static engram::ToolRegistrar reg_learn_user_preference("learn_user_preference",
    []() { return std::make_unique<engram::LearnUserPreferenceTool>(); });

namespace engram {

ToolResult LearnUserPreferenceTool::execute(const std::string& args_json) {
    nlohmann::json args;
    if (auto err = parse_memory_tool_args(manager_, args_json, args)) return *err;
    if (auto err = require_string(args, "preference")) return *err;

    std::string preference = args["preference"].get<std::string>();
    double confidence = clamp01(number_or(args, "confidence", 0.8));

    try {
        auto entry = manager_->semantic().store_user_preference(preference, confidence,
                                                                "llm_observed");
        std::ostringstream ss;
        ss << "Learned user preference: '" << preference << "' (confidence: "
           << confidence << ", id: " << entry.id << ")";
        return ToolResult{true, ss.str()};
    } catch (const std::exception& e) {
        return ToolResult{false, std::string("Failed to store preference: ") + e.what()};
    }
}

std::string LearnUserPreferenceTool::description() const {
    return "Store something the user likes, prefers, or wants";
}

std::string LearnUserPreferenceTool::parameters_json() const {
    return R"json({"type":"object","properties":{"preference":{"type":"string","description":"The preference, e.g. 'prefers concise responses'"},"confidence":{"type":"number","minimum":0.0,"maximum":1.0,"description":"Confidence, 0.0 to 1.0 (default: 0.8)"}},"required":["preference"]})json";
}

} // namespace engram
