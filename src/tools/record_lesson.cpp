#include "record_lesson.hpp"
#include "memory_tool_util.hpp"
#include "../memory_manager.hpp"
#include "../plugin.hpp"

static engram::ToolRegistrar reg_record_lesson("record_lesson",
    []() { return std::make_unique<engram::RecordLessonTool>(); });

namespace engram {

ToolResult RecordLessonTool::execute(const std::string& args_json) {
    nlohmann::json args;
    if (auto err = parse_memory_tool_args(manager_, args_json, args)) return *err;
    if (auto err = require_string(args, "lesson")) return *err;

    std::string lesson = args["lesson"].get<std::string>();
    std::string context = string_or(args, "context", "");
    std::string full = context.empty() ? lesson : lesson + " (Context: " + context + ")";

    try {
        auto entry = manager_->longterm().store_lesson(full, string_list(args, "source_memories"));
        return ToolResult{true, "Recorded lesson: '" + preview(lesson) + "' (id: " + entry.id + ")"};
    } catch (const std::exception& e) {
        return ToolResult{false, std::string("Failed to record lesson: ") + e.what()};
    }
}

std::string RecordLessonTool::description() const {
    return "Record a lesson learned from experience";
}

std::string RecordLessonTool::parameters_json() const {
    return R"json({"type":"object","properties":{"lesson":{"type":"string","description":"The lesson learned"},"context":{"type":"string","description":"What led to this lesson"},"source_memories":{"type":"array","items":{"type":"string"},"description":"Optional ids of the memories this lesson came from"}},"required":["lesson"]})json";
}

} // namespace engram
