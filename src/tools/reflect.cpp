#include "reflect.hpp"
#include "memory_tool_util.hpp"
#include "../memory_manager.hpp"
#include "../plugin.hpp"

static engram::ToolRegistrar reg_reflect("reflect",
    []() { return std::make_unique<engram::ReflectTool>(); });

namespace engram {

ToolResult ReflectTool::execute(const std::string& args_json) {
    nlohmann::json args;
    if (auto err = parse_memory_tool_args(manager_, args_json, args)) return *err;

    std::string topic = trim(string_or(args, "topic", ""));
    try {
        if (!topic.empty()) {
            auto memories = manager_->recall(topic, 10);
            return ToolResult{true, "Reflected on '" + topic + "': found " +
                                    std::to_string(memories.size()) + " related memories"};
        }
        return ToolResult{true, manager_->reflect().summary};
    } catch (const std::exception& e) {
        return ToolResult{false, std::string("Reflection failed: ") + e.what()};
    }
}

std::string ReflectTool::description() const {
    return "Reflect on memories and consolidate insights";
}

std::string ReflectTool::parameters_json() const {
    return R"json({"type":"object","properties":{"topic":{"type":"string","description":"Optional topic to focus reflection on"}}})json";
}

} // namespace engram
