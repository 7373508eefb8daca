#pragma once
#include "../tool.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace engram {

// Common preamble for memory tool execute(): check the manager and parse JSON args.
// Returns a ToolResult error on failure, or std::nullopt on success (args populated).
inline std::optional<ToolResult> parse_memory_tool_args(
    MemoryManager* manager, const std::string& args_json, nlohmann::json& out) {
    if (!manager) return ToolResult{false, "Memory system is not enabled"};
    try {
        out = nlohmann::json::parse(args_json);
    } catch (const std::exception& e) {
        return ToolResult{false, std::string("Failed to parse arguments: ") + e.what()};
    }
    if (!out.is_object()) return ToolResult{false, "Arguments must be a JSON object"};
    return std::nullopt;
}

// Check that a required string field exists. Returns error ToolResult if missing.
inline std::optional<ToolResult> require_string(const nlohmann::json& args, const char* field) {
    if (!args.contains(field) || !args[field].is_string() ||
        trim(args[field].get<std::string>()).empty()) {
        return ToolResult{false, std::string("Missing required parameter: ") + field};
    }
    return std::nullopt;
}

inline std::string string_or(const nlohmann::json& args, const char* field,
                             const std::string& fallback) {
    if (args.contains(field) && args[field].is_string()) return args[field].get<std::string>();
    return fallback;
}

inline double number_or(const nlohmann::json& args, const char* field, double fallback) {
    if (args.contains(field) && args[field].is_number()) return args[field].get<double>();
    return fallback;
}

inline std::vector<std::string> string_list(const nlohmann::json& args, const char* field) {
    std::vector<std::string> out;
    if (!args.contains(field) || !args[field].is_array()) return out;
    for (const auto& v : args[field]) {
        if (v.is_string()) out.push_back(v.get<std::string>());
    }
    return out;
}

// First 50 bytes, with "..." when cut.
inline std::string preview(const std::string& s) {
    if (s.size() <= 50) return s;
    return truncate(s, 50) + "...";
}

} // namespace engram
