#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace engram {

nlohmann::json Config::defaults_json() {
    return {
        {"memory", {
            {"backend", "sqlite"},
            {"path", ""},
            {"shared_state_path", ""},
            {"session_restart", "close"},
            {"working", {
                {"max_turns", 20},
                {"max_retrieved", 10},
                {"max_topics", 10}
            }},
            {"consolidation", {
                {"interval", 10},
                {"min_importance", 0.7},
                {"max_important", 20},
                {"min_positive_intensity", 0.5},
                {"max_positive", 10},
                {"min_episodes", 3},
                {"reflect_threshold", 50}
            }}
        }},
        {"exploration", {
            {"path", ""},
            {"lookup_policy", "strict"}
        }}
    };
}

nlohmann::json merge_defaults(const nlohmann::json& existing,
                              const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static void read_u32(const nlohmann::json& obj, const char* key, uint32_t& out) {
    if (obj.contains(key) && obj[key].is_number_unsigned())
        out = obj[key].get<uint32_t>();
}

static void read_double(const nlohmann::json& obj, const char* key, double& out) {
    if (obj.contains(key) && obj[key].is_number())
        out = obj[key].get<double>();
}

static void read_string(const nlohmann::json& obj, const char* key, std::string& out) {
    if (obj.contains(key) && obj[key].is_string())
        out = obj[key].get<std::string>();
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;

    if (j.contains("memory") && j["memory"].is_object()) {
        auto& m = j["memory"];
        read_string(m, "backend", cfg.memory.backend);
        read_string(m, "path", cfg.memory.path);
        read_string(m, "shared_state_path", cfg.memory.shared_state_path);
        read_string(m, "session_restart", cfg.memory.session_restart);

        if (m.contains("working") && m["working"].is_object()) {
            auto& w = m["working"];
            read_u32(w, "max_turns", cfg.memory.working.max_turns);
            read_u32(w, "max_retrieved", cfg.memory.working.max_retrieved);
            read_u32(w, "max_topics", cfg.memory.working.max_topics);
        }

        if (m.contains("consolidation") && m["consolidation"].is_object()) {
            auto& c = m["consolidation"];
            auto& cc = cfg.memory.consolidation;
            read_u32(c, "interval", cc.interval);
            read_double(c, "min_importance", cc.min_importance);
            read_u32(c, "max_important", cc.max_important);
            read_double(c, "min_positive_intensity", cc.min_positive_intensity);
            read_u32(c, "max_positive", cc.max_positive);
            read_u32(c, "min_episodes", cc.min_episodes);
            read_u32(c, "reflect_threshold", cc.reflect_threshold);
        }
    }

    if (j.contains("exploration") && j["exploration"].is_object()) {
        auto& e = j["exploration"];
        read_string(e, "path", cfg.exploration.path);
        read_string(e, "lookup_policy", cfg.exploration.lookup_policy);
    }

    return cfg;
}

Config Config::load() {
    std::string config_path = expand_home("~/.engram/config.json");
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                atomic_write_file(config_path, j.dump(4) + "\n");
                std::cerr << "[config] Migrated config with new defaults: "
                          << config_path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Malformed config, using defaults: " << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << config_path << "\n";
        }
    }

    Config cfg = from_json(j);

    // Environment variables always override config file
    if (const char* v = std::getenv("ENGRAM_MEMORY_BACKEND"))
        cfg.memory.backend = v;
    if (const char* v = std::getenv("ENGRAM_MEMORY_PATH"))
        cfg.memory.path = v;
    if (const char* v = std::getenv("ENGRAM_EXPLORATION_PATH"))
        cfg.exploration.path = v;

    return cfg;
}

std::string Config::memory_path() const {
    if (!memory.path.empty()) return expand_home(memory.path);
    if (memory.backend == "json") return expand_home("~/.engram/collections");
    return expand_home("~/.engram/memory.db");
}

std::string Config::shared_state_path() const {
    if (!memory.shared_state_path.empty()) return expand_home(memory.shared_state_path);
    return expand_home("~/.engram/shared_state.json");
}

std::string Config::exploration_path() const {
    if (!exploration.path.empty()) return expand_home(exploration.path);
    return expand_home("~/.engram/exploration.db");
}

} // namespace engram
