#pragma once
#include <string>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace engram {

struct WorkingConfig {
    uint32_t max_turns = 20;
    uint32_t max_retrieved = 10;
    uint32_t max_topics = 10;
};

struct ConsolidationConfig {
    uint32_t interval = 10;             // consolidate every N new episodes
    double min_importance = 0.7;
    uint32_t max_important = 20;
    double min_positive_intensity = 0.5;
    uint32_t max_positive = 10;
    uint32_t min_episodes = 3;          // episodes needed for a pattern summary
    uint32_t reflect_threshold = 50;    // reflect() suggests consolidation above this
};

struct MemoryConfig {
    std::string backend = "sqlite";
    std::string path;                   // empty = ~/.engram/memory.db (or collections/ for json)
    std::string shared_state_path;      // empty = ~/.engram/shared_state.json
    std::string session_restart = "close"; // "close" or "reject"
    WorkingConfig working;
    ConsolidationConfig consolidation;
};

struct ExplorationConfig {
    std::string path;                   // empty = ~/.engram/exploration.db
    std::string lookup_policy = "strict"; // "strict" or "start_new"
};

struct Config {
    MemoryConfig memory;
    ExplorationConfig exploration;

    // Load from ~/.engram/config.json + env vars
    static Config load();

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Parse an already-merged JSON document (no file or env access)
    static Config from_json(const nlohmann::json& j);

    // Resolved storage locations (defaults applied, ~ expanded)
    std::string memory_path() const;
    std::string shared_state_path() const;
    std::string exploration_path() const;
};

// Recursively add keys from defaults that are missing in existing.
nlohmann::json merge_defaults(const nlohmann::json& existing, const nlohmann::json& defaults);

} // namespace engram
