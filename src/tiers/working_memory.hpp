#pragma once
#include "../config.hpp"
#include "../memory.hpp"
#include <cstdint>
#include <deque>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace engram {

struct ConversationTurn {
    std::string role;       // "user" or "assistant"
    std::string content;
    uint64_t timestamp = 0;
    std::optional<Valence> tone;
    std::vector<std::string> topics;
};

// Smoothed emotional state for the current session.
struct EmotionalState {
    Valence valence = Valence::Neutral;
    double intensity = 0.0;
    std::string dominant_emotion = "neutral";
    std::vector<std::string> recent_triggers;   // last 5

    // intensity = 0.3 * old + 0.7 * new
    void update(Valence v, double new_intensity, const std::string& trigger = "");
};

// Session-lifetime context: recent turns, memories pulled in from the
// durable tiers, emotional state and topics. Never persisted.
// Not thread-safe; owned by one MemoryManager.
class WorkingMemory {
public:
    explicit WorkingMemory(const WorkingConfig& config = WorkingConfig{});

    void add_turn(const std::string& role, const std::string& content,
                  std::optional<Valence> tone = std::nullopt,
                  const std::vector<std::string>& topics = {});

    // Pull a durable entry into working context. Duplicates are ignored; over
    // capacity the lowest effective importance is evicted.
    void store(const MemoryEntry& entry);

    // Pulled-in entries ranked by 0.5 * word overlap + 0.5 * effective importance.
    // With require_overlap, entries sharing no word with the query are dropped.
    std::vector<MemoryEntry> get_relevant(const std::string& query, uint32_t n,
                                          bool require_overlap = false) const;
    std::vector<MemoryEntry> recall(const std::string& query, uint32_t n = 3) const {
        return get_relevant(query, n);
    }

    uint32_t count() const { return static_cast<uint32_t>(retrieved_.size()); }
    bool remove(const std::string& id);

    const std::deque<ConversationTurn>& turns() const { return turns_; }
    const std::vector<MemoryEntry>& retrieved() const { return retrieved_; }
    std::vector<ConversationTurn> conversation_history(uint32_t last_n = 0) const;

    void update_emotional_state(Valence valence, double intensity,
                                const std::string& trigger = "");
    const EmotionalState& emotional_state() const { return emotion_; }

    const std::vector<std::string>& active_topics() const { return topics_; }

    void set_focus(const std::string& focus) { focus_ = focus; }
    const std::optional<std::string>& current_focus() const { return focus_; }

    void set_context(const std::string& key, const nlohmann::json& value);
    nlohmann::json get_context(const std::string& key,
                               const nlohmann::json& fallback = nullptr) const;

    uint64_t session_start() const { return session_start_; }
    void set_session_start(uint64_t epoch) { session_start_ = epoch; }
    double session_minutes() const;

    uint32_t word_count() const;

    // Long turns and emotionally toned turns, at most 5.
    std::vector<std::string> key_moments() const;

    // "Current mood: ... | Active topics: ... | ..." or "Fresh conversation".
    std::string context_summary() const;

    void clear();

    nlohmann::json to_json() const;

private:
    static nlohmann::json default_context();

    WorkingConfig config_;
    std::deque<ConversationTurn> turns_;
    std::vector<MemoryEntry> retrieved_;
    EmotionalState emotion_;
    std::vector<std::string> topics_;
    std::optional<std::string> focus_;
    nlohmann::json context_;
    uint64_t session_start_ = 0;
};

} // namespace engram
