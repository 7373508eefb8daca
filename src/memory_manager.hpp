#pragma once
#include "config.hpp"
#include "memory.hpp"
#include "shared_state.hpp"
#include "tiers/working_memory.hpp"
#include "tiers/episodic_memory.hpp"
#include "tiers/semantic_memory.hpp"
#include "tiers/longterm_memory.hpp"
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace engram {

// Tier-specific arguments for MemoryManager::remember().
using TierDetails = std::variant<EpisodicDetails, SemanticDetails, LongTermDetails>;

// What to do when start_session() is called while a session is active.
enum class SessionRestartPolicy {
    Close,      // run the full end_session() path, then start
    Reject      // throw ValidationError
};

SessionRestartPolicy session_restart_policy_from_string(const std::string& s);

struct SessionContext {
    std::string session_id;
    bool is_first_session = true;
    std::optional<std::string> time_since;          // "3 days", "just now"
    nlohmann::json last_session;                    // last_conversation record or null
    SessionFoundation foundation;
    std::vector<std::string> recent_episodes;

    nlohmann::json to_json() const;
};

// Optional overrides for end_session(); unset fields are derived from working memory.
struct SessionEnd {
    std::optional<std::string> summary;
    std::optional<std::vector<std::string>> topics;
    std::optional<std::pair<Valence, double>> emotion;
};

struct ConsolidationReport {
    uint32_t important_episodes = 0;
    uint32_t positive_episodes = 0;
    std::optional<std::string> pattern_summary_id;  // written this run
    bool pattern_duplicate = false;                 // same source set already consolidated
    std::optional<std::string> relationship_id;     // written or refreshed
    bool relationship_refreshed = false;

    std::vector<std::string> written_ids() const;
    nlohmann::json to_json() const;
};

struct Reflection {
    uint32_t episodic_count = 0;
    uint32_t semantic_count = 0;
    uint32_t longterm_count = 0;
    bool consolidation_suggested = false;
    std::optional<ConsolidationReport> consolidation;
    std::string mood = "unknown";   // positive | challenging | mixed | unknown
    std::string summary;

    nlohmann::json to_json() const;
};

struct MemoryStats {
    uint32_t episodic_count = 0;
    uint32_t semantic_count = 0;
    uint32_t longterm_count = 0;
    uint32_t working_turns = 0;
    uint32_t working_retrieved = 0;
    bool session_active = false;
    double session_minutes = 0.0;

    nlohmann::json to_json() const;
};

// "N day(s)", "N hour(s)", "N minute(s)" or "just now".
std::string format_time_since(uint64_t elapsed_seconds);

// Session lifecycle, cross-tier recall and consolidation over the four tiers.
// Not reentrant: one caller drives a manager at a time.
class MemoryManager {
public:
    // Opens the three durable tiers through the configured index backend.
    MemoryManager(const Config& config, std::unique_ptr<SharedStateStore> shared_state);

    MemoryManager(std::unique_ptr<EpisodicMemory> episodic,
                  std::unique_ptr<SemanticMemory> semantic,
                  std::unique_ptr<LongTermMemory> longterm,
                  std::unique_ptr<SharedStateStore> shared_state,
                  const MemoryConfig& config = MemoryConfig{});

    // ── Session lifecycle ───────────────────────────────────────
    SessionContext start_session();
    // Returns the stored conversation episode, or nullopt if no session was active.
    std::optional<MemoryEntry> end_session(const SessionEnd& end = SessionEnd{});
    bool is_session_active() const { return session_id_.has_value(); }
    const std::optional<std::string>& session_id() const { return session_id_; }

    // ── Memory operations ───────────────────────────────────────
    MemoryEntry remember(const MemoryInput& input, const TierDetails& details);
    // Default details for the tier; Working is routed to Semantic.
    MemoryEntry remember(const MemoryInput& input, Tier tier = Tier::Semantic);

    // tiers empty = Episodic, Semantic and LongTerm.
    std::vector<MemoryEntry> recall(const std::string& query, uint32_t n = 5,
                                    const std::vector<Tier>& tiers = {},
                                    bool include_working = true);

    void add_conversation_turn(const std::string& role, const std::string& content,
                               const std::vector<std::string>& topics = {},
                               std::optional<Valence> tone = std::nullopt);

    // ── Context building ────────────────────────────────────────
    std::string build_context_for_message(const std::string& message);
    std::string build_system_prompt_additions();
    std::vector<ConversationTurn> get_conversation_history(uint32_t last_n = 10) const;

    // ── Maintenance ─────────────────────────────────────────────
    ConsolidationReport consolidate_memories();
    Reflection reflect();
    MemoryStats get_stats();
    nlohmann::json export_snapshot();
    uint32_t purge(uint64_t max_age_seconds, double keep_importance = 0.3);

    // Human-readable time since the last recorded conversation ended.
    std::optional<std::string> time_since_last();

    WorkingMemory& working() { return working_; }
    EpisodicMemory& episodic() { return *episodic_; }
    SemanticMemory& semantic() { return *semantic_; }
    LongTermMemory& longterm() { return *longterm_; }
    SharedStateStore& shared_state() { return *shared_state_; }

private:
    void check_consolidation();
    std::string generate_session_summary() const;
    nlohmann::json last_conversation();

    MemoryConfig config_;
    SessionRestartPolicy restart_policy_;
    WorkingMemory working_;
    std::unique_ptr<EpisodicMemory> episodic_;
    std::unique_ptr<SemanticMemory> semantic_;
    std::unique_ptr<LongTermMemory> longterm_;
    std::unique_ptr<SharedStateStore> shared_state_;
    std::optional<std::string> session_id_;
};

} // namespace engram
