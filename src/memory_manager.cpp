#include "memory_manager.hpp"
#include "errors.hpp"
#include "similarity_index.hpp"
#include "util.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <iostream>
#include <set>
#include <sstream>
#include <unordered_set>

namespace engram {

SessionRestartPolicy session_restart_policy_from_string(const std::string& s) {
    if (s == "reject") return SessionRestartPolicy::Reject;
    return SessionRestartPolicy::Close;
}

// ── Result types ─────────────────────────────────────────────────

nlohmann::json SessionContext::to_json() const {
    return {
        {"session_id", session_id},
        {"is_first_session", is_first_session},
        {"time_since", time_since ? nlohmann::json(*time_since) : nlohmann::json(nullptr)},
        {"last_session", last_session},
        {"foundation", foundation.to_json()},
        {"recent_episodes", recent_episodes}
    };
}

std::vector<std::string> ConsolidationReport::written_ids() const {
    std::vector<std::string> ids;
    if (pattern_summary_id) ids.push_back(*pattern_summary_id);
    if (relationship_id && !relationship_refreshed) ids.push_back(*relationship_id);
    return ids;
}

nlohmann::json ConsolidationReport::to_json() const {
    auto opt = [](const std::optional<std::string>& s) {
        return s ? nlohmann::json(*s) : nlohmann::json(nullptr);
    };
    return {
        {"important_episodes", important_episodes},
        {"positive_episodes", positive_episodes},
        {"pattern_summary_id", opt(pattern_summary_id)},
        {"pattern_duplicate", pattern_duplicate},
        {"relationship_id", opt(relationship_id)},
        {"relationship_refreshed", relationship_refreshed}
    };
}

nlohmann::json Reflection::to_json() const {
    return {
        {"episodic_count", episodic_count},
        {"semantic_count", semantic_count},
        {"longterm_count", longterm_count},
        {"consolidation_suggested", consolidation_suggested},
        {"consolidation", consolidation ? consolidation->to_json() : nlohmann::json(nullptr)},
        {"mood", mood},
        {"summary", summary}
    };
}

nlohmann::json MemoryStats::to_json() const {
    return {
        {"episodic_count", episodic_count},
        {"semantic_count", semantic_count},
        {"longterm_count", longterm_count},
        {"working_conversation_turns", working_turns},
        {"working_retrieved_memories", working_retrieved},
        {"session_active", session_active},
        {"session_duration_minutes", session_minutes}
    };
}

std::string format_time_since(uint64_t elapsed) {
    auto plural = [](uint64_t n, const char* unit) {
        return std::to_string(n) + " " + unit + (n > 1 ? "s" : "");
    };
    if (elapsed >= 86400) return plural(elapsed / 86400, "day");
    if (elapsed >= 3600)  return plural(elapsed / 3600, "hour");
    if (elapsed >= 60)    return plural(elapsed / 60, "minute");
    return "just now";
}

static std::string join(const std::vector<std::string>& items, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); i++) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

// ── Construction ─────────────────────────────────────────────────

MemoryManager::MemoryManager(const Config& config,
                             std::unique_ptr<SharedStateStore> shared_state)
    : MemoryManager(std::make_unique<EpisodicMemory>(create_index(config, "episodic")),
                    std::make_unique<SemanticMemory>(create_index(config, "semantic")),
                    std::make_unique<LongTermMemory>(create_index(config, "longterm")),
                    std::move(shared_state), config.memory) {}

MemoryManager::MemoryManager(std::unique_ptr<EpisodicMemory> episodic,
                             std::unique_ptr<SemanticMemory> semantic,
                             std::unique_ptr<LongTermMemory> longterm,
                             std::unique_ptr<SharedStateStore> shared_state,
                             const MemoryConfig& config)
    : config_(config),
      restart_policy_(session_restart_policy_from_string(config.session_restart)),
      working_(config.working),
      episodic_(std::move(episodic)),
      semantic_(std::move(semantic)),
      longterm_(std::move(longterm)),
      shared_state_(std::move(shared_state)) {
    if (!episodic_ || !semantic_ || !longterm_) {
        throw ValidationError("MemoryManager requires all three durable tiers");
    }
    if (!shared_state_) shared_state_ = std::make_unique<InMemorySharedState>();
}

// ── Session lifecycle ────────────────────────────────────────────

SessionContext MemoryManager::start_session() {
    if (session_id_) {
        if (restart_policy_ == SessionRestartPolicy::Reject) {
            throw ValidationError("Session " + *session_id_ + " is still active");
        }
        std::cerr << "[manager] Closing active session " << *session_id_
                  << " before starting a new one\n";
        end_session();
    }

    working_.clear();

    SessionContext ctx;
    ctx.session_id = generate_time_id("session");
    ctx.foundation = longterm_->get_session_foundation();
    ctx.time_since = time_since_last();
    ctx.is_first_session = !ctx.time_since.has_value();
    ctx.last_session = last_conversation();

    for (auto& episode : episodic_->get_recent(3)) {
        ctx.recent_episodes.push_back(episode.content);
        working_.store(episode);
    }

    working_.set_context("is_first_session", ctx.is_first_session);
    working_.set_context("time_since_last", ctx.time_since ? nlohmann::json(*ctx.time_since)
                                                          : nlohmann::json(nullptr));
    working_.set_context("last_session", ctx.last_session);

    session_id_ = ctx.session_id;
    return ctx;
}

std::optional<MemoryEntry> MemoryManager::end_session(const SessionEnd& end) {
    if (!session_id_) return std::nullopt;

    std::string summary = end.summary && !trim(*end.summary).empty()
        ? *end.summary : generate_session_summary();
    std::vector<std::string> topics = end.topics ? *end.topics : working_.active_topics();

    Valence valence = working_.emotional_state().valence;
    double intensity = working_.emotional_state().intensity;
    if (end.emotion) {
        valence = end.emotion->first;
        intensity = end.emotion->second;
    }

    double duration = working_.session_minutes();

    auto episode = episodic_->store_conversation_episode(
        summary, topics, valence, intensity, working_.key_moments(), duration);

    shared_state_->merge({
        {"last_conversation", {
            {"ended_at", timestamp_now()},
            {"session_id", *session_id_},
            {"summary", summary},
            {"topics", topics},
            {"duration_minutes", duration},
            {"emotional_valence", valence_to_string(valence)},
            {"message_count", working_.turns().size()}
        }}
    });

    check_consolidation();

    working_.clear();
    session_id_.reset();
    return episode;
}

// ── Memory operations ────────────────────────────────────────────

MemoryEntry MemoryManager::remember(const MemoryInput& input, const TierDetails& details) {
    if (auto* d = std::get_if<EpisodicDetails>(&details)) {
        auto entry = episodic_->store(input, *d);
        check_consolidation();
        return entry;
    }
    if (auto* d = std::get_if<LongTermDetails>(&details)) {
        return longterm_->store(input, *d);
    }
    return semantic_->store(input, std::get<SemanticDetails>(details));
}

MemoryEntry MemoryManager::remember(const MemoryInput& input, Tier tier) {
    switch (tier) {
        case Tier::Episodic: return remember(input, TierDetails{EpisodicDetails{}});
        case Tier::LongTerm: return remember(input, TierDetails{LongTermDetails{}});
        case Tier::Semantic:
        case Tier::Working:
            break;
    }
    return remember(input, TierDetails{SemanticDetails{}});
}

std::vector<MemoryEntry> MemoryManager::recall(const std::string& query, uint32_t n,
                                               const std::vector<Tier>& tiers,
                                               bool include_working) {
    if (n == 0) return {};

    std::set<Tier> requested(tiers.begin(), tiers.end());
    requested.erase(Tier::Working);
    if (requested.empty()) {
        requested = {Tier::Episodic, Tier::Semantic, Tier::LongTerm};
    }

    uint32_t per_tier = std::max<uint32_t>(2, n / static_cast<uint32_t>(requested.size()));

    std::vector<MemoryEntry> results;
    if (requested.count(Tier::LongTerm)) {
        auto r = longterm_->recall(query, per_tier);
        results.insert(results.end(), r.begin(), r.end());
    }
    if (requested.count(Tier::Semantic)) {
        auto r = semantic_->recall(query, per_tier);
        results.insert(results.end(), r.begin(), r.end());
    }
    if (requested.count(Tier::Episodic)) {
        auto r = episodic_->recall(query, per_tier);
        results.insert(results.end(), r.begin(), r.end());
    }

    if (include_working) {
        for (auto& entry : working_.get_relevant(query, 2, true)) {
            if (requested.count(entry.tier)) results.push_back(std::move(entry));
        }
    }

    std::unordered_set<std::string> seen;
    std::vector<MemoryEntry> unique;
    for (auto& entry : results) {
        if (seen.insert(entry.id).second) unique.push_back(std::move(entry));
    }

    uint64_t now = epoch_seconds();
    std::stable_sort(unique.begin(), unique.end(),
                     [now](const MemoryEntry& a, const MemoryEntry& b) {
                         return a.effective_importance(now) > b.effective_importance(now);
                     });
    if (unique.size() > n) unique.resize(n);

    for (const auto& entry : unique) working_.store(entry);
    return unique;
}

void MemoryManager::add_conversation_turn(const std::string& role, const std::string& content,
                                          const std::vector<std::string>& topics,
                                          std::optional<Valence> tone) {
    working_.add_turn(role, content, tone, topics);
}

// ── Context building ─────────────────────────────────────────────

static std::string tier_label(Tier tier) {
    auto s = tier_to_string(tier);
    if (!s.empty()) s[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(s[0])));
    return s;
}

std::string MemoryManager::build_context_for_message(const std::string& message) {
    std::vector<std::string> parts;

    auto memories = recall(message, 5);
    if (!memories.empty()) {
        parts.emplace_back("## Relevant Memories");
        for (const auto& mem : memories) {
            parts.push_back("[" + tier_label(mem.tier) + "] " + truncate(mem.content, 200) +
                            (mem.content.size() > 200 ? "..." : ""));
        }
    }

    const auto& emotion = working_.emotional_state();
    if (emotion.intensity > 0.3) {
        parts.emplace_back("\n## Current Emotional Context");
        parts.push_back("Mood: " + valence_to_string(emotion.valence));
    }

    const auto& topics = working_.active_topics();
    if (!topics.empty()) {
        size_t start = topics.size() > 5 ? topics.size() - 5 : 0;
        std::vector<std::string> tail(topics.begin() + static_cast<ptrdiff_t>(start),
                                      topics.end());
        parts.push_back("\n## Active Topics: " + join(tail, ", "));
    }

    return join(parts, "\n");
}

std::string MemoryManager::build_system_prompt_additions() {
    return longterm_->build_identity_prompt();
}

std::vector<ConversationTurn> MemoryManager::get_conversation_history(uint32_t last_n) const {
    return working_.conversation_history(last_n);
}

// ── Consolidation ────────────────────────────────────────────────

void MemoryManager::check_consolidation() {
    try {
        uint32_t count = episodic_->count();
        auto state = shared_state_->read();

        uint32_t watermark = 0;
        if (auto* w = json_path_lookup(state, "consolidation.episodic_watermark")) {
            if (w->is_number_unsigned()) watermark = w->get<uint32_t>();
        }

        if (count < watermark) {
            // Entries were purged since the last run
            shared_state_->merge({{"consolidation", {{"episodic_watermark", count}}}});
            return;
        }
        if (count < watermark + config_.consolidation.interval) return;

        consolidate_memories();
        shared_state_->merge({{"consolidation", {
            {"episodic_watermark", count},
            {"last_consolidated_at", timestamp_now()}
        }}});
    } catch (const BackendUnavailableError& e) {
        std::cerr << "[manager] Warning: consolidation check failed: " << e.what() << "\n";
    }
}

static std::set<std::string> id_set(const std::vector<std::string>& ids) {
    return {ids.begin(), ids.end()};
}

ConsolidationReport MemoryManager::consolidate_memories() {
    const auto& cfg = config_.consolidation;
    ConsolidationReport report;

    auto important = episodic_->get_by_importance(cfg.min_importance, cfg.max_important);
    auto positive = episodic_->recall_emotional(Valence::Positive,
                                                cfg.min_positive_intensity, cfg.max_positive);
    report.important_episodes = static_cast<uint32_t>(important.size());
    report.positive_episodes = static_cast<uint32_t>(positive.size());

    if (important.size() >= cfg.min_episodes) {
        std::vector<std::string> summaries;
        std::vector<std::string> sources;
        for (size_t i = 0; i < important.size() && i < 5; i++) {
            summaries.push_back(important[i].content);
            sources.push_back(important[i].id);
        }

        auto wanted = id_set(sources);
        for (const auto& existing : longterm_->get_by_type(ConsolidationType::PatternSummary, 0)) {
            if (id_set(existing.related_ids) == wanted) {
                report.pattern_duplicate = true;
                break;
            }
        }

        if (!report.pattern_duplicate) {
            MemoryInput input;
            input.content = "Recent significant experiences: " +
                            truncate(join(summaries, " | "), 500);
            input.importance = 0.9;
            auto entry = longterm_->store(input, {ConsolidationType::PatternSummary, sources});
            report.pattern_summary_id = entry.id;
        }
    }

    if (!positive.empty()) {
        std::vector<std::string> moments;
        for (size_t i = 0; i < positive.size() && i < 3; i++) {
            moments.push_back(positive[i].content);
        }
        std::string content = "Positive moments: " + truncate(join(moments, " | "), 400);

        for (const auto& existing :
             longterm_->get_by_type(ConsolidationType::RelationshipEssence, 0)) {
            if (existing.content == content) {
                longterm_->refresh(existing.id);
                report.relationship_id = existing.id;
                report.relationship_refreshed = true;
                break;
            }
        }
        if (!report.relationship_refreshed) {
            auto entry = longterm_->store_relationship_essence(content, Valence::Positive, 0.7);
            report.relationship_id = entry.id;
        }
    }

    return report;
}

Reflection MemoryManager::reflect() {
    Reflection r;
    r.episodic_count = episodic_->count();
    r.semantic_count = semantic_->count();
    r.longterm_count = longterm_->count();

    std::vector<std::string> insights;
    insights.push_back("Memory stats: " + std::to_string(r.episodic_count) + " episodes, " +
                       std::to_string(r.semantic_count) + " facts, " +
                       std::to_string(r.longterm_count) + " core memories");

    if (r.episodic_count > config_.consolidation.reflect_threshold) {
        r.consolidation_suggested = true;
        insights.emplace_back("Many episodic memories - consolidation recommended");
        r.consolidation = consolidate_memories();
    }

    auto recent = episodic_->get_recent(5);
    if (!recent.empty()) {
        auto positive = std::count_if(recent.begin(), recent.end(), [](const MemoryEntry& e) {
            return e.valence == Valence::Positive;
        });
        if (positive >= 3) {
            r.mood = "positive";
            insights.emplace_back("Recent conversations have been positive");
        } else if (positive <= 1) {
            r.mood = "challenging";
            insights.emplace_back("Recent conversations have had some challenges");
        } else {
            r.mood = "mixed";
        }
    }

    r.summary = join(insights, " | ");
    return r;
}

MemoryStats MemoryManager::get_stats() {
    MemoryStats s;
    s.episodic_count = episodic_->count();
    s.semantic_count = semantic_->count();
    s.longterm_count = longterm_->count();
    s.working_turns = static_cast<uint32_t>(working_.turns().size());
    s.working_retrieved = working_.count();
    s.session_active = is_session_active();
    s.session_minutes = s.session_active ? working_.session_minutes() : 0.0;
    return s;
}

nlohmann::json MemoryManager::export_snapshot() {
    return {
        {"exported_at", timestamp_now()},
        {"episodic", episodic_->snapshot()},
        {"semantic", semantic_->snapshot()},
        {"longterm", longterm_->snapshot()}
    };
}

uint32_t MemoryManager::purge(uint64_t max_age_seconds, double keep_importance) {
    uint32_t removed = episodic_->purge(max_age_seconds, keep_importance);
    removed += semantic_->purge(max_age_seconds, keep_importance);
    removed += longterm_->purge(max_age_seconds, keep_importance);
    if (removed > 0) check_consolidation();
    return removed;
}

// ── Helpers ──────────────────────────────────────────────────────

nlohmann::json MemoryManager::last_conversation() {
    auto state = shared_state_->read();
    auto it = state.find("last_conversation");
    if (it == state.end() || !it->is_object()) return nullptr;
    return *it;
}

std::optional<std::string> MemoryManager::time_since_last() {
    auto last = last_conversation();
    if (!last.is_object()) return std::nullopt;

    auto ended = parse_timestamp(last.value("ended_at", ""));
    if (!ended) return std::nullopt;

    uint64_t now = epoch_seconds();
    return format_time_since(now > *ended ? now - *ended : 0);
}

std::string MemoryManager::generate_session_summary() const {
    const auto& turns = working_.turns();
    if (turns.empty()) return "No conversation occurred.";

    std::string first_topic = "general chat";
    for (const auto& t : turns) {
        if (t.role == "user") {
            first_topic = truncate(t.content, 100);
            break;
        }
    }

    const auto& active = working_.active_topics();
    std::string topics = "various topics";
    if (!active.empty()) {
        std::vector<std::string> head(active.begin(),
                                      active.begin() + static_cast<ptrdiff_t>(
                                          std::min<size_t>(3, active.size())));
        topics = join(head, ", ");
    }

    std::ostringstream ss;
    ss << "Conversation with " << turns.size() << " messages over "
       << std::fixed << std::setprecision(1) << working_.session_minutes() << " minutes. "
       << "Started with: " << first_topic << ". Topics: " << topics;
    return ss.str();
}

} // namespace engram
