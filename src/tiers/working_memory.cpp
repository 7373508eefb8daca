#include "working_memory.hpp"
#include "../util.hpp"
#include <algorithm>
#include <iomanip>
#include <set>
#include <sstream>

namespace engram {

void EmotionalState::update(Valence v, double new_intensity, const std::string& trigger) {
    intensity = clamp01(intensity * 0.3 + clamp01(new_intensity) * 0.7);
    valence = v;
    dominant_emotion = valence_to_string(v);

    if (!trigger.empty()) {
        recent_triggers.push_back(trigger);
        if (recent_triggers.size() > 5) {
            recent_triggers.erase(recent_triggers.begin(),
                                  recent_triggers.end() - 5);
        }
    }
}

WorkingMemory::WorkingMemory(const WorkingConfig& config)
    : config_(config), context_(default_context()), session_start_(epoch_seconds()) {}

nlohmann::json WorkingMemory::default_context() {
    return {
        {"is_first_session", false},
        {"time_since_last", nullptr},
        {"user_mood_hint", nullptr},
        {"conversation_depth", 0}
    };
}

void WorkingMemory::add_turn(const std::string& role, const std::string& content,
                             std::optional<Valence> tone,
                             const std::vector<std::string>& topics) {
    ConversationTurn turn;
    turn.role = role;
    turn.content = content;
    turn.timestamp = epoch_seconds();
    turn.tone = tone;
    turn.topics = topics;
    turns_.push_back(std::move(turn));

    for (const auto& topic : topics) add_unique(topics_, topic);
    if (topics_.size() > config_.max_topics) {
        topics_.erase(topics_.begin(),
                      topics_.end() - static_cast<ptrdiff_t>(config_.max_topics));
    }

    while (turns_.size() > config_.max_turns) turns_.pop_front();

    context_["conversation_depth"] = turns_.size();
}

void WorkingMemory::store(const MemoryEntry& entry) {
    for (const auto& m : retrieved_) {
        if (m.id == entry.id) return;
    }
    retrieved_.push_back(entry);

    if (retrieved_.size() > config_.max_retrieved) {
        uint64_t now = epoch_seconds();
        std::stable_sort(retrieved_.begin(), retrieved_.end(),
                         [now](const MemoryEntry& a, const MemoryEntry& b) {
                             return a.effective_importance(now) > b.effective_importance(now);
                         });
        retrieved_.resize(config_.max_retrieved);
    }
}

std::vector<MemoryEntry> WorkingMemory::get_relevant(const std::string& query, uint32_t n,
                                                     bool require_overlap) const {
    if (retrieved_.empty() || n == 0) return {};

    auto query_tokens = tokenize(query);
    std::set<std::string> query_words(query_tokens.begin(), query_tokens.end());
    uint64_t now = epoch_seconds();

    std::vector<std::pair<double, const MemoryEntry*>> scored;
    for (const auto& mem : retrieved_) {
        auto mem_tokens = tokenize(mem.content);
        std::set<std::string> mem_words(mem_tokens.begin(), mem_tokens.end());

        size_t overlap = 0;
        for (const auto& w : query_words) {
            if (mem_words.count(w)) overlap++;
        }
        if (require_overlap && overlap == 0) continue;

        double score = static_cast<double>(overlap) * 0.5 + mem.effective_importance(now) * 0.5;
        scored.emplace_back(score, &mem);
    }

    std::stable_sort(scored.begin(), scored.end(),
                     [](const auto& a, const auto& b) { return a.first > b.first; });

    std::vector<MemoryEntry> result;
    for (const auto& [_, mem] : scored) {
        if (result.size() >= n) break;
        result.push_back(*mem);
    }
    return result;
}

bool WorkingMemory::remove(const std::string& id) {
    auto before = retrieved_.size();
    retrieved_.erase(std::remove_if(retrieved_.begin(), retrieved_.end(),
                                    [&id](const MemoryEntry& m) { return m.id == id; }),
                     retrieved_.end());
    return retrieved_.size() != before;
}

std::vector<ConversationTurn> WorkingMemory::conversation_history(uint32_t last_n) const {
    size_t start = 0;
    if (last_n > 0 && turns_.size() > last_n) start = turns_.size() - last_n;
    return {turns_.begin() + static_cast<ptrdiff_t>(start), turns_.end()};
}

void WorkingMemory::update_emotional_state(Valence valence, double intensity,
                                           const std::string& trigger) {
    emotion_.update(valence, intensity, trigger);
}

void WorkingMemory::set_context(const std::string& key, const nlohmann::json& value) {
    context_[key] = value;
}

nlohmann::json WorkingMemory::get_context(const std::string& key,
                                          const nlohmann::json& fallback) const {
    auto it = context_.find(key);
    if (it == context_.end()) return fallback;
    return *it;
}

double WorkingMemory::session_minutes() const {
    uint64_t now = epoch_seconds();
    if (now <= session_start_) return 0.0;
    return static_cast<double>(now - session_start_) / 60.0;
}

uint32_t WorkingMemory::word_count() const {
    uint32_t words = 0;
    for (const auto& turn : turns_) {
        std::istringstream ss(turn.content);
        std::string w;
        while (ss >> w) words++;
    }
    return words;
}

std::vector<std::string> WorkingMemory::key_moments() const {
    std::vector<std::string> moments;
    for (const auto& turn : turns_) {
        if (turn.content.size() > 200) {
            moments.push_back(truncate(turn.content, 100) + "...");
        }
        if (turn.tone && (*turn.tone == Valence::Positive || *turn.tone == Valence::Negative)) {
            moments.push_back("[" + valence_to_string(*turn.tone) + "] " +
                              truncate(turn.content, 80) + "...");
        }
    }
    if (moments.size() > 5) moments.resize(5);
    return moments;
}

// Comma-joined tail of at most n items
static std::string join_last(const std::vector<std::string>& items, size_t n) {
    std::string out;
    size_t start = items.size() > n ? items.size() - n : 0;
    for (size_t i = start; i < items.size(); i++) {
        if (!out.empty()) out += ", ";
        out += items[i];
    }
    return out;
}

std::string WorkingMemory::context_summary() const {
    std::vector<std::string> parts;

    if (emotion_.intensity > 0.3) {
        std::ostringstream ss;
        ss << "Current mood: " << valence_to_string(emotion_.valence)
           << " (intensity: " << std::fixed << std::setprecision(1) << emotion_.intensity << ")";
        parts.push_back(ss.str());
    }
    if (!topics_.empty()) {
        parts.push_back("Active topics: " + join_last(topics_, 5));
    }
    if (focus_) {
        parts.push_back("Current focus: " + *focus_);
    }
    if (!retrieved_.empty()) {
        parts.push_back("Relevant memories loaded: " + std::to_string(retrieved_.size()));
    }

    if (parts.empty()) return "Fresh conversation";

    std::string out;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i > 0) out += " | ";
        out += parts[i];
    }
    return out;
}

void WorkingMemory::clear() {
    turns_.clear();
    retrieved_.clear();
    topics_.clear();
    focus_.reset();
    emotion_ = EmotionalState{};
    context_ = default_context();
    session_start_ = epoch_seconds();
}

nlohmann::json WorkingMemory::to_json() const {
    return {
        {"session_start", format_timestamp(session_start_)},
        {"conversation_turns", turns_.size()},
        {"retrieved_memories", retrieved_.size()},
        {"emotional_state", {
            {"valence", valence_to_string(emotion_.valence)},
            {"intensity", emotion_.intensity}
        }},
        {"active_topics", topics_},
        {"current_focus", focus_ ? nlohmann::json(*focus_) : nlohmann::json(nullptr)},
        {"context", context_}
    };
}

} // namespace engram
