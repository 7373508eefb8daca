#include "memory.hpp"
#include "similarity_index.hpp"
#include "util.hpp"
#include <algorithm>

namespace engram {

double clamp01(double v) {
    if (v < 0.0) return 0.0;
    if (v > 1.0) return 1.0;
    return v;
}

double decay_factor(double hours_since_access, double decay_rate) {
    if (hours_since_access < 0.0) hours_since_access = 0.0;
    return std::max(0.1, 1.0 - (decay_rate * hours_since_access / 24.0));
}

double access_boost(uint32_t access_count) {
    return std::min(0.3, static_cast<double>(access_count) * 0.02);
}

double MemoryEntry::effective_importance(uint64_t now) const {
    double hours = 0.0;
    if (last_accessed_at && now > *last_accessed_at) {
        hours = static_cast<double>(now - *last_accessed_at) / 3600.0;
    }
    double decayed = clamp01(importance) * decay_factor(hours, clamp01(decay_rate));
    return clamp01(decayed + access_boost(access_count));
}

double MemoryEntry::effective_importance() const {
    return effective_importance(epoch_seconds());
}

bool MemoryEntry::is_deprecated() const {
    return metadata.is_object() && metadata.value("deprecated", false);
}

double MemoryEntry::confidence() const {
    if (metadata.is_object() && metadata.contains("confidence") &&
        metadata["confidence"].is_number()) {
        return metadata["confidence"].get<double>();
    }
    return 1.0;
}

// ── Enum conversions ─────────────────────────────────────────

std::string tier_to_string(Tier tier) {
    switch (tier) {
        case Tier::Working:  return "working";
        case Tier::Episodic: return "episodic";
        case Tier::Semantic: return "semantic";
        case Tier::LongTerm: return "longterm";
    }
    return "semantic";
}

Tier tier_from_string(const std::string& s) {
    if (s == "working")  return Tier::Working;
    if (s == "episodic") return Tier::Episodic;
    if (s == "longterm") return Tier::LongTerm;
    return Tier::Semantic;
}

std::string tier_id_prefix(Tier tier) {
    switch (tier) {
        case Tier::Working:  return "working";
        case Tier::Episodic: return "episode";
        case Tier::Semantic: return "fact";
        case Tier::LongTerm: return "core";
    }
    return "mem";
}

std::string valence_to_string(Valence v) {
    switch (v) {
        case Valence::Positive: return "positive";
        case Valence::Negative: return "negative";
        case Valence::Neutral:  return "neutral";
        case Valence::Mixed:    return "mixed";
    }
    return "neutral";
}

Valence valence_from_string(const std::string& s) {
    if (s == "positive") return Valence::Positive;
    if (s == "negative") return Valence::Negative;
    if (s == "mixed")    return Valence::Mixed;
    return Valence::Neutral;
}

std::string category_to_string(KnowledgeCategory cat) {
    switch (cat) {
        case KnowledgeCategory::UserPreference:  return "user_preference";
        case KnowledgeCategory::UserFact:        return "user_fact";
        case KnowledgeCategory::ProjectInfo:     return "project_info";
        case KnowledgeCategory::Technical:       return "technical";
        case KnowledgeCategory::Relationship:    return "relationship";
        case KnowledgeCategory::WorldKnowledge:  return "world_knowledge";
        case KnowledgeCategory::LearnedBehavior: return "learned_behavior";
    }
    return "world_knowledge";
}

KnowledgeCategory category_from_string(const std::string& s) {
    if (s == "user_preference")  return KnowledgeCategory::UserPreference;
    if (s == "user_fact")        return KnowledgeCategory::UserFact;
    if (s == "project_info")     return KnowledgeCategory::ProjectInfo;
    if (s == "technical")        return KnowledgeCategory::Technical;
    if (s == "relationship")     return KnowledgeCategory::Relationship;
    if (s == "learned_behavior") return KnowledgeCategory::LearnedBehavior;
    return KnowledgeCategory::WorldKnowledge;
}

std::string consolidation_type_to_string(ConsolidationType type) {
    switch (type) {
        case ConsolidationType::CoreBelief:          return "core_belief";
        case ConsolidationType::RelationshipEssence: return "relationship";
        case ConsolidationType::IdentityMarker:      return "identity";
        case ConsolidationType::Milestone:           return "milestone";
        case ConsolidationType::LessonLearned:       return "lesson";
        case ConsolidationType::PatternSummary:      return "pattern";
    }
    return "lesson";
}

ConsolidationType consolidation_type_from_string(const std::string& s) {
    if (s == "core_belief")  return ConsolidationType::CoreBelief;
    if (s == "relationship") return ConsolidationType::RelationshipEssence;
    if (s == "identity")     return ConsolidationType::IdentityMarker;
    if (s == "milestone")    return ConsolidationType::Milestone;
    if (s == "pattern")      return ConsolidationType::PatternSummary;
    return ConsolidationType::LessonLearned;
}

void add_unique(std::vector<std::string>& set, const std::string& value) {
    if (value.empty()) return;
    if (std::find(set.begin(), set.end(), value) == set.end()) {
        set.push_back(value);
    }
}

// ── JSON conversion ──────────────────────────────────────────

static std::vector<std::string> string_set_from_json(const nlohmann::json& item,
                                                     const char* field) {
    std::vector<std::string> out;
    if (item.contains(field) && item[field].is_array()) {
        for (const auto& v : item[field]) {
            if (v.is_string()) add_unique(out, v.get<std::string>());
        }
    }
    return out;
}

nlohmann::json entry_index_metadata(const MemoryEntry& entry) {
    nlohmann::json meta = {
        {"tier", tier_to_string(entry.tier)},
        {"created_at", entry.created_at},
        {"importance", entry.importance},
        {"valence", valence_to_string(entry.valence)},
        {"intensity", entry.intensity},
        {"tags", entry.tags},
        {"source", entry.source},
        {"related_ids", entry.related_ids},
        {"access_count", entry.access_count},
        {"decay_rate", entry.decay_rate},
        {"metadata", entry.metadata.is_object() ? entry.metadata : nlohmann::json::object()}
    };
    if (entry.last_accessed_at) {
        meta["last_accessed_at"] = *entry.last_accessed_at;
    } else {
        meta["last_accessed_at"] = nullptr;
    }
    return meta;
}

nlohmann::json entry_to_json(const MemoryEntry& entry) {
    nlohmann::json item = entry_index_metadata(entry);
    item["id"] = entry.id;
    item["content"] = entry.content;
    return item;
}

MemoryEntry entry_from_json(const nlohmann::json& item) {
    MemoryEntry entry;
    entry.id = item.value("id", "");
    entry.content = item.value("content", "");
    entry.tier = tier_from_string(item.value("tier", "semantic"));
    entry.created_at = item.value("created_at", uint64_t{0});
    entry.importance = item.value("importance", 0.5);
    entry.valence = valence_from_string(item.value("valence", "neutral"));
    entry.intensity = item.value("intensity", 0.0);
    entry.tags = string_set_from_json(item, "tags");
    entry.source = item.value("source", "conversation");
    entry.related_ids = string_set_from_json(item, "related_ids");
    entry.access_count = item.value("access_count", uint32_t{0});
    if (item.contains("last_accessed_at") && item["last_accessed_at"].is_number_unsigned()) {
        entry.last_accessed_at = item["last_accessed_at"].get<uint64_t>();
    }
    entry.decay_rate = item.value("decay_rate", kWorkingDecayRate);
    if (item.contains("metadata") && item["metadata"].is_object()) {
        entry.metadata = item["metadata"];
    }
    return entry;
}

MemoryEntry entry_from_record(const IndexRecord& record) {
    nlohmann::json item = record.metadata.is_object() ? record.metadata
                                                      : nlohmann::json::object();
    item["id"] = record.id;
    item["content"] = record.text;
    return entry_from_json(item);
}

} // namespace engram
