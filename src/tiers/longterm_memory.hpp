#pragma once
#include "tier_store.hpp"

namespace engram {

struct LongTermDetails {
    ConsolidationType type = ConsolidationType::LessonLearned;
    std::vector<std::string> source_memories;   // ids this was distilled from
};

// Memories loaded at every session start.
struct SessionFoundation {
    std::vector<std::string> identity;
    std::vector<std::string> relationship;
    std::vector<std::string> beliefs;
    std::vector<std::string> recent_lessons;    // at most 3
    std::vector<std::string> milestones;        // at most 3

    bool empty() const {
        return identity.empty() && relationship.empty() && beliefs.empty() &&
               recent_lessons.empty() && milestones.empty();
    }
    nlohmann::json to_json() const;
};

// Consolidated memories: never decay, importance floored at 0.8.
class LongTermMemory : public TierStore {
public:
    explicit LongTermMemory(std::unique_ptr<SimilarityIndex> index);

    MemoryEntry store(const MemoryInput& input, const LongTermDetails& details = {});

    std::vector<MemoryEntry> recall(const std::string& query, uint32_t n = 5,
                                    std::optional<ConsolidationType> type = std::nullopt);

    // Newest first. limit 0 = all.
    std::vector<MemoryEntry> get_by_type(ConsolidationType type, uint32_t limit = 10);
    std::vector<MemoryEntry> get_core_identity() { return get_by_type(ConsolidationType::IdentityMarker); }
    std::vector<MemoryEntry> get_relationship_essence() { return get_by_type(ConsolidationType::RelationshipEssence); }
    std::vector<MemoryEntry> get_core_beliefs() { return get_by_type(ConsolidationType::CoreBelief); }
    std::vector<MemoryEntry> get_lessons_learned() { return get_by_type(ConsolidationType::LessonLearned); }
    std::vector<MemoryEntry> get_milestones() { return get_by_type(ConsolidationType::Milestone); }

    SessionFoundation get_session_foundation();

    MemoryEntry store_identity_marker(const std::string& content, double importance = 0.9);
    MemoryEntry store_relationship_essence(const std::string& content,
                                           Valence valence = Valence::Positive,
                                           double intensity = 0.5);
    MemoryEntry store_core_belief(const std::string& content);
    MemoryEntry store_lesson(const std::string& lesson,
                             const std::vector<std::string>& source_memories = {},
                             Valence valence = Valence::Neutral);
    // date 0 = today
    MemoryEntry store_milestone(const std::string& milestone, uint64_t date = 0,
                                Valence valence = Valence::Positive);

    // Stamp consolidated_at again and count the refresh. False if id is unknown.
    bool refresh(const std::string& id);

    // Markdown identity section for the system prompt; empty if nothing is stored.
    std::string build_identity_prompt();

    // Long-term memories are never purged.
    uint32_t purge(uint64_t max_age_seconds, double keep_importance = 0.3) override;
};

} // namespace engram
