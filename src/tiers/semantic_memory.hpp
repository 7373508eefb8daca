#pragma once
#include "tier_store.hpp"
#include <mutex>

namespace engram {

struct SemanticDetails {
    KnowledgeCategory category = KnowledgeCategory::WorldKnowledge;
    double confidence = 1.0;
    std::vector<std::string> related_facts;
    std::optional<std::string> supersedes;      // id of the fact this one replaces
};

// Category-tagged facts with a confidence separate from importance.
// Superseded facts are kept for audit but never recalled.
class SemanticMemory : public TierStore {
public:
    explicit SemanticMemory(std::unique_ptr<SimilarityIndex> index);

    // With details.supersedes set, the old fact is marked deprecated,
    // superseded_by the new id, and its importance cut to 30%.
    // Throws NotFoundError if the old fact is unknown and
    // ConcurrentModificationError if it was already superseded.
    MemoryEntry store(const MemoryInput& input, const SemanticDetails& details = {});

    std::vector<MemoryEntry> recall(const std::string& query, uint32_t n = 5,
                                    std::optional<KnowledgeCategory> category = std::nullopt,
                                    double min_confidence = 0.0);

    // Non-deprecated facts in one category, oldest first.
    std::vector<MemoryEntry> recall_by_category(KnowledgeCategory category, uint32_t n = 10);

    std::vector<MemoryEntry> get_user_preferences();
    std::vector<MemoryEntry> get_user_facts();
    std::vector<MemoryEntry> get_relationship_context();

    MemoryEntry store_user_preference(const std::string& preference,
                                      double confidence = 0.8,
                                      const std::string& source = "observed");
    MemoryEntry store_user_fact(const std::string& fact, double confidence = 0.9,
                                const std::string& source = "stated");
    MemoryEntry store_learned_pattern(const std::string& pattern, double confidence = 0.7);

    // Set confidence; at 0.95 or above the fact is marked verified.
    // Returns false if the fact does not exist.
    bool update_confidence(const std::string& id, double confidence);

    // Existing facts in the category that use an opposite keyword
    // (prefer/dislike, always/never, ...).
    std::vector<MemoryEntry> find_contradictions(const std::string& new_fact,
                                                 KnowledgeCategory category);

private:
    std::mutex supersede_mutex_;
};

} // namespace engram
