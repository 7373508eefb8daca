#include "semantic_memory.hpp"
#include "../errors.hpp"
#include "../util.hpp"
#include <algorithm>
#include <set>

namespace engram {

SemanticMemory::SemanticMemory(std::unique_ptr<SimilarityIndex> index)
    : TierStore(Tier::Semantic, std::move(index)) {}

MemoryEntry SemanticMemory::store(const MemoryInput& input, const SemanticDetails& details) {
    // Facts are neutral
    MemoryInput fact = input;
    fact.valence = Valence::Neutral;
    fact.intensity = 0.0;

    auto entry = new_entry(fact, kSemanticDecayRate);
    for (const auto& rel : details.related_facts) add_unique(entry.related_ids, rel);
    entry.metadata = {
        {"category", category_to_string(details.category)},
        {"confidence", clamp01(details.confidence)},
        {"supersedes", details.supersedes ? nlohmann::json(*details.supersedes)
                                          : nlohmann::json(nullptr)},
        {"verified", false}
    };

    if (!details.supersedes) {
        persist(entry);
        return entry;
    }

    std::lock_guard<std::mutex> lock(supersede_mutex_);

    const auto& old_id = *details.supersedes;
    auto old = get(old_id);
    if (!old) throw NotFoundError("Cannot supersede unknown fact: " + old_id);
    if (old->is_deprecated()) {
        std::string by = old->metadata.value("superseded_by", "");
        throw ConcurrentModificationError("Fact " + old_id + " was already superseded" +
                                          (by.empty() ? "" : " by " + by));
    }

    persist(entry);

    nlohmann::json old_meta = old->metadata;
    old_meta["deprecated"] = true;
    old_meta["superseded_by"] = entry.id;
    try {
        index_->update(old_id, {
            {"importance", old->importance * 0.3},
            {"metadata", old_meta}
        });
    } catch (const std::exception&) {
        // Keep the pair consistent: no replacement without the deprecation
        index_->remove({entry.id});
        throw;
    }
    return entry;
}

std::vector<MemoryEntry> SemanticMemory::recall(const std::string& query, uint32_t n,
                                                std::optional<KnowledgeCategory> category,
                                                double min_confidence) {
    if (n == 0) return {};

    auto where = tier_where();
    if (category) where["metadata.category"] = category_to_string(*category);

    std::vector<MemoryEntry> filtered;
    for (auto& entry : query_entries(query, n * 2, where)) {
        if (entry.is_deprecated()) continue;
        if (entry.confidence() < min_confidence) continue;
        filtered.push_back(std::move(entry));
        if (filtered.size() >= n) break;
    }

    touch_all(filtered);
    return filtered;
}

std::vector<MemoryEntry> SemanticMemory::recall_by_category(KnowledgeCategory category,
                                                            uint32_t n) {
    auto where = tier_where();
    where["metadata.category"] = category_to_string(category);

    std::vector<MemoryEntry> result;
    for (auto& entry : list_entries(where)) {
        if (entry.is_deprecated()) continue;
        result.push_back(std::move(entry));
        if (n > 0 && result.size() >= n) break;
    }
    return result;
}

std::vector<MemoryEntry> SemanticMemory::get_user_preferences() {
    return recall_by_category(KnowledgeCategory::UserPreference, 20);
}

std::vector<MemoryEntry> SemanticMemory::get_user_facts() {
    return recall_by_category(KnowledgeCategory::UserFact, 20);
}

std::vector<MemoryEntry> SemanticMemory::get_relationship_context() {
    return recall_by_category(KnowledgeCategory::Relationship, 10);
}

MemoryEntry SemanticMemory::store_user_preference(const std::string& preference,
                                                  double confidence,
                                                  const std::string& source) {
    MemoryInput input;
    input.content = "User preference: " + preference;
    input.importance = 0.7;
    input.tags = {"preference", "user"};
    input.source = source;

    SemanticDetails details;
    details.category = KnowledgeCategory::UserPreference;
    details.confidence = confidence;
    return store(input, details);
}

MemoryEntry SemanticMemory::store_user_fact(const std::string& fact, double confidence,
                                            const std::string& source) {
    MemoryInput input;
    input.content = "About user: " + fact;
    input.importance = 0.6;
    input.tags = {"fact", "user"};
    input.source = source;

    SemanticDetails details;
    details.category = KnowledgeCategory::UserFact;
    details.confidence = confidence;
    return store(input, details);
}

MemoryEntry SemanticMemory::store_learned_pattern(const std::string& pattern,
                                                  double confidence) {
    MemoryInput input;
    input.content = "Learned pattern: " + pattern;
    input.importance = 0.5;
    input.tags = {"pattern", "behavior"};
    input.source = "observation";

    SemanticDetails details;
    details.category = KnowledgeCategory::LearnedBehavior;
    details.confidence = confidence;
    return store(input, details);
}

bool SemanticMemory::update_confidence(const std::string& id, double confidence) {
    auto entry = get(id);
    if (!entry) return false;

    nlohmann::json meta = entry->metadata;
    meta["confidence"] = clamp01(confidence);
    if (confidence >= 0.95) meta["verified"] = true;
    return update_entry_metadata(id, meta);
}

std::vector<MemoryEntry> SemanticMemory::find_contradictions(const std::string& new_fact,
                                                             KnowledgeCategory category) {
    static const std::pair<const char*, const char*> kOpposites[] = {
        {"prefer", "dislike"}, {"like", "hate"}, {"always", "never"},
        {"love", "hate"}, {"yes", "no"}, {"true", "false"},
        {"morning", "evening"}, {"fast", "slow"},
    };

    auto new_tokens = tokenize(new_fact);
    std::set<std::string> new_words(new_tokens.begin(), new_tokens.end());

    std::vector<MemoryEntry> contradictions;
    for (auto& entry : recall(new_fact, 5, category)) {
        auto tokens = tokenize(entry.content);
        std::set<std::string> words(tokens.begin(), tokens.end());

        for (const auto& [a, b] : kOpposites) {
            if ((new_words.count(a) && words.count(b)) ||
                (new_words.count(b) && words.count(a))) {
                contradictions.push_back(std::move(entry));
                break;
            }
        }
    }
    return contradictions;
}

} // namespace engram
