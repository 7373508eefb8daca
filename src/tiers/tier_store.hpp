#pragma once
#include "../memory.hpp"
#include "../similarity_index.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace engram {

// Fields every tier accepts on store().
struct MemoryInput {
    std::string content;
    double importance = 0.5;
    Valence valence = Valence::Neutral;
    double intensity = 0.0;
    std::vector<std::string> tags;
    std::string source = "conversation";
};

// Durable tier over one similarity-indexed collection. Entries are only
// mutated through access tracking and tier-specific metadata updates.
class TierStore {
public:
    TierStore(Tier tier, std::unique_ptr<SimilarityIndex> index);
    virtual ~TierStore() = default;

    TierStore(const TierStore&) = delete;
    TierStore& operator=(const TierStore&) = delete;

    Tier tier() const { return tier_; }
    SimilarityIndex& index() { return *index_; }

    std::optional<MemoryEntry> get(const std::string& id);
    bool remove(const std::string& id);
    uint32_t count();

    // Bump access_count and last_accessed_at. Failures are logged, never thrown.
    void touch(const std::string& id);

    // Entries whose effective importance is at least min_importance, best first.
    std::vector<MemoryEntry> get_by_importance(double min_importance, uint32_t limit);

    // Hard-delete entries older than max_age_seconds whose effective importance
    // is below keep_importance. Returns number deleted.
    virtual uint32_t purge(uint64_t max_age_seconds, double keep_importance = 0.3);

    // JSON array of every entry in the collection.
    nlohmann::json snapshot();

    // snapshot() serialized / import skipping existing ids.
    std::string export_json();
    uint32_t import_json(const std::string& json_str);

protected:
    // Fresh entry with id, timestamps, clamped importance and intensity.
    MemoryEntry new_entry(const MemoryInput& input, double decay_rate) const;

    void persist(const MemoryEntry& entry);

    std::vector<MemoryEntry> query_entries(const std::string& query, uint32_t k,
                                           const WhereFilter& where);
    std::vector<MemoryEntry> list_entries(const WhereFilter& where, uint32_t limit = 0);

    // Replace the entry's metadata object (keeps other fields).
    bool update_entry_metadata(const std::string& id, const nlohmann::json& metadata);

    void touch_all(const std::vector<MemoryEntry>& entries);

    // {"tier": "<this tier>"}
    nlohmann::json tier_where() const;

    Tier tier_;
    std::unique_ptr<SimilarityIndex> index_;
};

} // namespace engram
