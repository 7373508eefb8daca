#pragma once
#include "tier_store.hpp"

namespace engram {

struct EpisodicDetails {
    nlohmann::json context = nlohmann::json::object();  // stored as entry metadata
    std::vector<std::string> related_episodes;
};

enum class TimeFilter { Today, Week, Month, All };

std::string time_filter_to_string(TimeFilter f);
TimeFilter time_filter_from_string(const std::string& s);

// Time-stamped experiences with emotional colouring and narrative links.
class EpisodicMemory : public TierStore {
public:
    explicit EpisodicMemory(std::unique_ptr<SimilarityIndex> index);

    MemoryEntry store(const MemoryInput& input, const EpisodicDetails& details = {});

    // Relevance-ranked, then filtered by creation window and effective importance.
    std::vector<MemoryEntry> recall(const std::string& query, uint32_t n = 5,
                                    TimeFilter time_filter = TimeFilter::All,
                                    double min_importance = 0.0);

    // Episodes created in [start, end], newest first. end 0 = now.
    std::vector<MemoryEntry> recall_by_time(uint64_t start, uint64_t end = 0,
                                            uint32_t n = 10);

    // Episodes of one valence at or above min_intensity, most intense first.
    std::vector<MemoryEntry> recall_emotional(Valence valence, double min_intensity = 0.3,
                                              uint32_t n = 5);

    // Newest episodes from the last 30 days.
    std::vector<MemoryEntry> get_recent(uint32_t n = 5);

    // Follow related_ids from id, at most depth levels, oldest first.
    // Missing links are skipped.
    std::vector<MemoryEntry> get_narrative_thread(const std::string& id, uint32_t depth = 3);

    // One episode summarising a whole conversation.
    MemoryEntry store_conversation_episode(const std::string& summary,
                                           const std::vector<std::string>& topics,
                                           Valence valence, double intensity,
                                           const std::vector<std::string>& key_moments = {},
                                           double duration_minutes = 0.0);
};

} // namespace engram
