#include "episodic_memory.hpp"
#include "../util.hpp"
#include <algorithm>
#include <ctime>
#include <iostream>
#include <unordered_set>

namespace engram {

static constexpr uint64_t kDaySeconds = 86400;

std::string time_filter_to_string(TimeFilter f) {
    switch (f) {
        case TimeFilter::Today: return "today";
        case TimeFilter::Week:  return "week";
        case TimeFilter::Month: return "month";
        case TimeFilter::All:   return "all";
    }
    return "all";
}

TimeFilter time_filter_from_string(const std::string& s) {
    if (s == "today") return TimeFilter::Today;
    if (s == "week")  return TimeFilter::Week;
    if (s == "month") return TimeFilter::Month;
    return TimeFilter::All;
}

static uint64_t time_filter_cutoff(TimeFilter f, uint64_t now) {
    uint64_t span = 0;
    switch (f) {
        case TimeFilter::Today: span = kDaySeconds; break;
        case TimeFilter::Week:  span = 7 * kDaySeconds; break;
        case TimeFilter::Month: span = 30 * kDaySeconds; break;
        case TimeFilter::All:   return 0;
    }
    return now > span ? now - span : 0;
}

EpisodicMemory::EpisodicMemory(std::unique_ptr<SimilarityIndex> index)
    : TierStore(Tier::Episodic, std::move(index)) {}

MemoryEntry EpisodicMemory::store(const MemoryInput& input, const EpisodicDetails& details) {
    auto entry = new_entry(input, kEpisodicDecayRate);
    for (const auto& rel : details.related_episodes) add_unique(entry.related_ids, rel);
    if (details.context.is_object()) entry.metadata = details.context;
    persist(entry);
    return entry;
}

std::vector<MemoryEntry> EpisodicMemory::recall(const std::string& query, uint32_t n,
                                                TimeFilter time_filter,
                                                double min_importance) {
    if (n == 0) return {};

    auto entries = query_entries(query, n * 2, tier_where());

    uint64_t now = epoch_seconds();
    uint64_t cutoff = time_filter_cutoff(time_filter, now);

    std::vector<MemoryEntry> filtered;
    for (auto& entry : entries) {
        if (entry.created_at < cutoff) continue;
        if (min_importance > 0.0 && entry.effective_importance(now) < min_importance) continue;
        filtered.push_back(std::move(entry));
        if (filtered.size() >= n) break;
    }

    touch_all(filtered);
    return filtered;
}

std::vector<MemoryEntry> EpisodicMemory::recall_by_time(uint64_t start, uint64_t end,
                                                        uint32_t n) {
    if (end == 0) end = epoch_seconds();

    std::vector<MemoryEntry> entries;
    for (auto& entry : list_entries(tier_where())) {
        if (entry.created_at >= start && entry.created_at <= end) {
            entries.push_back(std::move(entry));
        }
    }

    // Ids are time-ordered, so they break same-second ties
    std::sort(entries.begin(), entries.end(), [](const MemoryEntry& a, const MemoryEntry& b) {
        if (a.created_at != b.created_at) return a.created_at > b.created_at;
        return a.id > b.id;
    });
    if (entries.size() > n) entries.resize(n);
    return entries;
}

std::vector<MemoryEntry> EpisodicMemory::recall_emotional(Valence valence, double min_intensity,
                                                          uint32_t n) {
    auto where = tier_where();
    where["valence"] = valence_to_string(valence);

    std::vector<MemoryEntry> entries;
    for (auto& entry : list_entries(where)) {
        if (entry.intensity >= min_intensity) entries.push_back(std::move(entry));
    }

    std::stable_sort(entries.begin(), entries.end(),
                     [](const MemoryEntry& a, const MemoryEntry& b) {
                         return a.intensity > b.intensity;
                     });
    if (entries.size() > n) entries.resize(n);
    return entries;
}

std::vector<MemoryEntry> EpisodicMemory::get_recent(uint32_t n) {
    uint64_t now = epoch_seconds();
    uint64_t start = now > 30 * kDaySeconds ? now - 30 * kDaySeconds : 0;
    return recall_by_time(start, now, n);
}

std::vector<MemoryEntry> EpisodicMemory::get_narrative_thread(const std::string& id,
                                                              uint32_t depth) {
    std::vector<MemoryEntry> thread;
    std::unordered_set<std::string> visited;

    // Breadth-first over related_ids with an explicit frontier; every id is
    // fetched at most once so cycles terminate.
    std::vector<std::string> frontier = {id};
    for (uint32_t level = 0; level < depth && !frontier.empty(); level++) {
        std::vector<std::string> next;
        for (const auto& current : frontier) {
            if (!visited.insert(current).second) continue;

            std::optional<MemoryEntry> entry;
            try {
                entry = get(current);
            } catch (const std::exception& e) {
                std::cerr << "[episodic] Warning: narrative lookup of " << current
                          << " failed: " << e.what() << "\n";
                continue;
            }
            if (!entry) continue;

            for (const auto& rel : entry->related_ids) {
                if (!visited.count(rel)) next.push_back(rel);
            }
            thread.push_back(std::move(*entry));
        }
        frontier = std::move(next);
    }

    std::sort(thread.begin(), thread.end(), [](const MemoryEntry& a, const MemoryEntry& b) {
        if (a.created_at != b.created_at) return a.created_at < b.created_at;
        return a.id < b.id;
    });
    return thread;
}

static std::string local_time_string(const char* fmt) {
    std::time_t t = std::time(nullptr);
    std::tm tm{};
    localtime_r(&t, &tm);
    char buf[32];
    std::strftime(buf, sizeof(buf), fmt, &tm);
    return buf;
}

MemoryEntry EpisodicMemory::store_conversation_episode(const std::string& summary,
                                                       const std::vector<std::string>& topics,
                                                       Valence valence, double intensity,
                                                       const std::vector<std::string>& key_moments,
                                                       double duration_minutes) {
    if (duration_minutes < 0.0) duration_minutes = 0.0;

    EpisodicDetails details;
    details.context = {
        {"type", "conversation"},
        {"topics", topics},
        {"duration_minutes", duration_minutes},
        {"key_moments", key_moments},
        {"time_of_day", local_time_string("%H:%M")},
        {"day_of_week", local_time_string("%A")}
    };

    MemoryInput input;
    input.content = summary;
    input.importance = std::min(1.0, 0.4 + clamp01(intensity) * 0.3 +
                                         std::min(1.0, duration_minutes / 60.0) * 0.3);
    input.valence = valence;
    input.intensity = intensity;
    input.tags = topics;
    input.source = "conversation";

    return store(input, details);
}

} // namespace engram
