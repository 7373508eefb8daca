#include "longterm_memory.hpp"
#include "../util.hpp"
#include <algorithm>
#include <ctime>

namespace engram {

nlohmann::json SessionFoundation::to_json() const {
    return {
        {"identity", identity},
        {"relationship", relationship},
        {"beliefs", beliefs},
        {"recent_lessons", recent_lessons},
        {"milestones", milestones}
    };
}

LongTermMemory::LongTermMemory(std::unique_ptr<SimilarityIndex> index)
    : TierStore(Tier::LongTerm, std::move(index)) {}

MemoryEntry LongTermMemory::store(const MemoryInput& input, const LongTermDetails& details) {
    auto entry = new_entry(input, 0.0);
    entry.importance = std::max(kLongTermImportanceFloor, entry.importance);
    entry.decay_rate = 0.0;
    entry.source = "consolidation";
    for (const auto& src : details.source_memories) add_unique(entry.related_ids, src);
    entry.metadata = {
        {"consolidation_type", consolidation_type_to_string(details.type)},
        {"consolidated_at", timestamp_now()},
        {"source_count", entry.related_ids.size()}
    };
    persist(entry);
    return entry;
}

std::vector<MemoryEntry> LongTermMemory::recall(const std::string& query, uint32_t n,
                                                std::optional<ConsolidationType> type) {
    auto where = tier_where();
    if (type) where["metadata.consolidation_type"] = consolidation_type_to_string(*type);

    auto entries = query_entries(query, n, where);
    touch_all(entries);
    return entries;
}

std::vector<MemoryEntry> LongTermMemory::get_by_type(ConsolidationType type, uint32_t limit) {
    auto where = tier_where();
    where["metadata.consolidation_type"] = consolidation_type_to_string(type);

    // Newest first; ids are time-ordered so they break same-second ties
    auto entries = list_entries(where);
    std::sort(entries.begin(), entries.end(), [](const MemoryEntry& a, const MemoryEntry& b) {
        if (a.created_at != b.created_at) return a.created_at > b.created_at;
        return a.id > b.id;
    });
    if (limit > 0 && entries.size() > limit) entries.resize(limit);
    return entries;
}

static std::vector<std::string> contents(const std::vector<MemoryEntry>& entries,
                                         size_t max = 0) {
    std::vector<std::string> out;
    for (const auto& e : entries) {
        if (max > 0 && out.size() >= max) break;
        out.push_back(e.content);
    }
    return out;
}

SessionFoundation LongTermMemory::get_session_foundation() {
    SessionFoundation f;
    f.identity = contents(get_core_identity());
    f.relationship = contents(get_relationship_essence());
    f.beliefs = contents(get_core_beliefs());
    f.recent_lessons = contents(get_lessons_learned(), 3);
    f.milestones = contents(get_milestones(), 3);
    return f;
}

MemoryEntry LongTermMemory::store_identity_marker(const std::string& content,
                                                  double importance) {
    MemoryInput input;
    input.content = content;
    input.importance = importance;
    input.tags = {"identity", "self"};
    return store(input, {ConsolidationType::IdentityMarker, {}});
}

MemoryEntry LongTermMemory::store_relationship_essence(const std::string& content,
                                                       Valence valence, double intensity) {
    MemoryInput input;
    input.content = content;
    input.importance = 0.95;
    input.valence = valence;
    input.intensity = intensity;
    input.tags = {"relationship"};
    return store(input, {ConsolidationType::RelationshipEssence, {}});
}

MemoryEntry LongTermMemory::store_core_belief(const std::string& content) {
    MemoryInput input;
    input.content = content;
    input.importance = 1.0;
    input.tags = {"belief", "value", "core"};
    return store(input, {ConsolidationType::CoreBelief, {}});
}

MemoryEntry LongTermMemory::store_lesson(const std::string& lesson,
                                         const std::vector<std::string>& source_memories,
                                         Valence valence) {
    MemoryInput input;
    input.content = "Lesson: " + lesson;
    input.importance = 0.85;
    input.valence = valence;
    input.tags = {"lesson", "wisdom"};
    return store(input, {ConsolidationType::LessonLearned, source_memories});
}

MemoryEntry LongTermMemory::store_milestone(const std::string& milestone, uint64_t date,
                                            Valence valence) {
    if (date == 0) date = epoch_seconds();
    auto t = static_cast<std::time_t>(date);
    std::tm tm{};
    localtime_r(&t, &tm);
    char day[16];
    std::strftime(day, sizeof(day), "%Y-%m-%d", &tm);

    MemoryInput input;
    input.content = std::string("Milestone (") + day + "): " + milestone;
    input.importance = 0.9;
    input.valence = valence;
    input.intensity = 0.7;
    input.tags = {"milestone", "achievement"};
    return store(input, {ConsolidationType::Milestone, {}});
}

bool LongTermMemory::refresh(const std::string& id) {
    auto entry = get(id);
    if (!entry) return false;

    nlohmann::json meta = entry->metadata;
    meta["consolidated_at"] = timestamp_now();
    meta["refresh_count"] = meta.value("refresh_count", 0) + 1;
    return update_entry_metadata(id, meta);
}

std::string LongTermMemory::build_identity_prompt() {
    auto f = get_session_foundation();
    std::vector<std::string> parts;

    auto section = [&parts](const char* heading, const std::vector<std::string>& items) {
        if (items.empty()) return;
        parts.push_back(parts.empty() ? heading : std::string("\n") + heading);
        for (const auto& item : items) parts.push_back("- " + item);
    };
    section("## Who I Am", f.identity);
    section("## Our Relationship", f.relationship);
    section("## What I Believe", f.beliefs);
    section("## What I've Learned", f.recent_lessons);

    std::string out;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i > 0) out += "\n";
        out += parts[i];
    }
    return out;
}

uint32_t LongTermMemory::purge(uint64_t, double) {
    return 0;
}

} // namespace engram
