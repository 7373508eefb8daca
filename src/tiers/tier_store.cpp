#include "tier_store.hpp"
#include "../errors.hpp"
#include "../util.hpp"
#include <algorithm>
#include <iostream>

namespace engram {

TierStore::TierStore(Tier tier, std::unique_ptr<SimilarityIndex> index)
    : tier_(tier), index_(std::move(index)) {
    if (!index_) {
        throw BackendUnavailableError("No similarity index for " + tier_to_string(tier_) +
                                      " memory");
    }
}

nlohmann::json TierStore::tier_where() const {
    return {{"tier", tier_to_string(tier_)}};
}

MemoryEntry TierStore::new_entry(const MemoryInput& input, double decay_rate) const {
    if (trim(input.content).empty()) {
        throw ValidationError("Memory content must not be empty");
    }

    MemoryEntry entry;
    entry.id = generate_time_id(tier_id_prefix(tier_));
    entry.content = input.content;
    entry.tier = tier_;
    entry.created_at = epoch_seconds();
    entry.importance = clamp01(input.importance);
    entry.valence = input.valence;
    entry.intensity = clamp01(input.intensity);
    for (const auto& tag : input.tags) add_unique(entry.tags, tag);
    entry.source = input.source.empty() ? "conversation" : input.source;
    entry.decay_rate = clamp01(decay_rate);
    return entry;
}

void TierStore::persist(const MemoryEntry& entry) {
    index_->add(entry.id, entry.content, entry_index_metadata(entry));
}

std::optional<MemoryEntry> TierStore::get(const std::string& id) {
    auto records = index_->get({id});
    if (records.empty()) return std::nullopt;
    return entry_from_record(records.front());
}

bool TierStore::remove(const std::string& id) {
    return index_->remove({id}) > 0;
}

uint32_t TierStore::count() {
    return index_->count();
}

void TierStore::touch(const std::string& id) {
    try {
        auto records = index_->get({id});
        if (records.empty()) return;
        uint32_t access_count = records.front().metadata.value("access_count", uint32_t{0});
        index_->update(id, {
            {"access_count", access_count + 1},
            {"last_accessed_at", epoch_seconds()}
        });
    } catch (const std::exception& e) {
        std::cerr << "[" << tier_to_string(tier_) << "] Warning: access update for "
                  << id << " failed: " << e.what() << "\n";
    }
}

void TierStore::touch_all(const std::vector<MemoryEntry>& entries) {
    for (const auto& entry : entries) {
        touch(entry.id);
    }
}

bool TierStore::update_entry_metadata(const std::string& id, const nlohmann::json& metadata) {
    return index_->update(id, {{"metadata", metadata}});
}

std::vector<MemoryEntry> TierStore::query_entries(const std::string& query, uint32_t k,
                                                  const WhereFilter& where) {
    std::vector<MemoryEntry> entries;
    for (const auto& record : index_->query(query, k, where)) {
        entries.push_back(entry_from_record(record));
    }
    return entries;
}

std::vector<MemoryEntry> TierStore::list_entries(const WhereFilter& where, uint32_t limit) {
    std::vector<MemoryEntry> entries;
    for (const auto& record : index_->list(where, limit)) {
        entries.push_back(entry_from_record(record));
    }
    return entries;
}

std::vector<MemoryEntry> TierStore::get_by_importance(double min_importance, uint32_t limit) {
    uint64_t now = epoch_seconds();

    std::vector<std::pair<double, MemoryEntry>> scored;
    for (auto& entry : list_entries(tier_where())) {
        double eff = entry.effective_importance(now);
        if (eff >= min_importance) scored.emplace_back(eff, std::move(entry));
    }

    // Ties go to the newer entry
    std::stable_sort(scored.begin(), scored.end(), [](const auto& a, const auto& b) {
        if (a.first != b.first) return a.first > b.first;
        return a.second.created_at > b.second.created_at;
    });

    std::vector<MemoryEntry> result;
    for (auto& [_, entry] : scored) {
        if (limit > 0 && result.size() >= limit) break;
        result.push_back(std::move(entry));
    }
    return result;
}

uint32_t TierStore::purge(uint64_t max_age_seconds, double keep_importance) {
    uint64_t now = epoch_seconds();
    uint64_t cutoff = now > max_age_seconds ? now - max_age_seconds : 0;

    std::vector<std::string> doomed;
    for (const auto& entry : list_entries(tier_where())) {
        if (entry.created_at < cutoff && entry.effective_importance(now) < keep_importance) {
            doomed.push_back(entry.id);
        }
    }
    if (doomed.empty()) return 0;
    return index_->remove(doomed);
}

nlohmann::json TierStore::snapshot() {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& entry : list_entries(nlohmann::json::object())) {
        j.push_back(entry_to_json(entry));
    }
    return j;
}

std::string TierStore::export_json() {
    return snapshot().dump(2);
}

uint32_t TierStore::import_json(const std::string& json_str) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_str);
    } catch (const nlohmann::json::exception& e) {
        throw ValidationError(std::string("Snapshot is not valid JSON: ") + e.what());
    }
    if (!j.is_array()) throw ValidationError("Snapshot must be a JSON array");

    uint32_t imported = 0;
    for (const auto& item : j) {
        if (!item.is_object()) continue;
        auto entry = entry_from_json(item);
        if (entry.id.empty() || entry.tier != tier_) continue;
        if (!index_->get({entry.id}).empty()) continue;
        persist(entry);
        imported++;
    }
    return imported;
}

} // namespace engram
