#include "json_index.hpp"
#include "record_json.hpp"
#include "../config.hpp"
#include "../errors.hpp"
#include "../plugin.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <fstream>
#include <iostream>

static engram::IndexRegistrar reg_json("json",
    [](const engram::Config& config, const std::string& collection) {
        return std::make_unique<engram::JsonIndex>(config.memory_path(), collection);
    });

namespace engram {

JsonIndex::JsonIndex(const std::string& dir, const std::string& collection)
    : collection_(collection) {
    if (collection_.empty()) {
        throw ValidationError("JsonIndex: collection name is required");
    }
    path_ = dir.empty() ? collection_ + ".json" : dir + "/" + collection_ + ".json";
    load();
}

void JsonIndex::load() {
    std::ifstream file(path_);
    if (!file.is_open()) return;

    try {
        nlohmann::json j = nlohmann::json::parse(file);
        if (!j.is_array()) return;

        records_.clear();
        records_.reserve(j.size());
        for (const auto& item : j) {
            auto record = record_from_json(item);
            if (!record.id.empty()) records_.push_back(std::move(record));
        }
        rebuild_index();
    } catch (const nlohmann::json::exception& e) {
        std::cerr << "[json_index] Warning: " << path_ << " is corrupt, starting empty: "
                  << e.what() << "\n";
        records_.clear();
        id_index_.clear();
    }
}

void JsonIndex::save() {
    nlohmann::json j = nlohmann::json::array();
    for (const auto& record : records_) {
        j.push_back(record_to_json(record));
    }
    std::string body;
    try {
        body = j.dump(2);
    } catch (const nlohmann::json::exception& e) {
        throw ValidationError(std::string("JsonIndex: record is not serializable: ") + e.what());
    }
    if (!atomic_write_file(path_, body)) {
        throw BackendUnavailableError("JsonIndex: failed to write " + path_);
    }
}

void JsonIndex::rebuild_index() {
    id_index_.clear();
    id_index_.reserve(records_.size());
    for (size_t i = 0; i < records_.size(); ++i) {
        id_index_[records_[i].id] = i;
    }
}

// Fraction of query tokens present in the record text, on word boundaries
// (so "test" does not match "attest").
static double score_record(const IndexRecord& record, const std::vector<std::string>& tokens) {
    if (tokens.empty()) return 0.0;
    auto text_tokens = tokenize(record.text);

    double score = 0.0;
    for (const auto& token : tokens) {
        if (std::find(text_tokens.begin(), text_tokens.end(), token) != text_tokens.end()) {
            score += 1.0;
        }
    }
    return score / static_cast<double>(tokens.size());
}

void JsonIndex::add(const std::string& id, const std::string& text,
                    const nlohmann::json& metadata) {
    if (id.empty()) throw ValidationError("JsonIndex: record id is required");

    std::lock_guard<std::mutex> lock(mutex_);

    if (id_index_.count(id)) {
        throw ValidationError("JsonIndex: duplicate id '" + id + "' in " + collection_);
    }

    IndexRecord record;
    record.id = id;
    record.text = text;
    record.metadata = metadata.is_object() ? metadata : nlohmann::json::object();
    id_index_[id] = records_.size();
    records_.push_back(std::move(record));

    try {
        save();
    } catch (const std::exception&) {
        records_.pop_back();
        id_index_.erase(id);
        throw;
    }
}

std::vector<IndexRecord> JsonIndex::query(const std::string& text, uint32_t k,
                                          const WhereFilter& where) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (k == 0) return {};

    // Skip single-character tokens, same as the FTS backend
    std::vector<std::string> tokens;
    for (auto& t : tokenize(text)) {
        if (t.size() >= 2) tokens.push_back(std::move(t));
    }

    std::vector<std::pair<double, size_t>> scored;
    for (size_t i = 0; i < records_.size(); i++) {
        if (!where_matches(records_[i].metadata, where)) continue;
        if (tokens.empty()) {
            // Nothing to rank by: newer records first
            scored.emplace_back(static_cast<double>(i) / static_cast<double>(records_.size()), i);
            continue;
        }
        double s = score_record(records_[i], tokens);
        if (s > 0.0) {
            scored.emplace_back(s, i);
        }
    }

    if (scored.empty() && !tokens.empty()) {
        // Substring fallback
        std::string needle = to_lower(text);
        for (size_t i = records_.size(); i-- > 0;) {
            if (!where_matches(records_[i].metadata, where)) continue;
            if (to_lower(records_[i].text).find(needle) != std::string::npos) {
                scored.emplace_back(0.0, i);
            }
        }
    }

    // partial_sort: only sort the top-K elements instead of the full vector
    size_t n = std::min(static_cast<size_t>(k), scored.size());
    std::partial_sort(scored.begin(), scored.begin() + static_cast<ptrdiff_t>(n), scored.end(),
                      [](const auto& a, const auto& b) {
                          if (a.first != b.first) return a.first > b.first;
                          return a.second > b.second;
                      });

    std::vector<IndexRecord> result;
    for (size_t i = 0; i < n; i++) {
        IndexRecord record = records_[scored[i].second];
        record.score = tokens.empty() ? 0.0 : scored[i].first;
        result.push_back(std::move(record));
    }
    return result;
}

std::vector<IndexRecord> JsonIndex::get(const std::vector<std::string>& ids) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<IndexRecord> result;
    for (const auto& id : ids) {
        auto it = id_index_.find(id);
        if (it != id_index_.end()) result.push_back(records_[it->second]);
    }
    return result;
}

std::vector<IndexRecord> JsonIndex::list(const WhereFilter& where, uint32_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<IndexRecord> result;
    for (const auto& record : records_) {
        if (!where_matches(record.metadata, where)) continue;
        result.push_back(record);
        if (limit > 0 && result.size() >= limit) break;
    }
    return result;
}

bool JsonIndex::update(const std::string& id, const nlohmann::json& metadata) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = id_index_.find(id);
    if (it == id_index_.end()) return false;

    auto& stored = records_[it->second].metadata;
    auto previous = stored;
    if (metadata.is_object()) {
        for (auto& [key, value] : metadata.items()) {
            stored[key] = value;
        }
    }

    try {
        save();
    } catch (const std::exception&) {
        stored = std::move(previous);
        throw;
    }
    return true;
}

uint32_t JsonIndex::remove(const std::vector<std::string>& ids) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto previous = records_;
    auto before = records_.size();
    records_.erase(std::remove_if(records_.begin(), records_.end(),
        [&ids](const IndexRecord& r) {
            return std::find(ids.begin(), ids.end(), r.id) != ids.end();
        }), records_.end());

    auto removed = static_cast<uint32_t>(before - records_.size());
    if (removed > 0) {
        rebuild_index();
        try {
            save();
        } catch (const std::exception&) {
            records_ = std::move(previous);
            rebuild_index();
            throw;
        }
    }
    return removed;
}

uint32_t JsonIndex::count() {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<uint32_t>(records_.size());
}

} // namespace engram
