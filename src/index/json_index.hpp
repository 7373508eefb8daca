#pragma once
#include "../similarity_index.hpp"
#include <mutex>
#include <string>
#include <vector>
#include <unordered_map>

namespace engram {

// Flat-file similarity index: one JSON array per collection, kept in memory
// and rewritten atomically after every mutation. Scored by token overlap.
class JsonIndex : public SimilarityIndex {
public:
    // dir is the directory holding <collection>.json
    JsonIndex(const std::string& dir, const std::string& collection);

    std::string backend_name() const override { return "json"; }
    const std::string& collection() const override { return collection_; }

    void add(const std::string& id, const std::string& text,
             const nlohmann::json& metadata) override;

    std::vector<IndexRecord> query(const std::string& text, uint32_t k,
                                   const WhereFilter& where) override;

    std::vector<IndexRecord> get(const std::vector<std::string>& ids) override;

    std::vector<IndexRecord> list(const WhereFilter& where, uint32_t limit) override;

    bool update(const std::string& id, const nlohmann::json& metadata) override;

    uint32_t remove(const std::vector<std::string>& ids) override;

    uint32_t count() override;

    const std::string& path() const { return path_; }

private:
    void load();
    void save();
    void rebuild_index();

    std::string path_;
    std::string collection_;
    std::vector<IndexRecord> records_;
    std::unordered_map<std::string, size_t> id_index_; // id -> records_ index
    mutable std::mutex mutex_;
};

} // namespace engram
