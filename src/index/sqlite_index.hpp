#pragma once
#include "../similarity_index.hpp"
#include <mutex>
#include <string>

struct sqlite3; // forward declare

namespace engram {

// SQLite-backed similarity index. Several collections share one database
// file; each instance owns its own connection scoped to one collection.
class SqliteIndex : public SimilarityIndex {
public:
    SqliteIndex(const std::string& path, const std::string& collection);
    ~SqliteIndex() override;

    // Non-copyable
    SqliteIndex(const SqliteIndex&) = delete;
    SqliteIndex& operator=(const SqliteIndex&) = delete;

    std::string backend_name() const override { return "sqlite"; }
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

private:
    void init_schema();
    std::vector<IndexRecord> list_locked(const WhereFilter& where, uint32_t limit);

    sqlite3* db_ = nullptr;
    std::string path_;
    std::string collection_;
    mutable std::mutex mutex_;
};

} // namespace engram
