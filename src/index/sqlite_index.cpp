#include "sqlite_index.hpp"
#include "../config.hpp"
#include "../errors.hpp"
#include "../plugin.hpp"
#include "../util.hpp"
#include <nlohmann/json.hpp>
#include <sqlite3.h>
#include <cctype>
#include <filesystem>
#include <iostream>

static engram::IndexRegistrar reg_sqlite("sqlite",
    [](const engram::Config& config, const std::string& collection) {
        return std::make_unique<engram::SqliteIndex>(config.memory_path(), collection);
    });

namespace engram {

// Preprocess a query for FTS5: split on non-alphanumeric, skip single-char
// tokens, quote each token (so AND/OR/NOT are literal) and OR-join them
// so that any matching token produces results.
static std::string build_fts_query(const std::string& query) {
    std::string result;
    std::string token;
    auto flush = [&]() {
        if (token.size() >= 2) {
            if (!result.empty()) result += " OR ";
            result += '"' + token + '"';
        }
        token.clear();
    };
    for (char c : query) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            token += c;
        } else {
            flush();
        }
    }
    flush();
    return result;
}

// RAII wrapper for sqlite3_stmt
struct StmtGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StmtGuard() { if (stmt) sqlite3_finalize(stmt); }
};

// A where filter compiled to SQL. Scalars become json_extract comparisons;
// anything else (arrays, objects) is checked after the fetch.
struct WhereSql {
    std::string clause;
    std::vector<std::pair<std::string, nlohmann::json>> params; // (json path, value)
    bool post_filter = false;
};

static WhereSql compile_where(const WhereFilter& where, const char* column) {
    WhereSql out;
    if (!where.is_object()) return out;
    for (auto& [path, value] : where.items()) {
        if (value.is_null()) {
            out.clause += std::string(" AND json_type(") + column + ", ?) = 'null'";
            out.params.emplace_back("$." + path, nlohmann::json());
        } else if (value.is_primitive()) {
            out.clause += std::string(" AND json_extract(") + column + ", ?) = ?";
            out.params.emplace_back("$." + path, value);
        } else {
            out.post_filter = true;
        }
    }
    return out;
}

static void bind_json_value(sqlite3_stmt* stmt, int col, const nlohmann::json& v) {
    if (v.is_string()) {
        sqlite3_bind_text(stmt, col, v.get_ref<const std::string&>().c_str(), -1,
                          SQLITE_TRANSIENT);
    } else if (v.is_boolean()) {
        sqlite3_bind_int(stmt, col, v.get<bool>() ? 1 : 0);
    } else if (v.is_number_integer()) {
        sqlite3_bind_int64(stmt, col, v.get<int64_t>());
    } else if (v.is_number_float()) {
        sqlite3_bind_double(stmt, col, v.get<double>());
    } else {
        sqlite3_bind_null(stmt, col);
    }
}

// Bind the where params starting at col; returns the next free column.
static int bind_where(sqlite3_stmt* stmt, int col, const WhereSql& w) {
    for (const auto& [path, value] : w.params) {
        sqlite3_bind_text(stmt, col++, path.c_str(), -1, SQLITE_TRANSIENT);
        if (!value.is_null()) bind_json_value(stmt, col++, value);
    }
    return col;
}

// Read a record from a statement selecting id, text, metadata (columns 0-2).
static IndexRecord record_from_stmt(sqlite3_stmt* stmt) {
    IndexRecord record;
    if (auto* v = sqlite3_column_text(stmt, 0)) record.id   = reinterpret_cast<const char*>(v);
    if (auto* v = sqlite3_column_text(stmt, 1)) record.text = reinterpret_cast<const char*>(v);
    if (auto* v = sqlite3_column_text(stmt, 2)) {
        auto parsed = nlohmann::json::parse(reinterpret_cast<const char*>(v), nullptr, false);
        if (parsed.is_object()) record.metadata = std::move(parsed);
    }
    return record;
}

static void prepare_or_throw(sqlite3* db, const std::string& sql, StmtGuard& g) {
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &g.stmt, nullptr) != SQLITE_OK) {
        throw BackendUnavailableError(std::string("SqliteIndex: ") + sqlite3_errmsg(db));
    }
}

SqliteIndex::SqliteIndex(const std::string& path, const std::string& collection)
    : path_(path), collection_(collection) {
    if (collection_.empty()) {
        throw ValidationError("SqliteIndex: collection name is required");
    }

    // Ensure parent directory exists
    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
    }

    if (sqlite3_open(path_.c_str(), &db_) != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : "unknown error";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw BackendUnavailableError("SqliteIndex: failed to open database: " + err);
    }

    // Tiers open one connection each against the same file
    sqlite3_busy_timeout(db_, 5000);
    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);
    // Allow FTS5 virtual table use inside triggers (required since SQLite 3.37)
    sqlite3_exec(db_, "PRAGMA trusted_schema=ON;", nullptr, nullptr, nullptr);

    init_schema();
}

SqliteIndex::~SqliteIndex() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void SqliteIndex::init_schema() {
    const char* statements[] = {
        "CREATE TABLE IF NOT EXISTS records ("
        "  collection TEXT NOT NULL,"
        "  id         TEXT NOT NULL,"
        "  text       TEXT NOT NULL,"
        "  metadata   TEXT NOT NULL DEFAULT '{}',"
        "  PRIMARY KEY (collection, id)"
        ");",

        "CREATE VIRTUAL TABLE IF NOT EXISTS records_fts "
        "USING fts5(text, content=records, content_rowid=rowid);",

        "CREATE TRIGGER IF NOT EXISTS records_ai AFTER INSERT ON records BEGIN"
        "  INSERT INTO records_fts(rowid, text) VALUES (new.rowid, new.text);"
        "END;",

        "CREATE TRIGGER IF NOT EXISTS records_ad AFTER DELETE ON records BEGIN"
        "  INSERT INTO records_fts(records_fts, rowid, text)"
        "  VALUES ('delete', old.rowid, old.text);"
        "END;",

        "CREATE TRIGGER IF NOT EXISTS records_au AFTER UPDATE OF text ON records BEGIN"
        "  INSERT INTO records_fts(records_fts, rowid, text)"
        "  VALUES ('delete', old.rowid, old.text);"
        "  INSERT INTO records_fts(rowid, text) VALUES (new.rowid, new.text);"
        "END;",
    };

    for (const char* sql : statements) {
        char* err = nullptr;
        if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
            std::string msg = err ? err : "unknown error";
            sqlite3_free(err);
            throw BackendUnavailableError("SqliteIndex: schema setup failed: " + msg);
        }
    }
}

// Serialized metadata. Invalid UTF-8 in a string value is a caller error.
static std::string dump_metadata(const nlohmann::json& metadata) {
    if (!metadata.is_object()) return "{}";
    try {
        return metadata.dump();
    } catch (const nlohmann::json::exception& e) {
        throw ValidationError(std::string("SqliteIndex: metadata is not serializable: ") +
                              e.what());
    }
}

void SqliteIndex::add(const std::string& id, const std::string& text,
                      const nlohmann::json& metadata) {
    if (id.empty()) throw ValidationError("SqliteIndex: record id is required");

    std::lock_guard<std::mutex> lock(mutex_);

    std::string meta = dump_metadata(metadata);

    StmtGuard g;
    prepare_or_throw(db_,
        "INSERT INTO records (collection, id, text, metadata) VALUES (?, ?, ?, ?);", g);
    sqlite3_bind_text(g.stmt, 1, collection_.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 2, id.c_str(),          -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 3, text.c_str(),        -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 4, meta.c_str(),        -1, SQLITE_STATIC);

    int rc = sqlite3_step(g.stmt);
    if (rc == SQLITE_CONSTRAINT) {
        throw ValidationError("SqliteIndex: duplicate id '" + id + "' in " + collection_);
    }
    if (rc != SQLITE_DONE) {
        throw BackendUnavailableError(std::string("SqliteIndex: insert failed: ") +
                                      sqlite3_errmsg(db_));
    }
}

std::vector<IndexRecord> SqliteIndex::query(const std::string& text, uint32_t k,
                                            const WhereFilter& where) {
    if (k == 0) return {};

    std::lock_guard<std::mutex> lock(mutex_);

    std::string fts_query = build_fts_query(text);
    if (fts_query.empty()) {
        // Nothing to rank by: most recent records win
        auto all = list_locked(where, 0);
        std::vector<IndexRecord> results;
        for (auto it = all.rbegin(); it != all.rend() && results.size() < k; ++it) {
            results.push_back(std::move(*it));
        }
        return results;
    }

    WhereSql w = compile_where(where, "r.metadata");
    std::vector<IndexRecord> results;
    {
        std::string sql =
            "SELECT r.id, r.text, r.metadata, bm25(records_fts) AS score"
            " FROM records_fts"
            " JOIN records AS r ON records_fts.rowid = r.rowid"
            " WHERE records_fts MATCH ? AND r.collection = ?" + w.clause +
            " ORDER BY bm25(records_fts)";
        if (!w.post_filter) sql += " LIMIT ?";
        sql += ";";

        StmtGuard g;
        prepare_or_throw(db_, sql, g);
        sqlite3_bind_text(g.stmt, 1, fts_query.c_str(), -1, SQLITE_TRANSIENT);
        sqlite3_bind_text(g.stmt, 2, collection_.c_str(), -1, SQLITE_STATIC);
        int col = bind_where(g.stmt, 3, w);
        if (!w.post_filter) sqlite3_bind_int(g.stmt, col, static_cast<int>(k));

        while (sqlite3_step(g.stmt) == SQLITE_ROW) {
            auto record = record_from_stmt(g.stmt);
            if (w.post_filter && !where_matches(record.metadata, where)) continue;
            // bm25 is negative: smaller is better
            record.score = -sqlite3_column_double(g.stmt, 3);
            results.push_back(std::move(record));
            if (results.size() >= k) break;
        }
    }

    if (results.empty()) {
        std::string like_pat = "%" + text + "%";
        std::string sql =
            "SELECT r.id, r.text, r.metadata FROM records AS r"
            " WHERE r.collection = ? AND r.text LIKE ?" + w.clause +
            " ORDER BY r.rowid DESC;";

        StmtGuard g;
        prepare_or_throw(db_, sql, g);
        sqlite3_bind_text(g.stmt, 1, collection_.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_text(g.stmt, 2, like_pat.c_str(), -1, SQLITE_TRANSIENT);
        bind_where(g.stmt, 3, w);

        while (sqlite3_step(g.stmt) == SQLITE_ROW) {
            auto record = record_from_stmt(g.stmt);
            if (w.post_filter && !where_matches(record.metadata, where)) continue;
            results.push_back(std::move(record));
            if (results.size() >= k) break;
        }
    }

    return results;
}

std::vector<IndexRecord> SqliteIndex::get(const std::vector<std::string>& ids) {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    prepare_or_throw(db_,
        "SELECT id, text, metadata FROM records WHERE collection = ? AND id = ?;", g);

    std::vector<IndexRecord> results;
    for (const auto& id : ids) {
        sqlite3_reset(g.stmt);
        sqlite3_bind_text(g.stmt, 1, collection_.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_text(g.stmt, 2, id.c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(g.stmt) == SQLITE_ROW) {
            results.push_back(record_from_stmt(g.stmt));
        }
    }
    return results;
}

std::vector<IndexRecord> SqliteIndex::list(const WhereFilter& where, uint32_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);
    return list_locked(where, limit);
}

std::vector<IndexRecord> SqliteIndex::list_locked(const WhereFilter& where, uint32_t limit) {
    WhereSql w = compile_where(where, "metadata");
    std::string sql =
        "SELECT id, text, metadata FROM records WHERE collection = ?" + w.clause +
        " ORDER BY rowid";
    bool sql_limit = limit > 0 && !w.post_filter;
    if (sql_limit) sql += " LIMIT ?";
    sql += ";";

    StmtGuard g;
    prepare_or_throw(db_, sql, g);
    sqlite3_bind_text(g.stmt, 1, collection_.c_str(), -1, SQLITE_STATIC);
    int col = bind_where(g.stmt, 2, w);
    if (sql_limit) sqlite3_bind_int(g.stmt, col, static_cast<int>(limit));

    std::vector<IndexRecord> results;
    while (sqlite3_step(g.stmt) == SQLITE_ROW) {
        auto record = record_from_stmt(g.stmt);
        if (w.post_filter && !where_matches(record.metadata, where)) continue;
        results.push_back(std::move(record));
        if (limit > 0 && results.size() >= limit) break;
    }
    return results;
}

bool SqliteIndex::update(const std::string& id, const nlohmann::json& metadata) {
    std::lock_guard<std::mutex> lock(mutex_);

    nlohmann::json current;
    {
        StmtGuard g;
        prepare_or_throw(db_,
            "SELECT metadata FROM records WHERE collection = ? AND id = ?;", g);
        sqlite3_bind_text(g.stmt, 1, collection_.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_text(g.stmt, 2, id.c_str(), -1, SQLITE_STATIC);
        if (sqlite3_step(g.stmt) != SQLITE_ROW) return false;
        if (auto* v = sqlite3_column_text(g.stmt, 0)) {
            current = nlohmann::json::parse(reinterpret_cast<const char*>(v), nullptr, false);
        }
    }
    if (!current.is_object()) current = nlohmann::json::object();
    if (metadata.is_object()) {
        for (auto& [key, value] : metadata.items()) {
            current[key] = value;
        }
    }

    std::string meta = dump_metadata(current);
    StmtGuard g;
    prepare_or_throw(db_,
        "UPDATE records SET metadata = ? WHERE collection = ? AND id = ?;", g);
    sqlite3_bind_text(g.stmt, 1, meta.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 2, collection_.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 3, id.c_str(), -1, SQLITE_STATIC);
    if (sqlite3_step(g.stmt) != SQLITE_DONE) {
        throw BackendUnavailableError(std::string("SqliteIndex: update failed: ") +
                                      sqlite3_errmsg(db_));
    }
    return sqlite3_changes(db_) > 0;
}

uint32_t SqliteIndex::remove(const std::vector<std::string>& ids) {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    prepare_or_throw(db_, "DELETE FROM records WHERE collection = ? AND id = ?;", g);

    uint32_t removed = 0;
    for (const auto& id : ids) {
        sqlite3_reset(g.stmt);
        sqlite3_bind_text(g.stmt, 1, collection_.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_text(g.stmt, 2, id.c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(g.stmt) != SQLITE_DONE) {
            std::cerr << "[sqlite_index] Warning: delete of " << id << " failed: "
                      << sqlite3_errmsg(db_) << "\n";
            continue;
        }
        removed += static_cast<uint32_t>(sqlite3_changes(db_));
    }
    return removed;
}

uint32_t SqliteIndex::count() {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    prepare_or_throw(db_, "SELECT COUNT(*) FROM records WHERE collection = ?;", g);
    sqlite3_bind_text(g.stmt, 1, collection_.c_str(), -1, SQLITE_STATIC);
    if (sqlite3_step(g.stmt) == SQLITE_ROW) {
        return static_cast<uint32_t>(sqlite3_column_int(g.stmt, 0));
    }
    return 0;
}

} // namespace engram
