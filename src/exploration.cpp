#include "exploration.hpp"
#include "errors.hpp"
#include "util.hpp"
#include <sqlite3.h>
#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <iostream>

namespace engram {

// ── Enum / JSON helpers ──────────────────────────────────────────

std::string thread_status_to_string(ThreadStatus s) {
    switch (s) {
        case ThreadStatus::Active:    return "active";
        case ThreadStatus::Dormant:   return "dormant";
        case ThreadStatus::Concluded: return "concluded";
    }
    return "active";
}

ThreadStatus thread_status_from_string(const std::string& s) {
    if (s == "dormant")   return ThreadStatus::Dormant;
    if (s == "concluded") return ThreadStatus::Concluded;
    if (s == "active")    return ThreadStatus::Active;
    throw ValidationError("Unknown thread status: " + s);
}

LookupPolicy lookup_policy_from_string(const std::string& s) {
    if (s == "start_new") return LookupPolicy::StartNewOnMiss;
    return LookupPolicy::Strict;
}

static nlohmann::json opt_json(const std::optional<std::string>& v) {
    return v ? nlohmann::json(*v) : nlohmann::json(nullptr);
}

nlohmann::json ExplorationThread::to_json() const {
    return {
        {"id", id},
        {"name", name},
        {"question", question},
        {"created_at", created_at},
        {"updated_at", updated_at},
        {"status", thread_status_to_string(status)},
        {"depth", depth},
        {"root_introspection_id", root_introspection_id},
        {"current_introspection_id", current_introspection_id},
        {"branched_from_thread_id", opt_json(branched_from_thread_id)},
        {"branched_from_link_id", opt_json(branched_from_link_id)},
        {"conclusion", opt_json(conclusion)},
        {"tags", tags}
    };
}

nlohmann::json ThreadLink::to_json() const {
    return {
        {"id", id},
        {"thread_id", thread_id},
        {"introspection_id", introspection_id},
        {"parent_link_id", opt_json(parent_link_id)},
        {"depth", depth},
        {"question", question},
        {"insight_summary", opt_json(insight_summary)},
        {"created_at", created_at},
        {"leads_to_branches", leads_to_branches}
    };
}

nlohmann::json ThreadContext::to_json() const {
    nlohmann::json links = nlohmann::json::array();
    for (const auto& l : recent_links) links.push_back(l.to_json());
    return {
        {"thread", thread.to_json()},
        {"chain_length", chain_length},
        {"recent_links", links},
        {"questions_explored", questions_explored},
        {"introspections", introspections},
        {"narrative", narrative}
    };
}

nlohmann::json ExplorationStats::to_json() const {
    return {
        {"total_threads", total_threads},
        {"active_threads", active_threads},
        {"dormant_threads", dormant_threads},
        {"concluded_threads", concluded_threads},
        {"total_links", total_links},
        {"average_depth", average_depth},
        {"branched_threads", branched_threads}
    };
}

std::string thread_name_from_question(const std::string& question) {
    std::string cleaned;
    for (char c : question) {
        auto uc = static_cast<unsigned char>(c);
        if (std::isalnum(uc)) {
            cleaned += static_cast<char>(std::tolower(uc));
        } else if (std::isspace(uc)) {
            cleaned += ' ';
        }
    }

    std::string name;
    int words = 0;
    for (const auto& word : split(cleaned, ' ')) {
        if (word.empty()) continue;
        if (words == 5) break;
        if (!name.empty()) name += '-';
        name += word;
        words++;
    }
    if (name.empty()) name = "exploration";
    name = truncate(name, 40);
    while (!name.empty() && name.back() == '-') name.pop_back();
    return name;
}

// ── SQLite plumbing ──────────────────────────────────────────────

namespace {

// RAII wrapper for sqlite3_stmt
struct StmtGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StmtGuard() { if (stmt) sqlite3_finalize(stmt); }
};

// BEGIN IMMEDIATE ... COMMIT; rolls back unless commit() was reached.
class Transaction {
public:
    explicit Transaction(sqlite3* db) : db_(db) {
        if (sqlite3_exec(db_, "BEGIN IMMEDIATE;", nullptr, nullptr, nullptr) != SQLITE_OK) {
            throw BackendUnavailableError(std::string("ExplorationTracker: cannot begin: ") +
                                          sqlite3_errmsg(db_));
        }
    }
    ~Transaction() {
        if (!done_) sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
    }
    void commit() {
        if (sqlite3_exec(db_, "COMMIT;", nullptr, nullptr, nullptr) != SQLITE_OK) {
            throw BackendUnavailableError(std::string("ExplorationTracker: commit failed: ") +
                                          sqlite3_errmsg(db_));
        }
        done_ = true;
    }

private:
    sqlite3* db_;
    bool done_ = false;
};

void prepare(sqlite3* db, const char* sql, StmtGuard& g) {
    if (sqlite3_prepare_v2(db, sql, -1, &g.stmt, nullptr) != SQLITE_OK) {
        throw BackendUnavailableError(std::string("ExplorationTracker: ") + sqlite3_errmsg(db));
    }
}

void bind_opt(sqlite3_stmt* stmt, int col, const std::optional<std::string>& v) {
    if (v) {
        sqlite3_bind_text(stmt, col, v->c_str(), -1, SQLITE_TRANSIENT);
    } else {
        sqlite3_bind_null(stmt, col);
    }
}

std::string col_text(sqlite3_stmt* stmt, int col) {
    auto* v = sqlite3_column_text(stmt, col);
    return v ? reinterpret_cast<const char*>(v) : "";
}

std::optional<std::string> col_opt(sqlite3_stmt* stmt, int col) {
    if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
    return col_text(stmt, col);
}

std::vector<std::string> col_string_list(sqlite3_stmt* stmt, int col) {
    std::vector<std::string> out;
    auto j = nlohmann::json::parse(col_text(stmt, col), nullptr, false);
    if (j.is_array()) {
        for (const auto& v : j) {
            if (v.is_string()) out.push_back(v.get<std::string>());
        }
    }
    return out;
}

void step_done(sqlite3* db, sqlite3_stmt* stmt, const char* what) {
    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_DONE) return;
    if (rc == SQLITE_CONSTRAINT) {
        throw ConcurrentModificationError(std::string("ExplorationTracker: ") + what +
                                          ": " + sqlite3_errmsg(db));
    }
    throw BackendUnavailableError(std::string("ExplorationTracker: ") + what + ": " +
                                  sqlite3_errmsg(db));
}

constexpr const char* kThreadColumns =
    "id, name, question, created_at, updated_at, status, depth, root_introspection_id,"
    " current_introspection_id, branched_from_thread_id, branched_from_link_id,"
    " conclusion, tags";

constexpr const char* kLinkColumns =
    "id, thread_id, introspection_id, parent_link_id, depth, question, insight_summary,"
    " created_at, leads_to_branches";

ExplorationThread thread_from_stmt(sqlite3_stmt* stmt) {
    ExplorationThread t;
    t.id = col_text(stmt, 0);
    t.name = col_text(stmt, 1);
    t.question = col_text(stmt, 2);
    t.created_at = static_cast<uint64_t>(sqlite3_column_int64(stmt, 3));
    t.updated_at = static_cast<uint64_t>(sqlite3_column_int64(stmt, 4));
    t.status = thread_status_from_string(col_text(stmt, 5));
    t.depth = static_cast<uint32_t>(sqlite3_column_int(stmt, 6));
    t.root_introspection_id = col_text(stmt, 7);
    t.current_introspection_id = col_text(stmt, 8);
    t.branched_from_thread_id = col_opt(stmt, 9);
    t.branched_from_link_id = col_opt(stmt, 10);
    t.conclusion = col_opt(stmt, 11);
    t.tags = col_string_list(stmt, 12);
    return t;
}

ThreadLink link_from_stmt(sqlite3_stmt* stmt) {
    ThreadLink l;
    l.id = col_text(stmt, 0);
    l.thread_id = col_text(stmt, 1);
    l.introspection_id = col_text(stmt, 2);
    l.parent_link_id = col_opt(stmt, 3);
    l.depth = static_cast<uint32_t>(sqlite3_column_int(stmt, 4));
    l.question = col_text(stmt, 5);
    l.insight_summary = col_opt(stmt, 6);
    l.created_at = static_cast<uint64_t>(sqlite3_column_int64(stmt, 7));
    l.leads_to_branches = col_string_list(stmt, 8);
    return l;
}

std::vector<ExplorationThread> collect_threads(sqlite3_stmt* stmt) {
    std::vector<ExplorationThread> out;
    while (sqlite3_step(stmt) == SQLITE_ROW) {
        out.push_back(thread_from_stmt(stmt));
    }
    return out;
}

std::string escape_like(const std::string& s) {
    std::string out;
    for (char c : s) {
        if (c == '%' || c == '_' || c == '\\') out += '\\';
        out += c;
    }
    return out;
}

} // namespace

// ── Lifecycle ────────────────────────────────────────────────────

ExplorationTracker::ExplorationTracker(const std::string& db_path,
                                       IntrospectionJournal* journal,
                                       LookupPolicy policy)
    : path_(db_path), journal_(journal), policy_(policy) {
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
        throw BackendUnavailableError("ExplorationTracker: failed to open database: " + err);
    }

    sqlite3_busy_timeout(db_, 5000);
    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA foreign_keys=ON;", nullptr, nullptr, nullptr);

    init_schema();
}

ExplorationTracker::~ExplorationTracker() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void ExplorationTracker::exec(const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw BackendUnavailableError("ExplorationTracker: " + msg);
    }
}

void ExplorationTracker::init_schema() {
    exec("CREATE TABLE IF NOT EXISTS threads ("
         "  id                       TEXT PRIMARY KEY,"
         "  name                     TEXT NOT NULL,"
         "  question                 TEXT NOT NULL,"
         "  created_at               INTEGER NOT NULL,"
         "  updated_at               INTEGER NOT NULL,"
         "  status                   TEXT NOT NULL DEFAULT 'active',"
         "  depth                    INTEGER NOT NULL DEFAULT 0,"
         "  root_introspection_id    TEXT NOT NULL,"
         "  current_introspection_id TEXT NOT NULL,"
         "  branched_from_thread_id  TEXT,"
         "  branched_from_link_id    TEXT,"
         "  conclusion               TEXT,"
         "  tags                     TEXT NOT NULL DEFAULT '[]'"
         ");");

    exec("CREATE TABLE IF NOT EXISTS thread_links ("
         "  id                TEXT PRIMARY KEY,"
         "  thread_id         TEXT NOT NULL REFERENCES threads(id),"
         "  introspection_id  TEXT NOT NULL,"
         "  parent_link_id    TEXT,"
         "  depth             INTEGER NOT NULL,"
         "  question          TEXT NOT NULL,"
         "  insight_summary   TEXT,"
         "  created_at        INTEGER NOT NULL,"
         "  leads_to_branches TEXT NOT NULL DEFAULT '[]'"
         ");");

    exec("CREATE INDEX IF NOT EXISTS idx_threads_status ON threads(status);");
    exec("CREATE INDEX IF NOT EXISTS idx_threads_updated ON threads(updated_at);");
    exec("CREATE INDEX IF NOT EXISTS idx_threads_name ON threads(name);");
    exec("CREATE INDEX IF NOT EXISTS idx_links_thread ON thread_links(thread_id);");
    exec("CREATE INDEX IF NOT EXISTS idx_links_introspection ON thread_links(introspection_id);");
    // One link per position: a chain is a single path
    exec("CREATE UNIQUE INDEX IF NOT EXISTS idx_links_position ON thread_links(thread_id, depth);");
}

// ── Locked helpers ───────────────────────────────────────────────

std::optional<ExplorationThread> ExplorationTracker::find_thread_locked(
    const std::string& id_or_name) {
    std::string by_id = std::string("SELECT ") + kThreadColumns + " FROM threads WHERE id = ?;";
    {
        StmtGuard g;
        prepare(db_, by_id.c_str(), g);
        sqlite3_bind_text(g.stmt, 1, id_or_name.c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(g.stmt) == SQLITE_ROW) return thread_from_stmt(g.stmt);
    }

    // Fall back to name; the most recently updated wins if names repeat
    std::string by_name = std::string("SELECT ") + kThreadColumns +
                          " FROM threads WHERE name = ? ORDER BY updated_at DESC, rowid DESC LIMIT 1;";
    StmtGuard g;
    prepare(db_, by_name.c_str(), g);
    sqlite3_bind_text(g.stmt, 1, id_or_name.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(g.stmt) == SQLITE_ROW) return thread_from_stmt(g.stmt);
    return std::nullopt;
}

std::optional<ThreadLink> ExplorationTracker::find_link_locked(const std::string& link_id) {
    std::string sql = std::string("SELECT ") + kLinkColumns + " FROM thread_links WHERE id = ?;";
    StmtGuard g;
    prepare(db_, sql.c_str(), g);
    sqlite3_bind_text(g.stmt, 1, link_id.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(g.stmt) == SQLITE_ROW) return link_from_stmt(g.stmt);
    return std::nullopt;
}

std::vector<ThreadLink> ExplorationTracker::chain_locked(const std::string& thread_id) {
    std::string sql = std::string("SELECT ") + kLinkColumns +
                      " FROM thread_links WHERE thread_id = ? ORDER BY depth ASC;";
    StmtGuard g;
    prepare(db_, sql.c_str(), g);
    sqlite3_bind_text(g.stmt, 1, thread_id.c_str(), -1, SQLITE_TRANSIENT);

    std::vector<ThreadLink> chain;
    while (sqlite3_step(g.stmt) == SQLITE_ROW) {
        chain.push_back(link_from_stmt(g.stmt));
    }
    return chain;
}

void ExplorationTracker::insert_thread_locked(const ExplorationThread& t) {
    std::string sql = std::string("INSERT INTO threads (") + kThreadColumns +
                      ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?, ?);";
    StmtGuard g;
    prepare(db_, sql.c_str(), g);

    std::string status = thread_status_to_string(t.status);
    std::string tags = nlohmann::json(t.tags).dump();
    sqlite3_bind_text(g.stmt, 1, t.id.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 2, t.name.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 3, t.question.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int64(g.stmt, 4, static_cast<int64_t>(t.created_at));
    sqlite3_bind_int64(g.stmt, 5, static_cast<int64_t>(t.updated_at));
    sqlite3_bind_text(g.stmt, 6, status.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int(g.stmt, 7, static_cast<int>(t.depth));
    sqlite3_bind_text(g.stmt, 8, t.root_introspection_id.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 9, t.current_introspection_id.c_str(), -1, SQLITE_STATIC);
    bind_opt(g.stmt, 10, t.branched_from_thread_id);
    bind_opt(g.stmt, 11, t.branched_from_link_id);
    bind_opt(g.stmt, 12, t.conclusion);
    sqlite3_bind_text(g.stmt, 13, tags.c_str(), -1, SQLITE_STATIC);
    step_done(db_, g.stmt, "insert thread");
}

void ExplorationTracker::insert_link_locked(const ThreadLink& l) {
    std::string sql = std::string("INSERT INTO thread_links (") + kLinkColumns +
                      ") VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?);";
    StmtGuard g;
    prepare(db_, sql.c_str(), g);

    std::string branches = nlohmann::json(l.leads_to_branches).dump();
    sqlite3_bind_text(g.stmt, 1, l.id.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 2, l.thread_id.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 3, l.introspection_id.c_str(), -1, SQLITE_STATIC);
    bind_opt(g.stmt, 4, l.parent_link_id);
    sqlite3_bind_int(g.stmt, 5, static_cast<int>(l.depth));
    sqlite3_bind_text(g.stmt, 6, l.question.c_str(), -1, SQLITE_STATIC);
    bind_opt(g.stmt, 7, l.insight_summary);
    sqlite3_bind_int64(g.stmt, 8, static_cast<int64_t>(l.created_at));
    sqlite3_bind_text(g.stmt, 9, branches.c_str(), -1, SQLITE_STATIC);
    step_done(db_, g.stmt, "insert link");
}

ExplorationThread ExplorationTracker::start_thread_locked(
    const std::string& name, const std::string& question,
    const std::string& first_introspection_id,
    const std::optional<std::string>& insight_summary,
    const std::vector<std::string>& tags,
    const ThreadLink* origin) {
    if (trim(name).empty()) throw ValidationError("Thread name is required");
    if (trim(question).empty()) throw ValidationError("Thread question is required");
    if (first_introspection_id.empty()) throw ValidationError("Introspection id is required");

    uint64_t now = epoch_millis();

    ExplorationThread thread;
    thread.id = generate_time_id("thread");
    thread.name = name;
    thread.question = question;
    thread.created_at = now;
    thread.updated_at = now;
    thread.status = ThreadStatus::Active;
    thread.depth = 1;
    thread.root_introspection_id = first_introspection_id;
    thread.current_introspection_id = first_introspection_id;
    for (const auto& tag : tags) {
        if (std::find(thread.tags.begin(), thread.tags.end(), tag) == thread.tags.end()) {
            thread.tags.push_back(tag);
        }
    }
    if (origin) {
        thread.branched_from_thread_id = origin->thread_id;
        thread.branched_from_link_id = origin->id;
    }

    ThreadLink root;
    root.id = generate_time_id("link");
    root.thread_id = thread.id;
    root.introspection_id = first_introspection_id;
    root.depth = 0;
    root.question = question;
    root.insight_summary = insight_summary;
    root.created_at = now;

    insert_thread_locked(thread);
    insert_link_locked(root);

    if (origin) {
        auto branches = origin->leads_to_branches;
        branches.push_back(thread.id);
        std::string json = nlohmann::json(branches).dump();

        StmtGuard g;
        prepare(db_, "UPDATE thread_links SET leads_to_branches = ? WHERE id = ?;", g);
        sqlite3_bind_text(g.stmt, 1, json.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_text(g.stmt, 2, origin->id.c_str(), -1, SQLITE_STATIC);
        step_done(db_, g.stmt, "record branch");
    }
    return thread;
}

// ── Mutations ────────────────────────────────────────────────────

ExplorationThread ExplorationTracker::start_thread(const std::string& name,
                                                   const std::string& question,
                                                   const std::string& first_introspection_id,
                                                   const std::optional<std::string>& insight_summary,
                                                   const std::vector<std::string>& tags) {
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction tx(db_);
    auto thread = start_thread_locked(name, question, first_introspection_id,
                                      insight_summary, tags, nullptr);
    tx.commit();
    return thread;
}

ThreadLink ExplorationTracker::continue_thread(const std::string& thread_id_or_name,
                                               const std::string& new_introspection_id,
                                               const std::string& question,
                                               const std::optional<std::string>& insight_summary) {
    if (new_introspection_id.empty()) throw ValidationError("Introspection id is required");

    std::lock_guard<std::mutex> lock(mutex_);
    Transaction tx(db_);

    auto thread = find_thread_locked(thread_id_or_name);
    if (!thread) {
        if (policy_ == LookupPolicy::Strict) {
            throw NotFoundError("Thread not found: " + thread_id_or_name);
        }
        std::cerr << "[exploration] Thread " << thread_id_or_name
                  << " not found, starting a new one\n";
        auto fresh = start_thread_locked(thread_name_from_question(question), question,
                                         new_introspection_id, insight_summary, {}, nullptr);
        auto chain = chain_locked(fresh.id);
        tx.commit();
        return chain.front();
    }

    std::optional<std::string> parent_link_id;
    {
        StmtGuard g;
        prepare(db_, "SELECT id FROM thread_links WHERE thread_id = ? "
                     "ORDER BY depth DESC LIMIT 1;", g);
        sqlite3_bind_text(g.stmt, 1, thread->id.c_str(), -1, SQLITE_TRANSIENT);
        if (sqlite3_step(g.stmt) == SQLITE_ROW) parent_link_id = col_text(g.stmt, 0);
    }

    uint64_t now = epoch_millis();

    ThreadLink link;
    link.id = generate_time_id("link");
    link.thread_id = thread->id;
    link.introspection_id = new_introspection_id;
    link.parent_link_id = parent_link_id;
    link.depth = thread->depth;
    link.question = question;
    link.insight_summary = insight_summary;
    link.created_at = now;
    insert_link_locked(link);

    {
        StmtGuard g;
        prepare(db_, "UPDATE threads SET depth = ?, current_introspection_id = ?, "
                     "updated_at = ? WHERE id = ? AND depth = ?;", g);
        sqlite3_bind_int(g.stmt, 1, static_cast<int>(thread->depth + 1));
        sqlite3_bind_text(g.stmt, 2, new_introspection_id.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_int64(g.stmt, 3, static_cast<int64_t>(now));
        sqlite3_bind_text(g.stmt, 4, thread->id.c_str(), -1, SQLITE_STATIC);
        sqlite3_bind_int(g.stmt, 5, static_cast<int>(thread->depth));
        step_done(db_, g.stmt, "advance thread");
        if (sqlite3_changes(db_) == 0) {
            throw ConcurrentModificationError("Thread " + thread->id + " moved during continue");
        }
    }

    tx.commit();
    return link;
}

ExplorationThread ExplorationTracker::branch_thread(const std::string& from_thread_id,
                                                    const std::string& from_link_id,
                                                    const std::string& new_name,
                                                    const std::string& new_question,
                                                    const std::string& first_introspection_id,
                                                    const std::optional<std::string>& insight_summary,
                                                    const std::vector<std::string>& tags) {
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction tx(db_);

    auto parent = find_thread_locked(from_thread_id);
    std::optional<ThreadLink> origin;
    if (parent) {
        origin = find_link_locked(from_link_id);
        if (origin && origin->thread_id != parent->id) origin.reset();
    }

    if (!parent || !origin) {
        std::string missing = !parent ? "Thread not found: " + from_thread_id
                                      : "Link " + from_link_id + " is not part of thread " +
                                        parent->id;
        if (policy_ == LookupPolicy::Strict) throw NotFoundError(missing);
        std::cerr << "[exploration] " << missing << ", starting an unbranched thread\n";
    }

    auto thread = start_thread_locked(new_name, new_question, first_introspection_id,
                                      insight_summary, tags, origin ? &*origin : nullptr);
    tx.commit();
    return thread;
}

void ExplorationTracker::set_thread_status(const std::string& thread_id, ThreadStatus status,
                                           const std::optional<std::string>& conclusion) {
    std::lock_guard<std::mutex> lock(mutex_);
    Transaction tx(db_);

    auto thread = find_thread_locked(thread_id);
    if (!thread) throw NotFoundError("Thread not found: " + thread_id);

    std::string s = thread_status_to_string(status);
    StmtGuard g;
    prepare(db_, "UPDATE threads SET status = ?, conclusion = ?, updated_at = ? WHERE id = ?;", g);
    sqlite3_bind_text(g.stmt, 1, s.c_str(), -1, SQLITE_STATIC);
    bind_opt(g.stmt, 2, conclusion);
    sqlite3_bind_int64(g.stmt, 3, static_cast<int64_t>(epoch_millis()));
    sqlite3_bind_text(g.stmt, 4, thread->id.c_str(), -1, SQLITE_STATIC);
    step_done(db_, g.stmt, "set status");

    tx.commit();
}

// ── Queries ──────────────────────────────────────────────────────

std::optional<ExplorationThread> ExplorationTracker::get_thread(const std::string& thread_id_or_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    return find_thread_locked(thread_id_or_name);
}

std::vector<ExplorationThread> ExplorationTracker::list_threads(std::optional<ThreadStatus> status,
                                                                uint32_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string sql = std::string("SELECT ") + kThreadColumns + " FROM threads";
    if (status) sql += " WHERE status = ?";
    sql += " ORDER BY updated_at DESC, rowid DESC LIMIT ?;";

    StmtGuard g;
    prepare(db_, sql.c_str(), g);
    int col = 1;
    std::string s;
    if (status) {
        s = thread_status_to_string(*status);
        sqlite3_bind_text(g.stmt, col++, s.c_str(), -1, SQLITE_STATIC);
    }
    sqlite3_bind_int(g.stmt, col, static_cast<int>(limit));
    return collect_threads(g.stmt);
}

std::vector<ExplorationThread> ExplorationTracker::list_active_threads(uint32_t limit) {
    return list_threads(ThreadStatus::Active, limit);
}

std::vector<ThreadLink> ExplorationTracker::get_thread_chain(const std::string& thread_id_or_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto thread = find_thread_locked(thread_id_or_name);
    if (!thread) return {};
    return chain_locked(thread->id);
}

static std::string build_narrative(const ExplorationThread& thread,
                                   const std::vector<ThreadLink>& chain) {
    std::vector<std::string> parts = {
        "Thread: " + thread.name,
        "Core question: " + thread.question,
        "Depth: " + std::to_string(thread.depth) + " thoughts deep",
        "Status: " + thread_status_to_string(thread.status),
    };
    if (thread.branched_from_thread_id) {
        parts.emplace_back("(Branched from another exploration)");
    }
    if (!chain.empty()) {
        parts.emplace_back("\nPath of inquiry:");
        size_t start = chain.size() > 5 ? chain.size() - 5 : 0;
        for (size_t i = start; i < chain.size(); i++) {
            parts.push_back((i == start ? "  * " : "  -> ") + chain[i].question);
            if (chain[i].insight_summary) {
                parts.push_back("    (" + *chain[i].insight_summary + ")");
            }
        }
    }
    if (thread.conclusion) {
        parts.push_back("\nConclusion reached: " + *thread.conclusion);
    }

    std::string out;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i > 0) out += "\n";
        out += parts[i];
    }
    return out;
}

ThreadContext ExplorationTracker::get_thread_context(const std::string& thread_id_or_name,
                                                     bool include_introspections,
                                                     uint32_t max_introspections) {
    ThreadContext ctx;
    std::vector<ThreadLink> chain;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto thread = find_thread_locked(thread_id_or_name);
        if (!thread) throw NotFoundError("Thread not found: " + thread_id_or_name);
        ctx.thread = std::move(*thread);
        chain = chain_locked(ctx.thread.id);
    }

    ctx.chain_length = static_cast<uint32_t>(chain.size());
    size_t start = chain.size() > max_introspections ? chain.size() - max_introspections : 0;
    ctx.recent_links.assign(chain.begin() + static_cast<ptrdiff_t>(start), chain.end());
    for (const auto& link : chain) ctx.questions_explored.push_back(link.question);

    if (include_introspections && journal_) {
        for (const auto& link : ctx.recent_links) {
            std::optional<IntrospectionSummary> intro;
            try {
                intro = journal_->fetch(link.introspection_id);
            } catch (const std::exception& e) {
                std::cerr << "[exploration] Warning: introspection " << link.introspection_id
                          << " unavailable: " << e.what() << "\n";
                continue;
            }
            if (!intro) continue;
            ctx.introspections.push_back({
                {"link_id", link.id},
                {"question", link.question},
                {"insight", opt_json(link.insight_summary)},
                {"introspection", {
                    {"id", intro->id},
                    {"communicating", intro->communicating},
                    {"awareness_notes", intro->awareness_notes},
                    {"tension_level", intro->tension_level}
                }}
            });
        }
    }

    ctx.narrative = build_narrative(ctx.thread, chain);
    return ctx;
}

ExplorationStats ExplorationTracker::get_stats() {
    std::lock_guard<std::mutex> lock(mutex_);

    StmtGuard g;
    prepare(db_,
        "SELECT COUNT(*),"
        " COALESCE(SUM(status = 'active'), 0),"
        " COALESCE(SUM(status = 'dormant'), 0),"
        " COALESCE(SUM(status = 'concluded'), 0),"
        " COALESCE(AVG(depth), 0),"
        " COALESCE(SUM(branched_from_thread_id IS NOT NULL), 0),"
        " (SELECT COUNT(*) FROM thread_links)"
        " FROM threads;", g);

    ExplorationStats s;
    if (sqlite3_step(g.stmt) == SQLITE_ROW) {
        s.total_threads = static_cast<uint32_t>(sqlite3_column_int(g.stmt, 0));
        s.active_threads = static_cast<uint32_t>(sqlite3_column_int(g.stmt, 1));
        s.dormant_threads = static_cast<uint32_t>(sqlite3_column_int(g.stmt, 2));
        s.concluded_threads = static_cast<uint32_t>(sqlite3_column_int(g.stmt, 3));
        s.average_depth = std::round(sqlite3_column_double(g.stmt, 4) * 10.0) / 10.0;
        s.branched_threads = static_cast<uint32_t>(sqlite3_column_int(g.stmt, 5));
        s.total_links = static_cast<uint32_t>(sqlite3_column_int(g.stmt, 6));
    }
    return s;
}

std::vector<ExplorationThread> ExplorationTracker::search_threads(const std::string& query,
                                                                  uint32_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::string sql = std::string("SELECT ") + kThreadColumns +
                      " FROM threads WHERE name LIKE ? ESCAPE '\\' OR question LIKE ? ESCAPE '\\'"
                      " ORDER BY updated_at DESC, rowid DESC LIMIT ?;";
    StmtGuard g;
    prepare(db_, sql.c_str(), g);

    std::string pattern = "%" + escape_like(query) + "%";
    sqlite3_bind_text(g.stmt, 1, pattern.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_text(g.stmt, 2, pattern.c_str(), -1, SQLITE_STATIC);
    sqlite3_bind_int(g.stmt, 3, static_cast<int>(limit));
    return collect_threads(g.stmt);
}

} // namespace engram
