#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

struct sqlite3; // forward declare

namespace engram {

enum class ThreadStatus { Active, Dormant, Concluded };

std::string thread_status_to_string(ThreadStatus s);
ThreadStatus thread_status_from_string(const std::string& s);

// A named chain of introspection references. Timestamps are epoch milliseconds.
struct ExplorationThread {
    std::string id;
    std::string name;
    std::string question;
    uint64_t created_at = 0;
    uint64_t updated_at = 0;
    ThreadStatus status = ThreadStatus::Active;
    uint32_t depth = 0;                         // number of links
    std::string root_introspection_id;
    std::string current_introspection_id;
    std::optional<std::string> branched_from_thread_id;
    std::optional<std::string> branched_from_link_id;
    std::optional<std::string> conclusion;
    std::vector<std::string> tags;

    nlohmann::json to_json() const;
};

struct ThreadLink {
    std::string id;
    std::string thread_id;
    std::string introspection_id;               // owned by the external journal
    std::optional<std::string> parent_link_id;  // nullopt for the root link
    uint32_t depth = 0;                         // 0-based position in the chain
    std::string question;
    std::optional<std::string> insight_summary;
    uint64_t created_at = 0;
    std::vector<std::string> leads_to_branches; // thread ids branched from here

    nlohmann::json to_json() const;
};

// What the tracker needs from an introspection record.
struct IntrospectionSummary {
    std::string id;
    std::string communicating;
    std::string awareness_notes;
    double tension_level = 0.0;
};

// Read-only port onto the external introspection journal.
class IntrospectionJournal {
public:
    virtual ~IntrospectionJournal() = default;
    virtual std::optional<IntrospectionSummary> fetch(const std::string& introspection_id) = 0;
};

// What continue_thread / branch_thread do when the thread or link is unknown.
enum class LookupPolicy {
    Strict,             // throw NotFoundError
    StartNewOnMiss      // start a fresh thread named after the question
};

LookupPolicy lookup_policy_from_string(const std::string& s);

struct ThreadContext {
    ExplorationThread thread;
    uint32_t chain_length = 0;
    std::vector<ThreadLink> recent_links;
    std::vector<std::string> questions_explored;
    nlohmann::json introspections = nlohmann::json::array();
    std::string narrative;

    nlohmann::json to_json() const;
};

struct ExplorationStats {
    uint32_t total_threads = 0;
    uint32_t active_threads = 0;
    uint32_t dormant_threads = 0;
    uint32_t concluded_threads = 0;
    uint32_t total_links = 0;
    double average_depth = 0.0;                 // rounded to one decimal
    uint32_t branched_threads = 0;

    nlohmann::json to_json() const;
};

// Lowercase, strip punctuation, first five words joined with '-', at most 40 chars.
std::string thread_name_from_question(const std::string& question);

// Forest of branchable exploration threads in a SQLite database.
// Every mutation runs in one BEGIN IMMEDIATE transaction under the tracker mutex.
class ExplorationTracker {
public:
    explicit ExplorationTracker(const std::string& db_path,
                                IntrospectionJournal* journal = nullptr,
                                LookupPolicy policy = LookupPolicy::Strict);
    ~ExplorationTracker();

    ExplorationTracker(const ExplorationTracker&) = delete;
    ExplorationTracker& operator=(const ExplorationTracker&) = delete;

    void set_lookup_policy(LookupPolicy policy) { policy_ = policy; }
    LookupPolicy lookup_policy() const { return policy_; }

    // New thread of depth 1 with a root link at depth 0.
    ExplorationThread start_thread(const std::string& name, const std::string& question,
                                   const std::string& first_introspection_id,
                                   const std::optional<std::string>& insight_summary = std::nullopt,
                                   const std::vector<std::string>& tags = {});

    // Append a link at the thread's current depth. The thread is resolved by id,
    // then by name.
    ThreadLink continue_thread(const std::string& thread_id_or_name,
                               const std::string& new_introspection_id,
                               const std::string& question,
                               const std::optional<std::string>& insight_summary = std::nullopt);

    // New independent thread whose origin is from_link_id of from_thread_id.
    // The origin link records the new thread in leads_to_branches; the parent
    // thread's depth and current introspection are untouched.
    ExplorationThread branch_thread(const std::string& from_thread_id,
                                    const std::string& from_link_id,
                                    const std::string& new_name,
                                    const std::string& new_question,
                                    const std::string& first_introspection_id,
                                    const std::optional<std::string>& insight_summary = std::nullopt,
                                    const std::vector<std::string>& tags = {});

    void set_thread_status(const std::string& thread_id, ThreadStatus status,
                           const std::optional<std::string>& conclusion = std::nullopt);

    std::optional<ExplorationThread> get_thread(const std::string& thread_id_or_name);

    // Most recently updated first.
    std::vector<ExplorationThread> list_threads(std::optional<ThreadStatus> status = std::nullopt,
                                                uint32_t limit = 20);
    std::vector<ExplorationThread> list_active_threads(uint32_t limit = 10);

    // Links ordered by ascending depth.
    std::vector<ThreadLink> get_thread_chain(const std::string& thread_id_or_name);

    ThreadContext get_thread_context(const std::string& thread_id_or_name,
                                     bool include_introspections = true,
                                     uint32_t max_introspections = 5);

    ExplorationStats get_stats();

    // Substring match over name and question.
    std::vector<ExplorationThread> search_threads(const std::string& query, uint32_t limit = 5);

private:
    void init_schema();
    void exec(const char* sql);

    std::optional<ExplorationThread> find_thread_locked(const std::string& id_or_name);
    std::optional<ThreadLink> find_link_locked(const std::string& link_id);
    std::vector<ThreadLink> chain_locked(const std::string& thread_id);
    void insert_thread_locked(const ExplorationThread& thread);
    void insert_link_locked(const ThreadLink& link);
    ExplorationThread start_thread_locked(const std::string& name, const std::string& question,
                                          const std::string& first_introspection_id,
                                          const std::optional<std::string>& insight_summary,
                                          const std::vector<std::string>& tags,
                                          const ThreadLink* origin);

    sqlite3* db_ = nullptr;
    std::string path_;
    IntrospectionJournal* journal_ = nullptr;
    LookupPolicy policy_ = LookupPolicy::Strict;
    std::mutex mutex_;
};

} // namespace engram
