#pragma once
#include <string>
#include <mutex>
#include <nlohmann/json.hpp>

namespace engram {

// Single coordination document shared with out-of-process readers
// (last conversation summary, consolidation watermark).
class SharedStateStore {
public:
    virtual ~SharedStateStore() = default;

    // Whole document; empty object if nothing has been written yet.
    virtual nlohmann::json read() = 0;

    // Replace the given top-level keys and stamp last_updated.
    virtual void merge(const nlohmann::json& updates) = 0;
};

// File-backed document (~/.engram/shared_state.json by default).
// Writes go through a temp file + rename. Read-modify-write is serialized
// within this process only.
class JsonFileSharedState : public SharedStateStore {
public:
    explicit JsonFileSharedState(const std::string& path);

    nlohmann::json read() override;
    void merge(const nlohmann::json& updates) override;

    const std::string& path() const { return path_; }

private:
    nlohmann::json read_locked() const;

    std::string path_;
    std::mutex mutex_;
};

// Process-local document, for tests and embedders that do not share state.
class InMemorySharedState : public SharedStateStore {
public:
    nlohmann::json read() override;
    void merge(const nlohmann::json& updates) override;

private:
    nlohmann::json doc_ = nlohmann::json::object();
    std::mutex mutex_;
};

} // namespace engram
