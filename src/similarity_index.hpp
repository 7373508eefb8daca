#pragma once
#include <string>
#include <vector>
#include <memory>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace engram {

struct Config; // forward declaration

// One record of a similarity-indexed collection.
struct IndexRecord {
    std::string id;
    std::string text;
    nlohmann::json metadata = nlohmann::json::object();
    double score = 0.0;     // relevance from query(); 0 for get()/list()
};

// Equality filter over record metadata: {"tier": "episodic", "metadata.category": "user_fact"}.
// Keys are dotted paths into the metadata object; every pair must match.
// An empty object (or null) matches everything.
using WhereFilter = nlohmann::json;

// Abstract similarity-search backend. One instance is one logical collection.
// Implementations must be safe to call from several threads.
class SimilarityIndex {
public:
    virtual ~SimilarityIndex() = default;

    virtual std::string backend_name() const = 0;

    virtual const std::string& collection() const = 0;

    // Insert a record. Throws ValidationError on empty or duplicate id,
    // BackendUnavailableError if the store cannot be written.
    virtual void add(const std::string& id, const std::string& text,
                     const nlohmann::json& metadata) = 0;

    // Up to k records matching where, ranked by relevance to text (best first).
    virtual std::vector<IndexRecord> query(const std::string& text, uint32_t k,
                                           const WhereFilter& where) = 0;

    // Records for the ids that exist, in request order.
    virtual std::vector<IndexRecord> get(const std::vector<std::string>& ids) = 0;

    // Unranked scan in insertion order. limit 0 = no limit.
    virtual std::vector<IndexRecord> list(const WhereFilter& where, uint32_t limit) = 0;

    // Shallow-merge the given keys into the stored metadata. False if id is unknown.
    virtual bool update(const std::string& id, const nlohmann::json& metadata) = 0;

    // Delete records. Returns the number removed.
    virtual uint32_t remove(const std::vector<std::string>& ids) = 0;

    virtual uint32_t count() = 0;
};

// Resolve a dotted path ("metadata.category") inside a JSON object. nullptr if absent.
const nlohmann::json* json_path_lookup(const nlohmann::json& obj, const std::string& path);

// True if every key/value pair in where equals the value at that path in metadata.
bool where_matches(const nlohmann::json& metadata, const WhereFilter& where);

// Create a similarity index for one collection from config.
// Uses the plugin registry to instantiate the configured backend.
std::unique_ptr<SimilarityIndex> create_index(const Config& config,
                                              const std::string& collection);

} // namespace engram
