#pragma once
#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace engram {

struct IndexRecord; // forward declaration

enum class Tier { Working, Episodic, Semantic, LongTerm };

enum class Valence { Positive, Negative, Neutral, Mixed };

enum class KnowledgeCategory {
    UserPreference,
    UserFact,
    ProjectInfo,
    Technical,
    Relationship,
    WorldKnowledge,
    LearnedBehavior
};

enum class ConsolidationType {
    CoreBelief,
    RelationshipEssence,
    IdentityMarker,
    Milestone,
    LessonLearned,
    PatternSummary
};

// Default decay rates per tier (fraction of importance lost per day since access)
constexpr double kEpisodicDecayRate = 0.05;
constexpr double kSemanticDecayRate = 0.01;
constexpr double kWorkingDecayRate = 0.1;
constexpr double kLongTermImportanceFloor = 0.8;

struct MemoryEntry {
    std::string id;
    std::string content;
    Tier tier = Tier::Semantic;
    uint64_t created_at = 0;                 // epoch seconds
    double importance = 0.5;                 // [0,1]
    Valence valence = Valence::Neutral;
    double intensity = 0.0;                  // [0,1]
    std::vector<std::string> tags;           // ordered, no duplicates
    std::string source = "conversation";
    std::vector<std::string> related_ids;    // weak references, no duplicates
    uint32_t access_count = 0;
    std::optional<uint64_t> last_accessed_at;
    double decay_rate = kWorkingDecayRate;
    nlohmann::json metadata = nlohmann::json::object();

    // Importance with time decay and access boost applied; always in [0,1].
    double effective_importance(uint64_t now) const;
    double effective_importance() const;

    // Convenience accessors into metadata
    bool is_deprecated() const;
    double confidence() const;
};

// Pure decay arithmetic shared by every tier.
double decay_factor(double hours_since_access, double decay_rate);
double access_boost(uint32_t access_count);
double clamp01(double v);

// Enum string conversions (stable: these are the persisted forms)
std::string tier_to_string(Tier tier);
Tier tier_from_string(const std::string& s);
std::string tier_id_prefix(Tier tier);
std::string valence_to_string(Valence v);
Valence valence_from_string(const std::string& s);
std::string category_to_string(KnowledgeCategory cat);
KnowledgeCategory category_from_string(const std::string& s);
std::string consolidation_type_to_string(ConsolidationType type);
ConsolidationType consolidation_type_from_string(const std::string& s);

// Add value to an ordered set if not already present.
void add_unique(std::vector<std::string>& set, const std::string& value);

// Full JSON form of an entry (snapshot export, tool output).
nlohmann::json entry_to_json(const MemoryEntry& entry);
MemoryEntry entry_from_json(const nlohmann::json& item);

// Split an entry into index text + metadata and back again. Round-trips exactly.
nlohmann::json entry_index_metadata(const MemoryEntry& entry);
MemoryEntry entry_from_record(const IndexRecord& record);

} // namespace engram
