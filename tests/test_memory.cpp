#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "memory.hpp"
#include "similarity_index.hpp"

using namespace engram;
using Catch::Matchers::WithinAbs;

// ── Decay arithmetic ─────────────────────────────────────────────

TEST_CASE("decay_factor: no elapsed time means no decay", "[memory]") {
    REQUIRE_THAT(decay_factor(0.0, 0.05), WithinAbs(1.0, 1e-9));
}

TEST_CASE("decay_factor: linear per day", "[memory]") {
    // 10% per day, two days
    REQUIRE_THAT(decay_factor(48.0, 0.1), WithinAbs(0.8, 1e-9));
}

TEST_CASE("decay_factor: floored at 0.1", "[memory]") {
    REQUIRE_THAT(decay_factor(24.0 * 10000, 0.1), WithinAbs(0.1, 1e-9));
}

TEST_CASE("access_boost: 0.02 per access capped at 0.3", "[memory]") {
    REQUIRE_THAT(access_boost(0), WithinAbs(0.0, 1e-9));
    REQUIRE_THAT(access_boost(5), WithinAbs(0.1, 1e-9));
    REQUIRE_THAT(access_boost(1000), WithinAbs(0.3, 1e-9));
}

// ── effective_importance ─────────────────────────────────────────

TEST_CASE("MemoryEntry: never accessed returns raw importance", "[memory]") {
    MemoryEntry e;
    e.importance = 0.6;
    e.decay_rate = 0.05;
    REQUIRE_THAT(e.effective_importance(1000000), WithinAbs(0.6, 1e-9));
}

TEST_CASE("MemoryEntry: decays since last access", "[memory]") {
    MemoryEntry e;
    e.importance = 0.8;
    e.decay_rate = 0.1;
    e.last_accessed_at = 1000;
    // 5 days later: factor 0.5
    REQUIRE_THAT(e.effective_importance(1000 + 5 * 86400), WithinAbs(0.4, 1e-9));
}

TEST_CASE("MemoryEntry: effective importance stays in [0,1]", "[memory]") {
    MemoryEntry e;
    e.importance = 1.0;
    e.decay_rate = 0.0;
    e.access_count = 500;
    e.last_accessed_at = 0;
    REQUIRE(e.effective_importance(1) <= 1.0);

    e.importance = 0.0;
    e.decay_rate = 1.0;
    e.access_count = 0;
    REQUIRE(e.effective_importance(100000000) >= 0.0);

    // Out-of-range stored values are clamped
    e.importance = 7.0;
    e.decay_rate = -3.0;
    REQUIRE(e.effective_importance(5) <= 1.0);
    e.importance = -2.0;
    REQUIRE(e.effective_importance(5) >= 0.0);
}

TEST_CASE("MemoryEntry: deprecated and confidence read metadata", "[memory]") {
    MemoryEntry e;
    REQUIRE_FALSE(e.is_deprecated());
    REQUIRE_THAT(e.confidence(), WithinAbs(1.0, 1e-9));

    e.metadata = {{"deprecated", true}, {"confidence", 0.4}};
    REQUIRE(e.is_deprecated());
    REQUIRE_THAT(e.confidence(), WithinAbs(0.4, 1e-9));
}

// ── Enum strings ─────────────────────────────────────────────────

TEST_CASE("Tier strings are stable", "[memory]") {
    REQUIRE(tier_to_string(Tier::Working) == "working");
    REQUIRE(tier_to_string(Tier::Episodic) == "episodic");
    REQUIRE(tier_to_string(Tier::Semantic) == "semantic");
    REQUIRE(tier_to_string(Tier::LongTerm) == "longterm");
    REQUIRE(tier_from_string("longterm") == Tier::LongTerm);
    REQUIRE(tier_id_prefix(Tier::Episodic) == "episode");
    REQUIRE(tier_id_prefix(Tier::Semantic) == "fact");
}

TEST_CASE("Valence and category strings", "[memory]") {
    REQUIRE(valence_from_string(valence_to_string(Valence::Mixed)) == Valence::Mixed);
    REQUIRE(valence_from_string("bogus") == Valence::Neutral);
    REQUIRE(category_to_string(KnowledgeCategory::UserPreference) == "user_preference");
    REQUIRE(category_from_string("learned_behavior") == KnowledgeCategory::LearnedBehavior);
    REQUIRE(category_from_string("unknown") == KnowledgeCategory::WorldKnowledge);
}

TEST_CASE("ConsolidationType strings", "[memory]") {
    REQUIRE(consolidation_type_to_string(ConsolidationType::CoreBelief) == "core_belief");
    REQUIRE(consolidation_type_to_string(ConsolidationType::PatternSummary) == "pattern");
    REQUIRE(consolidation_type_from_string("relationship") == ConsolidationType::RelationshipEssence);
    REQUIRE(consolidation_type_from_string("identity") == ConsolidationType::IdentityMarker);
}

// ── add_unique ───────────────────────────────────────────────────

TEST_CASE("add_unique: keeps order and skips duplicates and empties", "[memory]") {
    std::vector<std::string> set;
    add_unique(set, "b");
    add_unique(set, "a");
    add_unique(set, "b");
    add_unique(set, "");
    REQUIRE(set == std::vector<std::string>{"b", "a"});
}

// ── Record conversion ────────────────────────────────────────────

TEST_CASE("entry_from_record: restores every field from index metadata", "[memory]") {
    MemoryEntry e;
    e.id = "fact_1";
    e.content = "The user likes tea";
    e.tier = Tier::Semantic;
    e.created_at = 1700000000;
    e.importance = 0.7;
    e.valence = Valence::Positive;
    e.intensity = 0.25;
    e.tags = {"drink", "preference"};
    e.source = "stated";
    e.related_ids = {"fact_0"};
    e.access_count = 3;
    e.last_accessed_at = 1700000500;
    e.decay_rate = 0.01;
    e.metadata = {{"category", "user_preference"}, {"confidence", 0.9}};

    IndexRecord rec;
    rec.id = e.id;
    rec.text = e.content;
    rec.metadata = entry_index_metadata(e);

    auto back = entry_from_record(rec);
    REQUIRE(back.id == e.id);
    REQUIRE(back.content == e.content);
    REQUIRE(back.tier == e.tier);
    REQUIRE(back.created_at == e.created_at);
    REQUIRE(back.importance == e.importance);
    REQUIRE(back.valence == e.valence);
    REQUIRE(back.intensity == e.intensity);
    REQUIRE(back.tags == e.tags);
    REQUIRE(back.source == e.source);
    REQUIRE(back.related_ids == e.related_ids);
    REQUIRE(back.access_count == e.access_count);
    REQUIRE(back.last_accessed_at == e.last_accessed_at);
    REQUIRE(back.decay_rate == e.decay_rate);
    REQUIRE(back.metadata == e.metadata);
}

TEST_CASE("entry_from_json: missing fields fall back to defaults", "[memory]") {
    auto e = entry_from_json(nlohmann::json{{"id", "x"}, {"content", "y"}});
    REQUIRE(e.id == "x");
    REQUIRE(e.importance == 0.5);
    REQUIRE(e.valence == Valence::Neutral);
    REQUIRE_FALSE(e.last_accessed_at.has_value());
    REQUIRE(e.metadata.is_object());
}
