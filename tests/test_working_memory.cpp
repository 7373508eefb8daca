#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include "tiers/working_memory.hpp"
#include "util.hpp"

using namespace engram;
using Catch::Matchers::WithinAbs;

static MemoryEntry make_entry(const std::string& id, const std::string& content,
                              double importance) {
    MemoryEntry e;
    e.id = id;
    e.content = content;
    e.tier = Tier::Semantic;
    e.importance = importance;
    e.decay_rate = 0.0;
    return e;
}

// ── Turns ────────────────────────────────────────────────────────

TEST_CASE("WorkingMemory: add_turn keeps the newest max_turns", "[working_memory]") {
    WorkingConfig cfg;
    cfg.max_turns = 3;
    WorkingMemory wm(cfg);

    for (int i = 0; i < 5; i++) wm.add_turn("user", "turn " + std::to_string(i));

    REQUIRE(wm.turns().size() == 3);
    REQUIRE(wm.turns().front().content == "turn 2");
    REQUIRE(wm.turns().back().content == "turn 4");
    REQUIRE(wm.get_context("conversation_depth") == 3);
}

TEST_CASE("WorkingMemory: topics are de-duplicated and capped", "[working_memory]") {
    WorkingConfig cfg;
    cfg.max_topics = 2;
    WorkingMemory wm(cfg);

    wm.add_turn("user", "a", std::nullopt, {"music", "code"});
    wm.add_turn("user", "b", std::nullopt, {"music", "travel"});

    REQUIRE(wm.active_topics() == std::vector<std::string>{"code", "travel"});
}

TEST_CASE("WorkingMemory: conversation_history returns the last n", "[working_memory]") {
    WorkingMemory wm;
    wm.add_turn("user", "one");
    wm.add_turn("assistant", "two");
    wm.add_turn("user", "three");

    auto last = wm.conversation_history(2);
    REQUIRE(last.size() == 2);
    REQUIRE(last[0].content == "two");
    REQUIRE(wm.conversation_history().size() == 3);
}

// ── Retrieved memories ───────────────────────────────────────────

TEST_CASE("WorkingMemory: store ignores duplicate ids", "[working_memory]") {
    WorkingMemory wm;
    wm.store(make_entry("a", "x", 0.5));
    wm.store(make_entry("a", "x", 0.5));
    REQUIRE(wm.count() == 1);
}

TEST_CASE("WorkingMemory: over capacity evicts the least important", "[working_memory]") {
    WorkingConfig cfg;
    cfg.max_retrieved = 2;
    WorkingMemory wm(cfg);

    wm.store(make_entry("mid", "x", 0.5));
    wm.store(make_entry("low", "y", 0.1));
    wm.store(make_entry("high", "z", 0.9));

    REQUIRE(wm.count() == 2);
    for (const auto& e : wm.retrieved()) REQUIRE(e.id != "low");
}

TEST_CASE("WorkingMemory: get_relevant prefers word overlap", "[working_memory]") {
    WorkingMemory wm;
    wm.store(make_entry("dog", "the dog likes walks", 0.3));
    wm.store(make_entry("tax", "filing taxes is boring", 0.9));

    auto results = wm.get_relevant("dog walks", 2);
    REQUIRE(results.size() == 2);
    REQUIRE(results[0].id == "dog");
}

TEST_CASE("WorkingMemory: require_overlap drops unrelated entries", "[working_memory]") {
    WorkingMemory wm;
    wm.store(make_entry("tax", "filing taxes is boring", 0.9));
    REQUIRE(wm.get_relevant("dog", 5, true).empty());
    REQUIRE(wm.get_relevant("dog", 5, false).size() == 1);
}

TEST_CASE("WorkingMemory: remove by id", "[working_memory]") {
    WorkingMemory wm;
    wm.store(make_entry("a", "x", 0.5));
    REQUIRE(wm.remove("a"));
    REQUIRE_FALSE(wm.remove("a"));
    REQUIRE(wm.count() == 0);
}

// ── Emotional state ──────────────────────────────────────────────

TEST_CASE("EmotionalState: smooths intensity 30/70", "[working_memory]") {
    WorkingMemory wm;
    wm.update_emotional_state(Valence::Positive, 1.0, "praise");
    REQUIRE_THAT(wm.emotional_state().intensity, WithinAbs(0.7, 1e-9));
    wm.update_emotional_state(Valence::Negative, 0.0);
    REQUIRE_THAT(wm.emotional_state().intensity, WithinAbs(0.21, 1e-9));
    REQUIRE(wm.emotional_state().valence == Valence::Negative);
    REQUIRE(wm.emotional_state().dominant_emotion == "negative");
}

TEST_CASE("EmotionalState: keeps the last five triggers", "[working_memory]") {
    EmotionalState s;
    for (int i = 0; i < 7; i++) s.update(Valence::Mixed, 0.5, "t" + std::to_string(i));
    REQUIRE(s.recent_triggers.size() == 5);
    REQUIRE(s.recent_triggers.front() == "t2");
    REQUIRE(s.recent_triggers.back() == "t6");
}

// ── Summaries ────────────────────────────────────────────────────

TEST_CASE("WorkingMemory: empty context summary", "[working_memory]") {
    WorkingMemory wm;
    REQUIRE(wm.context_summary() == "Fresh conversation");
}

TEST_CASE("WorkingMemory: context summary lists mood, topics and focus", "[working_memory]") {
    WorkingMemory wm;
    wm.update_emotional_state(Valence::Positive, 0.8);
    wm.add_turn("user", "hi", std::nullopt, {"music"});
    wm.set_focus("planning a trip");

    auto summary = wm.context_summary();
    REQUIRE(summary.find("Current mood: positive") != std::string::npos);
    REQUIRE(summary.find("Active topics: music") != std::string::npos);
    REQUIRE(summary.find("Current focus: planning a trip") != std::string::npos);
}

TEST_CASE("WorkingMemory: key moments from long and toned turns", "[working_memory]") {
    WorkingMemory wm;
    wm.add_turn("user", std::string(250, 'x'));
    wm.add_turn("user", "that was wonderful", Valence::Positive);
    wm.add_turn("user", "plain", Valence::Neutral);

    auto moments = wm.key_moments();
    REQUIRE(moments.size() == 2);
    REQUIRE(moments[0] == std::string(100, 'x') + "...");
    REQUIRE(moments[1] == "[positive] that was wonderful...");
}

TEST_CASE("WorkingMemory: word count across turns", "[working_memory]") {
    WorkingMemory wm;
    wm.add_turn("user", "one two three");
    wm.add_turn("assistant", "four  five");
    REQUIRE(wm.word_count() == 5);
}

TEST_CASE("WorkingMemory: clear resets everything", "[working_memory]") {
    WorkingMemory wm;
    wm.add_turn("user", "hi", Valence::Positive, {"x"});
    wm.store(make_entry("a", "x", 0.5));
    wm.set_focus("f");
    wm.set_context("is_first_session", true);
    wm.clear();

    REQUIRE(wm.turns().empty());
    REQUIRE(wm.count() == 0);
    REQUIRE(wm.active_topics().empty());
    REQUIRE_FALSE(wm.current_focus().has_value());
    REQUIRE(wm.get_context("is_first_session") == false);
    REQUIRE(wm.emotional_state().intensity == 0.0);
}

TEST_CASE("WorkingMemory: get_context fallback for unknown keys", "[working_memory]") {
    WorkingMemory wm;
    REQUIRE(wm.get_context("nope", "fallback") == "fallback");
    REQUIRE(wm.get_context("nope").is_null());
}
