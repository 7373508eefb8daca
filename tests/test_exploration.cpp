#include <catch2/catch_test_macros.hpp>
#include "exploration.hpp"
#include "errors.hpp"
#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <stdexcept>
#include <thread>
#include <unistd.h>

using namespace engram;

static std::string exploration_test_path() {
    return "/tmp/engram_test_exploration_" + std::to_string(getpid()) + ".db";
}

// Journal with canned records; ids starting with "broken" throw.
class FakeJournal : public IntrospectionJournal {
public:
    std::map<std::string, IntrospectionSummary> records;

    std::optional<IntrospectionSummary> fetch(const std::string& id) override {
        if (id.rfind("broken", 0) == 0) throw std::runtime_error("journal offline");
        auto it = records.find(id);
        if (it == records.end()) return std::nullopt;
        return it->second;
    }
};

struct ExplorationFixture {
    std::string path = exploration_test_path();
    FakeJournal journal;
    ExplorationTracker tracker{path, &journal};

    ~ExplorationFixture() {
        std::filesystem::remove(path);
        std::filesystem::remove(path + "-wal");
        std::filesystem::remove(path + "-shm");
    }
};

// ── Naming and enums ─────────────────────────────────────────────

TEST_CASE("thread_name_from_question: slug of the first five words", "[exploration]") {
    REQUIRE(thread_name_from_question("What is the nature of memory, really?") ==
            "what-is-the-nature-of");
    REQUIRE(thread_name_from_question("Why?") == "why");
    REQUIRE(thread_name_from_question("?!") == "exploration");
    REQUIRE(thread_name_from_question(
        "Incomprehensibilities notwithstanding, characteristically overwhelming")
        .size() <= 40);
}

TEST_CASE("ThreadStatus: string conversions", "[exploration]") {
    REQUIRE(thread_status_to_string(ThreadStatus::Dormant) == "dormant");
    REQUIRE(thread_status_from_string("concluded") == ThreadStatus::Concluded);
    REQUIRE_THROWS_AS(thread_status_from_string("paused"), ValidationError);
    REQUIRE(lookup_policy_from_string("start_new") == LookupPolicy::StartNewOnMiss);
    REQUIRE(lookup_policy_from_string("strict") == LookupPolicy::Strict);
}

// ── start / continue ─────────────────────────────────────────────

TEST_CASE("ExplorationTracker: start creates root link", "[exploration]") {
    ExplorationFixture f;
    auto t = f.tracker.start_thread("memory", "How does memory fade?", "intro_1",
                                    std::string("decay is gradual"), {"mind", "mind"});

    REQUIRE(t.depth == 1);
    REQUIRE(t.status == ThreadStatus::Active);
    REQUIRE(t.root_introspection_id == "intro_1");
    REQUIRE(t.current_introspection_id == "intro_1");
    REQUIRE(t.tags == std::vector<std::string>{"mind"});

    auto chain = f.tracker.get_thread_chain(t.id);
    REQUIRE(chain.size() == 1);
    REQUIRE(chain[0].depth == 0);
    REQUIRE_FALSE(chain[0].parent_link_id.has_value());
    REQUIRE(chain[0].insight_summary == std::optional<std::string>("decay is gradual"));
}

TEST_CASE("ExplorationTracker: start validates input", "[exploration]") {
    ExplorationFixture f;
    REQUIRE_THROWS_AS(f.tracker.start_thread(" ", "q?", "intro"), ValidationError);
    REQUIRE_THROWS_AS(f.tracker.start_thread("n", "", "intro"), ValidationError);
    REQUIRE_THROWS_AS(f.tracker.start_thread("n", "q?", ""), ValidationError);
    REQUIRE(f.tracker.get_stats().total_threads == 0);
}

TEST_CASE("ExplorationTracker: continue builds a gapless chain", "[exploration]") {
    ExplorationFixture f;
    auto t = f.tracker.start_thread("selfhood", "What makes me me?", "intro_0");

    for (int i = 1; i <= 4; i++) {
        auto link = f.tracker.continue_thread(t.id, "intro_" + std::to_string(i),
                                              "step " + std::to_string(i));
        REQUIRE(link.depth == static_cast<uint32_t>(i));
    }

    auto chain = f.tracker.get_thread_chain(t.id);
    REQUIRE(chain.size() == 5);
    for (size_t i = 0; i < chain.size(); i++) {
        REQUIRE(chain[i].depth == i);
        if (i > 0) REQUIRE(chain[i].parent_link_id == std::optional<std::string>(chain[i - 1].id));
    }

    auto updated = f.tracker.get_thread(t.id);
    REQUIRE(updated->depth == 5);
    REQUIRE(updated->current_introspection_id == "intro_4");
    REQUIRE(updated->root_introspection_id == "intro_0");
}

TEST_CASE("ExplorationTracker: racing continues from two connections stay gapless", "[exploration]") {
    ExplorationFixture f;
    auto t = f.tracker.start_thread("rivers", "Where do rivers start?", "intro_root");
    ExplorationTracker other(f.path);

    constexpr uint32_t kPerWriter = 20;
    std::string error_a, error_b;
    auto writer = [&t](ExplorationTracker& tracker, const std::string& who, std::string& error) {
        try {
            for (uint32_t i = 0; i < kPerWriter; i++) {
                tracker.continue_thread(t.id, who + "_" + std::to_string(i), "next?");
            }
        } catch (const std::exception& e) {
            error = e.what();
        }
    };
    std::thread a(writer, std::ref(f.tracker), std::string("intro_a"), std::ref(error_a));
    std::thread b(writer, std::ref(other), std::string("intro_b"), std::ref(error_b));
    a.join();
    b.join();
    REQUIRE(error_a.empty());
    REQUIRE(error_b.empty());

    auto chain = f.tracker.get_thread_chain(t.id);
    REQUIRE(chain.size() == 2 * kPerWriter + 1);
    for (size_t i = 0; i < chain.size(); i++) {
        REQUIRE(chain[i].depth == i);
        if (i > 0) REQUIRE(chain[i].parent_link_id == std::optional<std::string>(chain[i - 1].id));
    }
    REQUIRE(other.get_thread(t.id)->depth == 2 * kPerWriter + 1);
}

TEST_CASE("ExplorationTracker: continue resolves by name", "[exploration]") {
    ExplorationFixture f;
    auto t = f.tracker.start_thread("curiosity", "Where does curiosity come from?", "intro_a");

    auto link = f.tracker.continue_thread("curiosity", "intro_b", "Is it learned?");
    REQUIRE(link.thread_id == t.id);
    REQUIRE(f.tracker.get_thread("curiosity")->depth == 2);
}

TEST_CASE("ExplorationTracker: strict continue on unknown thread", "[exploration]") {
    ExplorationFixture f;
    REQUIRE_THROWS_AS(f.tracker.continue_thread("nonexistent-id", "intro", "q?"), NotFoundError);
    REQUIRE(f.tracker.get_stats().total_threads == 0);
}

TEST_CASE("ExplorationTracker: start-new policy on unknown thread", "[exploration]") {
    ExplorationFixture f;
    f.tracker.set_lookup_policy(LookupPolicy::StartNewOnMiss);

    auto link = f.tracker.continue_thread("nonexistent-id", "intro_x", "Why do I dream?");
    REQUIRE(link.depth == 0);
    REQUIRE(link.introspection_id == "intro_x");

    auto t = f.tracker.get_thread(link.thread_id);
    REQUIRE(t.has_value());
    REQUIRE(t->name == "why-do-i-dream");
    REQUIRE(t->depth == 1);
}

// ── Branching ────────────────────────────────────────────────────

TEST_CASE("ExplorationTracker: branch leaves the parent untouched", "[exploration]") {
    ExplorationFixture f;
    auto parent = f.tracker.start_thread("time", "What is time?", "intro_t0");
    f.tracker.continue_thread(parent.id, "intro_t1", "Is time linear?");
    auto chain = f.tracker.get_thread_chain(parent.id);

    auto child = f.tracker.branch_thread(parent.id, chain[1].id, "cycles",
                                         "Are there cycles in time?", "intro_c0");

    REQUIRE(child.depth == 1);
    REQUIRE(child.branched_from_thread_id == std::optional<std::string>(parent.id));
    REQUIRE(child.branched_from_link_id == std::optional<std::string>(chain[1].id));

    auto after = f.tracker.get_thread(parent.id);
    REQUIRE(after->depth == 2);
    REQUIRE(after->current_introspection_id == "intro_t1");

    auto origin = f.tracker.get_thread_chain(parent.id)[1];
    REQUIRE(origin.leads_to_branches == std::vector<std::string>{child.id});
    REQUIRE(f.tracker.get_stats().branched_threads == 1);
}

TEST_CASE("ExplorationTracker: branch from a foreign link", "[exploration]") {
    ExplorationFixture f;
    auto a = f.tracker.start_thread("a", "Question A?", "intro_a");
    auto b = f.tracker.start_thread("b", "Question B?", "intro_b");
    auto b_root = f.tracker.get_thread_chain(b.id)[0];

    REQUIRE_THROWS_AS(f.tracker.branch_thread(a.id, b_root.id, "c", "Question C?", "intro_c"),
                      NotFoundError);
    REQUIRE_THROWS_AS(f.tracker.branch_thread("missing", b_root.id, "c", "Question C?", "intro_c"),
                      NotFoundError);

    f.tracker.set_lookup_policy(LookupPolicy::StartNewOnMiss);
    auto c = f.tracker.branch_thread(a.id, b_root.id, "c", "Question C?", "intro_c");
    REQUIRE_FALSE(c.branched_from_thread_id.has_value());
    REQUIRE(f.tracker.get_thread_chain(b.id)[0].leads_to_branches.empty());
}

// ── Status ───────────────────────────────────────────────────────

TEST_CASE("ExplorationTracker: status and conclusion", "[exploration]") {
    ExplorationFixture f;
    auto t = f.tracker.start_thread("meaning", "What gives meaning?", "intro_m");

    f.tracker.set_thread_status(t.id, ThreadStatus::Concluded, std::string("Connection does"));
    auto concluded = f.tracker.get_thread(t.id);
    REQUIRE(concluded->status == ThreadStatus::Concluded);
    REQUIRE(concluded->conclusion == std::optional<std::string>("Connection does"));

    // Reopening clears the conclusion
    f.tracker.set_thread_status(t.id, ThreadStatus::Active);
    REQUIRE_FALSE(f.tracker.get_thread(t.id)->conclusion.has_value());

    REQUIRE_THROWS_AS(f.tracker.set_thread_status("missing", ThreadStatus::Dormant),
                      NotFoundError);
}

// ── Queries ──────────────────────────────────────────────────────

TEST_CASE("ExplorationTracker: listing is most recently updated first", "[exploration]") {
    ExplorationFixture f;
    auto first = f.tracker.start_thread("first", "First question?", "intro_1");
    auto second = f.tracker.start_thread("second", "Second question?", "intro_2");

    auto listed = f.tracker.list_threads();
    REQUIRE(listed.size() == 2);
    REQUIRE(listed[0].id == second.id);

    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    f.tracker.continue_thread(first.id, "intro_3", "Follow-up?");
    REQUIRE(f.tracker.list_threads()[0].id == first.id);

    f.tracker.set_thread_status(second.id, ThreadStatus::Dormant);
    auto active = f.tracker.list_active_threads();
    REQUIRE(active.size() == 1);
    REQUIRE(active[0].id == first.id);
    REQUIRE(f.tracker.list_threads(ThreadStatus::Dormant).size() == 1);
    REQUIRE(f.tracker.list_threads(std::nullopt, 1).size() == 1);
}

TEST_CASE("ExplorationTracker: unknown thread chain is empty", "[exploration]") {
    ExplorationFixture f;
    REQUIRE(f.tracker.get_thread_chain("missing").empty());
    REQUIRE_FALSE(f.tracker.get_thread("missing").has_value());
}

TEST_CASE("ExplorationTracker: stats", "[exploration]") {
    ExplorationFixture f;
    REQUIRE(f.tracker.get_stats().average_depth == 0.0);

    auto a = f.tracker.start_thread("a", "A?", "intro_a");
    f.tracker.continue_thread(a.id, "intro_a1", "A1?");
    f.tracker.continue_thread(a.id, "intro_a2", "A2?");
    auto b = f.tracker.start_thread("b", "B?", "intro_b");
    f.tracker.start_thread("c", "C?", "intro_c");
    f.tracker.set_thread_status(b.id, ThreadStatus::Concluded);

    auto stats = f.tracker.get_stats();
    REQUIRE(stats.total_threads == 3);
    REQUIRE(stats.active_threads == 2);
    REQUIRE(stats.concluded_threads == 1);
    REQUIRE(stats.dormant_threads == 0);
    REQUIRE(stats.total_links == 5);
    REQUIRE(stats.average_depth == 1.7);
}

TEST_CASE("ExplorationTracker: search escapes wildcards", "[exploration]") {
    ExplorationFixture f;
    f.tracker.start_thread("percent", "Is 100% certainty possible?", "intro_p");
    f.tracker.start_thread("plain", "Is certainty possible?", "intro_q");

    REQUIRE(f.tracker.search_threads("certainty").size() == 2);
    auto hits = f.tracker.search_threads("100%");
    REQUIRE(hits.size() == 1);
    REQUIRE(hits[0].name == "percent");
    REQUIRE(f.tracker.search_threads("_").empty());
}

// ── Context ──────────────────────────────────────────────────────

TEST_CASE("ExplorationTracker: context narrative", "[exploration]") {
    ExplorationFixture f;
    auto t = f.tracker.start_thread("trust", "How is trust built?", "intro_0");
    f.tracker.continue_thread(t.id, "intro_1", "Does honesty matter most?",
                              std::string("consistency matters more"));
    f.tracker.set_thread_status(t.id, ThreadStatus::Concluded, std::string("Slowly"));

    auto ctx = f.tracker.get_thread_context("trust", false);
    REQUIRE(ctx.chain_length == 2);
    REQUIRE(ctx.questions_explored ==
            std::vector<std::string>{"How is trust built?", "Does honesty matter most?"});
    REQUIRE(ctx.narrative ==
            "Thread: trust\n"
            "Core question: How is trust built?\n"
            "Depth: 2 thoughts deep\n"
            "Status: concluded\n"
            "\nPath of inquiry:\n"
            "  * How is trust built?\n"
            "  -> Does honesty matter most?\n"
            "    (consistency matters more)\n"
            "\nConclusion reached: Slowly");
    REQUIRE(ctx.introspections.empty());
}

TEST_CASE("ExplorationTracker: context narrative shows the last five links", "[exploration]") {
    ExplorationFixture f;
    auto t = f.tracker.start_thread("long", "Q0", "intro_0");
    for (int i = 1; i < 7; i++) {
        f.tracker.continue_thread(t.id, "intro_" + std::to_string(i), "Q" + std::to_string(i));
    }

    auto ctx = f.tracker.get_thread_context(t.id, false);
    REQUIRE(ctx.recent_links.size() == 5);
    REQUIRE(ctx.recent_links.front().question == "Q2");
    REQUIRE(ctx.narrative.find("  * Q2\n  -> Q3") != std::string::npos);
    REQUIRE(ctx.narrative.find("Q1\n") == std::string::npos);
}

TEST_CASE("ExplorationTracker: context skips unavailable introspections", "[exploration]") {
    ExplorationFixture f;
    f.journal.records["intro_ok"] = {"intro_ok", "feeling calm", "noticed patience", 0.2};

    auto t = f.tracker.start_thread("calm", "Why am I calm?", "intro_ok");
    f.tracker.continue_thread(t.id, "broken_1", "Is it the weather?");
    f.tracker.continue_thread(t.id, "intro_missing", "Or the music?");

    auto ctx = f.tracker.get_thread_context(t.id);
    REQUIRE(ctx.introspections.size() == 1);
    REQUIRE(ctx.introspections[0]["introspection"]["communicating"] == "feeling calm");
    REQUIRE(ctx.introspections[0]["question"] == "Why am I calm?");
    REQUIRE(ctx.chain_length == 3);
}

TEST_CASE("ExplorationTracker: branched context notes its origin", "[exploration]") {
    ExplorationFixture f;
    auto parent = f.tracker.start_thread("root", "Root?", "intro_r");
    auto link = f.tracker.get_thread_chain(parent.id)[0];
    auto child = f.tracker.branch_thread(parent.id, link.id, "leaf", "Leaf?", "intro_l");

    auto ctx = f.tracker.get_thread_context(child.id, false);
    REQUIRE(ctx.narrative.find("(Branched from another exploration)") != std::string::npos);
    REQUIRE_THROWS_AS(f.tracker.get_thread_context("missing"), NotFoundError);
}

TEST_CASE("ExplorationTracker: data survives reopening", "[exploration]") {
    std::string path = exploration_test_path();
    std::string id;
    {
        ExplorationTracker tracker(path);
        id = tracker.start_thread("durable", "Does it persist?", "intro_d").id;
        tracker.continue_thread(id, "intro_e", "Still there?");
    }
    {
        ExplorationTracker tracker(path);
        REQUIRE(tracker.get_thread(id)->depth == 2);
        REQUIRE(tracker.get_thread_chain("durable").size() == 2);
    }
    std::filesystem::remove(path);
    std::filesystem::remove(path + "-wal");
    std::filesystem::remove(path + "-shm");
}
