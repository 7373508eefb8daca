#include <catch2/catch_test_macros.hpp>
#include "index/sqlite_index.hpp"
#include "errors.hpp"
#include <filesystem>
#include <unistd.h>

using namespace engram;

static std::string sqlite_test_path() {
    return "/tmp/engram_test_sqlite_index_" + std::to_string(getpid()) + ".db";
}

struct SqliteIndexFixture {
    std::string path = sqlite_test_path();
    SqliteIndex index{path, "semantic"};

    ~SqliteIndexFixture() {
        std::filesystem::remove(path);
        std::filesystem::remove(path + "-wal");
        std::filesystem::remove(path + "-shm");
    }
};

// ── add / get ────────────────────────────────────────────────────

TEST_CASE("SqliteIndex: add and get", "[sqlite_index]") {
    SqliteIndexFixture f;
    f.index.add("a", "Python is my favorite language", {{"tier", "semantic"}});

    auto recs = f.index.get({"a"});
    REQUIRE(recs.size() == 1);
    REQUIRE(recs[0].id == "a");
    REQUIRE(recs[0].text == "Python is my favorite language");
    REQUIRE(recs[0].metadata["tier"] == "semantic");
    REQUIRE(f.index.count() == 1);
}

TEST_CASE("SqliteIndex: get skips unknown ids and keeps request order", "[sqlite_index]") {
    SqliteIndexFixture f;
    f.index.add("a", "first", {});
    f.index.add("b", "second", {});

    auto recs = f.index.get({"b", "missing", "a"});
    REQUIRE(recs.size() == 2);
    REQUIRE(recs[0].id == "b");
    REQUIRE(recs[1].id == "a");
}

TEST_CASE("SqliteIndex: duplicate id is rejected", "[sqlite_index]") {
    SqliteIndexFixture f;
    f.index.add("a", "first", {});
    REQUIRE_THROWS_AS(f.index.add("a", "again", {}), ValidationError);
    REQUIRE(f.index.count() == 1);
}

TEST_CASE("SqliteIndex: unserializable metadata is a validation error", "[sqlite_index]") {
    SqliteIndexFixture f;
    REQUIRE_THROWS_AS(f.index.add("a", "text", {{"note", std::string("bad \xC3")}}),
                      ValidationError);
    REQUIRE(f.index.count() == 0);

    f.index.add("b", "text", {});
    REQUIRE_THROWS_AS(f.index.update("b", {{"note", std::string("bad \xC3")}}),
                      ValidationError);
    REQUIRE_FALSE(f.index.get({"b"})[0].metadata.contains("note"));
}

TEST_CASE("SqliteIndex: empty id is rejected", "[sqlite_index]") {
    SqliteIndexFixture f;
    REQUIRE_THROWS_AS(f.index.add("", "text", {}), ValidationError);
}

// ── query ────────────────────────────────────────────────────────

TEST_CASE("SqliteIndex: query ranks matching records", "[sqlite_index]") {
    SqliteIndexFixture f;
    f.index.add("lang", "Python is my favorite language", {});
    f.index.add("food", "Pizza is great", {});
    f.index.add("hobby", "Reading books about Python and Python tooling", {});

    auto results = f.index.query("python", 10, {});
    REQUIRE(results.size() == 2);
    for (const auto& r : results) {
        REQUIRE(r.id != "food");
        REQUIRE(r.score > 0.0);
    }
}

TEST_CASE("SqliteIndex: query respects k", "[sqlite_index]") {
    SqliteIndexFixture f;
    for (int i = 0; i < 10; i++) {
        f.index.add("item" + std::to_string(i), "matching content", {});
    }
    REQUIRE(f.index.query("matching", 3, {}).size() == 3);
    REQUIRE(f.index.query("matching", 0, {}).empty());
}

TEST_CASE("SqliteIndex: query applies where filter on nested metadata", "[sqlite_index]") {
    SqliteIndexFixture f;
    f.index.add("a", "tea is good", {{"tier", "semantic"}, {"metadata", {{"category", "user_fact"}}}});
    f.index.add("b", "tea is fine", {{"tier", "semantic"}, {"metadata", {{"category", "technical"}}}});

    auto results = f.index.query("tea", 10, {{"metadata.category", "technical"}});
    REQUIRE(results.size() == 1);
    REQUIRE(results[0].id == "b");
}

TEST_CASE("SqliteIndex: where filter on booleans and numbers", "[sqlite_index]") {
    SqliteIndexFixture f;
    f.index.add("a", "note one", {{"flag", true}, {"n", 3}});
    f.index.add("b", "note two", {{"flag", false}, {"n", 4}});

    auto flagged = f.index.list({{"flag", true}}, 0);
    REQUIRE(flagged.size() == 1);
    REQUIRE(flagged[0].id == "a");

    auto four = f.index.list({{"n", 4}}, 0);
    REQUIRE(four.size() == 1);
    REQUIRE(four[0].id == "b");
}

TEST_CASE("SqliteIndex: FTS operators in queries are literal", "[sqlite_index]") {
    SqliteIndexFixture f;
    f.index.add("a", "cats AND dogs", {});
    REQUIRE_NOTHROW(f.index.query("NOT \"cats\" AND (", 5, {}));
    REQUIRE_FALSE(f.index.query("cats AND", 5, {}).empty());
}

TEST_CASE("SqliteIndex: substring fallback when no token matches", "[sqlite_index]") {
    SqliteIndexFixture f;
    f.index.add("a", "configuration", {});
    auto results = f.index.query("figur", 5, {});
    REQUIRE(results.size() == 1);
    REQUIRE(results[0].id == "a");
}

TEST_CASE("SqliteIndex: empty query returns newest first", "[sqlite_index]") {
    SqliteIndexFixture f;
    f.index.add("old", "one", {});
    f.index.add("new", "two", {});
    auto results = f.index.query("", 1, {});
    REQUIRE(results.size() == 1);
    REQUIRE(results[0].id == "new");
}

TEST_CASE("SqliteIndex: no match returns empty, not an error", "[sqlite_index]") {
    SqliteIndexFixture f;
    f.index.add("a", "something", {});
    REQUIRE(f.index.query("dog", 5, {}).empty());
}

// ── list / update / remove ───────────────────────────────────────

TEST_CASE("SqliteIndex: list in insertion order with limit", "[sqlite_index]") {
    SqliteIndexFixture f;
    f.index.add("a", "1", {});
    f.index.add("b", "2", {});
    f.index.add("c", "3", {});

    auto all = f.index.list({}, 0);
    REQUIRE(all.size() == 3);
    REQUIRE(all[0].id == "a");
    REQUIRE(all[2].id == "c");
    REQUIRE(f.index.list({}, 2).size() == 2);
}

TEST_CASE("SqliteIndex: update merges top-level keys", "[sqlite_index]") {
    SqliteIndexFixture f;
    f.index.add("a", "text", {{"importance", 0.5}, {"source", "chat"}});

    REQUIRE(f.index.update("a", {{"importance", 0.9}}));
    auto rec = f.index.get({"a"});
    REQUIRE(rec.size() == 1);
    REQUIRE(rec[0].metadata["importance"] == 0.9);
    REQUIRE(rec[0].metadata["source"] == "chat");
    REQUIRE(rec[0].text == "text");
}

TEST_CASE("SqliteIndex: update unknown id returns false", "[sqlite_index]") {
    SqliteIndexFixture f;
    REQUIRE_FALSE(f.index.update("missing", {{"x", 1}}));
}

TEST_CASE("SqliteIndex: remove deletes and unindexes", "[sqlite_index]") {
    SqliteIndexFixture f;
    f.index.add("a", "unique walrus", {});
    f.index.add("b", "other", {});

    REQUIRE(f.index.remove({"a", "missing"}) == 1);
    REQUIRE(f.index.count() == 1);
    REQUIRE(f.index.query("walrus", 5, {}).empty());
}

// ── Collections and persistence ──────────────────────────────────

TEST_CASE("SqliteIndex: collections in one file are isolated", "[sqlite_index]") {
    SqliteIndexFixture f;
    SqliteIndex other(f.path, "episodic");

    f.index.add("a", "shared words here", {});
    other.add("a", "shared words there", {});

    REQUIRE(f.index.count() == 1);
    REQUIRE(other.count() == 1);
    REQUIRE(f.index.query("shared", 5, {}).size() == 1);
    REQUIRE(other.get({"a"})[0].text == "shared words there");
}

TEST_CASE("SqliteIndex: data survives reopen", "[sqlite_index]") {
    SqliteIndexFixture f;
    f.index.add("a", "persistent fact", {{"k", "v"}});
    {
        SqliteIndex reopened(f.path, "semantic");
        auto recs = reopened.get({"a"});
        REQUIRE(recs.size() == 1);
        REQUIRE(recs[0].metadata["k"] == "v");
        REQUIRE(reopened.query("persistent", 5, {}).size() == 1);
    }
}
