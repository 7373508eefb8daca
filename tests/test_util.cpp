#include <catch2/catch_test_macros.hpp>
#include "util.hpp"
#include <filesystem>
#include <fstream>
#include <functional>
#include <limits>
#include <thread>
#include <vector>
#include <unistd.h>

using namespace engram;

// ── trim ─────────────────────────────────────────────────────────

TEST_CASE("trim: removes leading and trailing spaces", "[util]") {
    REQUIRE(trim("  hello  ") == "hello");
}

TEST_CASE("trim: removes tabs and mixed whitespace", "[util]") {
    REQUIRE(trim("\t hello \n") == "hello");
}

TEST_CASE("trim: all whitespace returns empty", "[util]") {
    REQUIRE(trim("   \t\n  ").empty());
}

// ── split ────────────────────────────────────────────────────────

TEST_CASE("split: normal delimiter", "[util]") {
    auto parts = split("a,b,c", ',');
    REQUIRE(parts == std::vector<std::string>{"a", "b", "c"});
}

TEST_CASE("split: empty parts preserved", "[util]") {
    auto parts = split("a,,b", ',');
    REQUIRE(parts == std::vector<std::string>{"a", "", "b"});
}

TEST_CASE("split: empty string", "[util]") {
    REQUIRE(split("", ',').empty());
}

// ── tokenize ─────────────────────────────────────────────────────

TEST_CASE("tokenize: lowercases and splits on punctuation", "[util]") {
    auto tokens = tokenize("Hello, World! It's 2024.");
    REQUIRE(tokens == std::vector<std::string>{"hello", "world", "it", "s", "2024"});
}

TEST_CASE("tokenize: empty and punctuation-only input", "[util]") {
    REQUIRE(tokenize("").empty());
    REQUIRE(tokenize("?!... --").empty());
}

// ── truncate / to_lower ──────────────────────────────────────────

TEST_CASE("truncate: shorter string unchanged", "[util]") {
    REQUIRE(truncate("abc", 10) == "abc");
}

TEST_CASE("truncate: cuts to max length", "[util]") {
    REQUIRE(truncate("abcdef", 3) == "abc");
}

TEST_CASE("truncate: backs off to a UTF-8 character boundary", "[util]") {
    // "é" is two bytes; cutting after its lead byte would leave it dangling
    std::string s = "ab\xC3\xA9" "cd";
    REQUIRE(truncate(s, 3) == "ab");
    REQUIRE(truncate(s, 4) == "ab\xC3\xA9");
    REQUIRE(truncate(s, 5) == "ab\xC3\xA9" "c");
}

TEST_CASE("truncate: four-byte character is kept whole or dropped", "[util]") {
    std::string s = "x\xF0\x9F\x98\x80y";
    REQUIRE(truncate(s, 1) == "x");
    REQUIRE(truncate(s, 2) == "x");
    REQUIRE(truncate(s, 4) == "x");
    REQUIRE(truncate(s, 5) == "x\xF0\x9F\x98\x80");
}

TEST_CASE("to_lower: ASCII only", "[util]") {
    REQUIRE(to_lower("MiXeD 123") == "mixed 123");
}

// ── Timestamps ───────────────────────────────────────────────────

TEST_CASE("format_timestamp: epoch zero", "[util]") {
    REQUIRE(format_timestamp(0) == "1970-01-01T00:00:00Z");
}

TEST_CASE("parse_timestamp: inverse of format_timestamp", "[util]") {
    uint64_t t = 1700000000;
    auto parsed = parse_timestamp(format_timestamp(t));
    REQUIRE(parsed.has_value());
    REQUIRE(parsed.value_or(0) == t);
}

TEST_CASE("parse_timestamp: accepts fractional seconds without zone", "[util]") {
    auto parsed = parse_timestamp("2024-03-01T12:30:45.123456");
    REQUIRE(parsed.has_value());
    REQUIRE(format_timestamp(parsed.value_or(0)) == "2024-03-01T12:30:45Z");
}

TEST_CASE("parse_timestamp: malformed input", "[util]") {
    REQUIRE_FALSE(parse_timestamp("").has_value());
    REQUIRE_FALSE(parse_timestamp("yesterday").has_value());
    REQUIRE_FALSE(parse_timestamp("2024-13-01T00:00:00").has_value());
}

TEST_CASE("days_to_seconds: saturates instead of wrapping", "[util]") {
    REQUIRE(days_to_seconds(0) == 0);
    REQUIRE(days_to_seconds(30) == 30 * 86400ULL);
    REQUIRE(days_to_seconds(std::numeric_limits<uint64_t>::max() / 86400) ==
            (std::numeric_limits<uint64_t>::max() / 86400) * 86400);
    REQUIRE(days_to_seconds(std::numeric_limits<uint64_t>::max() / 86400 + 1) ==
            std::numeric_limits<uint64_t>::max());
    REQUIRE(days_to_seconds(std::numeric_limits<uint64_t>::max()) ==
            std::numeric_limits<uint64_t>::max());
}

TEST_CASE("epoch_millis: consistent with epoch_seconds", "[util]") {
    uint64_t s = epoch_seconds();
    uint64_t ms = epoch_millis();
    REQUIRE(ms / 1000 >= s);
    REQUIRE(ms / 1000 - s <= 1);
}

// ── Ids ──────────────────────────────────────────────────────────

TEST_CASE("generate_time_id: carries prefix and is unique", "[util]") {
    auto a = generate_time_id("episode");
    auto b = generate_time_id("episode");
    REQUIRE(a.rfind("episode_", 0) == 0);
    REQUIRE(a != b);
}

TEST_CASE("generate_time_id: callable from several threads", "[util]") {
    std::vector<std::string> ids_a, ids_b;
    auto fill = [](std::vector<std::string>& out) {
        for (int i = 0; i < 500; i++) out.push_back(generate_time_id("fact"));
    };
    std::thread t1(fill, std::ref(ids_a));
    std::thread t2(fill, std::ref(ids_b));
    t1.join();
    t2.join();

    REQUIRE(ids_a.size() == 500);
    REQUIRE(ids_b.size() == 500);
    for (const auto& id : ids_a) REQUIRE(id.rfind("fact_", 0) == 0);
    for (const auto& id : ids_b) REQUIRE(id.rfind("fact_", 0) == 0);
}

// ── Files ────────────────────────────────────────────────────────

TEST_CASE("expand_home: replaces leading tilde", "[util]") {
    const char* home = std::getenv("HOME");
    REQUIRE(home != nullptr);
    REQUIRE(expand_home("~/x") == std::string(home) + "/x");
    REQUIRE(expand_home("/abs/x") == "/abs/x");
}

TEST_CASE("atomic_write_file: creates parent dirs and replaces content", "[util]") {
    std::string dir = "/tmp/engram_test_util_" + std::to_string(getpid());
    std::string path = dir + "/nested/file.txt";

    REQUIRE(atomic_write_file(path, "first"));
    REQUIRE(atomic_write_file(path, "second"));

    std::ifstream in(path);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    REQUIRE(content == "second");
    REQUIRE_FALSE(std::filesystem::exists(path + ".tmp"));

    std::filesystem::remove_all(dir);
}
