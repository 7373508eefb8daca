#include <catch2/catch_test_macros.hpp>
#include "shared_state.hpp"
#include "errors.hpp"
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace engram;

static std::string shared_state_test_path() {
    return "/tmp/engram_test_shared_state_" + std::to_string(getpid()) + "/state.json";
}

struct SharedStateFixture {
    std::string path = shared_state_test_path();
    JsonFileSharedState state{path};

    ~SharedStateFixture() {
        std::filesystem::remove_all(std::filesystem::path(path).parent_path());
    }
};

TEST_CASE("JsonFileSharedState: missing file reads as empty object", "[shared_state]") {
    SharedStateFixture f;
    auto doc = f.state.read();
    REQUIRE(doc.is_object());
    REQUIRE(doc.empty());
}

TEST_CASE("JsonFileSharedState: merge replaces top-level keys and stamps", "[shared_state]") {
    SharedStateFixture f;
    f.state.merge({{"last_conversation", {{"summary", "first"}, {"topics", {"a"}}}},
                   {"daemon", "idle"}});
    f.state.merge({{"last_conversation", {{"summary", "second"}}}});

    auto doc = f.state.read();
    REQUIRE(doc["daemon"] == "idle");
    REQUIRE(doc["last_conversation"]["summary"] == "second");
    REQUIRE_FALSE(doc["last_conversation"].contains("topics"));
    REQUIRE(doc["last_updated"].is_string());
}

TEST_CASE("JsonFileSharedState: visible to a second instance", "[shared_state]") {
    SharedStateFixture f;
    f.state.merge({{"key", 42}});

    JsonFileSharedState other(f.path);
    REQUIRE(other.read()["key"] == 42);
}

TEST_CASE("JsonFileSharedState: corrupt file reads as empty and is rewritten", "[shared_state]") {
    SharedStateFixture f;
    std::filesystem::create_directories(std::filesystem::path(f.path).parent_path());
    {
        std::ofstream out(f.path);
        out << "garbage {";
    }
    REQUIRE(f.state.read().empty());

    f.state.merge({{"key", "value"}});
    REQUIRE(f.state.read()["key"] == "value");
}

TEST_CASE("JsonFileSharedState: empty path is rejected", "[shared_state]") {
    REQUIRE_THROWS_AS(JsonFileSharedState(""), ValidationError);
}

TEST_CASE("InMemorySharedState: merge and read", "[shared_state]") {
    InMemorySharedState state;
    REQUIRE(state.read().empty());
    state.merge({{"a", 1}});
    state.merge({{"b", 2}});
    auto doc = state.read();
    REQUIRE(doc["a"] == 1);
    REQUIRE(doc["b"] == 2);
    REQUIRE(doc.contains("last_updated"));
}
