#include <catch2/catch.hpp>
#include "persistence/sqlite_sink.hpp"
#include <filesystem>
#include <unistd.h>

using namespace strata;

static std::string sqlite_test_path() {
    return "/tmp/strata_test_sqlite_" + std::to_string(getpid()) + ".db";
}

struct SqliteFixture {
    std::string path = sqlite_test_path();
    SqliteSink sink{path};

    ~SqliteFixture() {
        std::filesystem::remove(path);
        std::filesystem::remove(path + "-wal");
        std::filesystem::remove(path + "-shm");
    }
};

static nlohmann::json item(const std::string& id, int level, const std::string& text) {
    nlohmann::json j = {{"id", id}, {"kind", level == 0 ? "raw" : "summary"},
                        {"level", level}, {"text", text}, {"created_at", 1}};
    if (level > 0) j["covers"] = {"msg_1", "msg_2"};
    return j;
}

static nlohmann::json state_with(const nlohmann::json& archive) {
    return {{"version", 1}, {"ledger", nlohmann::json::array()}, {"archive", archive}};
}

// ── Snapshots ────────────────────────────────────────────────

TEST_CASE("SqliteSink: snapshot then load", "[sqlite_sink]") {
    SqliteFixture f;
    auto state = state_with({item("msg_1", 0, "hello")});
    REQUIRE(f.sink.snapshot("lucie", state));

    auto loaded = f.sink.load("lucie");
    REQUIRE(loaded.has_value());
    REQUIRE(*loaded == state);
}

TEST_CASE("SqliteSink: snapshot replaces per entity", "[sqlite_sink]") {
    SqliteFixture f;
    REQUIRE(f.sink.snapshot("lucie", state_with({item("msg_1", 0, "one")})));
    REQUIRE(f.sink.snapshot("lucie", state_with({item("msg_1", 0, "one"),
                                                 item("msg_2", 0, "two")})));
    REQUIRE(f.sink.snapshot("marc", state_with({item("msg_9", 0, "other")})));

    REQUIRE((*f.sink.load("lucie"))["archive"].size() == 2);
    REQUIRE((*f.sink.load("marc"))["archive"].size() == 1);
    REQUIRE_FALSE(f.sink.load("nobody").has_value());
}

// ── Archive mirror ───────────────────────────────────────────

TEST_CASE("SqliteSink: archive rows are append-only per entity", "[sqlite_sink]") {
    SqliteFixture f;
    REQUIRE(f.sink.snapshot("lucie", state_with({item("msg_1", 0, "a"),
                                                 item("msg_2", 0, "b")})));
    REQUIRE(f.sink.snapshot("lucie", state_with({item("msg_1", 0, "a"),
                                                 item("msg_2", 0, "b"),
                                                 item("l1_x", 1, "ab")})));

    REQUIRE(f.sink.archived_count("lucie") == 3);
    REQUIRE(f.sink.archived_count("lucie", 0) == 2);
    REQUIRE(f.sink.archived_count("lucie", 1) == 1);
    REQUIRE(f.sink.archived_count("marc") == 0);
}

TEST_CASE("SqliteSink: reopening keeps data", "[sqlite_sink]") {
    std::string path = sqlite_test_path() + ".reopen";
    {
        SqliteSink sink(path);
        REQUIRE(sink.snapshot("lucie", state_with({item("msg_1", 0, "kept")})));
    }
    {
        SqliteSink sink(path);
        auto loaded = sink.load("lucie");
        REQUIRE(loaded.has_value());
        REQUIRE((*loaded)["archive"][0]["text"] == "kept");
        REQUIRE(sink.backend_name() == "sqlite");
    }
    std::filesystem::remove(path);
    std::filesystem::remove(path + "-wal");
    std::filesystem::remove(path + "-shm");
}
