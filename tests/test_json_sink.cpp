#include <catch2/catch.hpp>
#include "persistence/json_sink.hpp"
#include "persistence/none_sink.hpp"
#include "config.hpp"
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace strata;

struct JsonSinkFixture {
    std::string dir = "/tmp/strata_test_json_sink_" + std::to_string(getpid());
    JsonFileSink sink{dir};

    ~JsonSinkFixture() { std::filesystem::remove_all(dir); }
};

static nlohmann::json sample_state(const std::string& text) {
    return {{"version", 1}, {"ledger", nlohmann::json::array()},
            {"archive", {{{"id", "msg_1"}, {"kind", "raw"}, {"text", text}}}}};
}

// ── encode_entity_id ─────────────────────────────────────────────

TEST_CASE("encode_entity_id: keeps safe chars, escapes the rest", "[persistence]") {
    REQUIRE(encode_entity_id("lucie-01.main_x") == "lucie-01.main_x");
    REQUIRE(encode_entity_id("../etc/passwd") == "..%2Fetc%2Fpasswd");
    REQUIRE(encode_entity_id("a b/c") == "a%20b%2Fc");
    REQUIRE(encode_entity_id("100%") == "100%25");
    REQUIRE(encode_entity_id("..") == "%2E%2E");
    REQUIRE(encode_entity_id(".") == "%2E");
    REQUIRE(encode_entity_id("") == "%");
}

TEST_CASE("encode_entity_id: ids that differ only in escaped bytes stay distinct", "[persistence]") {
    REQUIRE(encode_entity_id("team/alice") != encode_entity_id("team_alice"));
    REQUIRE(encode_entity_id("team%2Falice") != encode_entity_id("team/alice"));
}

// ── JsonFileSink ─────────────────────────────────────────────────

TEST_CASE("JsonFileSink: snapshot then load", "[persistence]") {
    JsonSinkFixture f;
    REQUIRE(f.sink.snapshot("lucie", sample_state("hello")));
    REQUIRE(std::filesystem::exists(f.dir + "/lucie.json"));

    auto loaded = f.sink.load("lucie");
    REQUIRE(loaded.has_value());
    REQUIRE((*loaded)["archive"][0]["text"] == "hello");
}

TEST_CASE("JsonFileSink: later snapshot replaces earlier", "[persistence]") {
    JsonSinkFixture f;
    REQUIRE(f.sink.snapshot("lucie", sample_state("one")));
    REQUIRE(f.sink.snapshot("lucie", sample_state("two")));
    REQUIRE((*f.sink.load("lucie"))["archive"][0]["text"] == "two");
}

TEST_CASE("JsonFileSink: unknown entity loads nothing", "[persistence]") {
    JsonSinkFixture f;
    REQUIRE_FALSE(f.sink.load("nobody").has_value());
}

TEST_CASE("JsonFileSink: corrupt file loads nothing", "[persistence]") {
    JsonSinkFixture f;
    std::filesystem::create_directories(f.dir);
    {
        std::ofstream out(f.sink.path_for("lucie"));
        out << "{ not json";
    }
    REQUIRE_FALSE(f.sink.load("lucie").has_value());
}

TEST_CASE("JsonFileSink: entity ids cannot escape the directory", "[persistence]") {
    JsonSinkFixture f;
    REQUIRE(f.sink.path_for("../x") == f.dir + "/..%2Fx.json");
    REQUIRE(f.sink.path_for("..") == f.dir + "/%2E%2E.json");
}

TEST_CASE("JsonFileSink: similar entity ids keep separate snapshots", "[persistence][json_sink]") {
    JsonSinkFixture f;
    REQUIRE(f.sink.snapshot("team/alice", sample_state("slash")));
    REQUIRE(f.sink.snapshot("team_alice", sample_state("underscore")));

    REQUIRE((*f.sink.load("team/alice"))["archive"][0]["text"] == "slash");
    REQUIRE((*f.sink.load("team_alice"))["archive"][0]["text"] == "underscore");
}

// ── NoneSink and factory ─────────────────────────────────────────

TEST_CASE("NoneSink: accepts snapshots, never returns one", "[persistence]") {
    NoneSink sink;
    REQUIRE(sink.snapshot("lucie", sample_state("x")));
    REQUIRE_FALSE(sink.load("lucie").has_value());
}

TEST_CASE("create_sink: builds configured backend", "[persistence]") {
    PersistenceConfig cfg;
    cfg.backend = "json";
    cfg.path = "/tmp/strata_test_sink_factory_" + std::to_string(getpid());
    auto json = create_sink(cfg);
    REQUIRE(json->backend_name() == "json");

    cfg.backend = "none";
    REQUIRE(create_sink(cfg)->backend_name() == "none");

    cfg.backend = "carrier-pigeon";
    REQUIRE_THROWS_AS(create_sink(cfg), std::invalid_argument);
}
