#include <catch2/catch.hpp>
#include "config.hpp"
#include <fstream>
#include <filesystem>
#include <cstdlib>
#include <sstream>
#include <unistd.h>
#include <nlohmann/json.hpp>

using namespace strata;

// ── Default values ───────────────────────────────────────────────

TEST_CASE("Config: default values are sensible", "[config]") {
    Config cfg;
    REQUIRE(cfg.provider == "anthropic");
    REQUIRE(cfg.temperature == 0.3);
    REQUIRE(cfg.summarizer.backend == "extractive");
    REQUIRE(cfg.fallback.backend == "none");
    REQUIRE(cfg.persistence.backend == "json");
    REQUIRE(cfg.api_key_for("anthropic").empty());
}

TEST_CASE("LedgerConfig: default values", "[config]") {
    LedgerConfig lc;
    REQUIRE(lc.budget_max == 10000);
    REQUIRE(lc.l1_threshold == 5);
    REQUIRE(lc.hierarchical_threshold == 0.5);
    REQUIRE(lc.protected_tail == 2);
    REQUIRE(lc.budget_block_size == 3);
    REQUIRE(lc.validate().empty());
}

// ── LedgerConfig::validate ───────────────────────────────────────

TEST_CASE("LedgerConfig::validate: rejects degenerate settings", "[config]") {
    LedgerConfig lc;
    lc.budget_max = 0;
    REQUIRE_FALSE(lc.validate().empty());

    lc = LedgerConfig{};
    lc.l1_threshold = 0;
    REQUIRE_FALSE(lc.validate().empty());

    lc = LedgerConfig{};
    lc.hierarchical_threshold = 1.0;
    REQUIRE_FALSE(lc.validate().empty());
    lc.hierarchical_threshold = 0.0;
    REQUIRE_FALSE(lc.validate().empty());

    lc = LedgerConfig{};
    lc.budget_block_size = 1;
    REQUIRE_FALSE(lc.validate().empty());
}

TEST_CASE("LedgerConfig::validate: protected tail below two rejected", "[config]") {
    LedgerConfig lc;
    lc.protected_tail = 0;
    REQUIRE(lc.validate().find("protected_tail") != std::string::npos);
    lc.protected_tail = 1;
    REQUIRE_FALSE(lc.validate().empty());
    lc.protected_tail = 3;
    REQUIRE(lc.validate().empty());
}

// ── api_key_for / base_url_for ───────────────────────────────────

TEST_CASE("Config::api_key_for: unknown provider returns empty", "[config]") {
    Config cfg;
    cfg.providers["anthropic"].api_key = "key";
    REQUIRE(cfg.api_key_for("anthropic") == "key");
    REQUIRE(cfg.api_key_for("unknown").empty());
    REQUIRE(cfg.api_key_for("").empty());
}

TEST_CASE("Config::base_url_for: returns URL per provider", "[config]") {
    Config cfg;
    cfg.providers["ollama"].base_url = "http://ollama:11434";
    REQUIRE(cfg.base_url_for("ollama") == "http://ollama:11434");
    REQUIRE(cfg.base_url_for("anthropic").empty());
}

// ── from_json ────────────────────────────────────────────────────

TEST_CASE("Config::from_json: reads every section", "[config]") {
    auto j = nlohmann::json::parse(R"({
        "provider": "ollama",
        "model": "llama3",
        "temperature": 0.1,
        "providers": { "ollama": { "base_url": "http://gpu:11434" } },
        "ledger": { "budget_max": 500, "l1_threshold": 2, "hierarchical_threshold": 0.4,
                    "protected_tail": 3, "budget_block_size": 4, "max_ingest_chars": 800 },
        "summarizer": { "backend": "provider", "persona": "Sage", "timeout_seconds": 5 },
        "fallback": { "backend": "http", "base_url": "http://mem:8000", "limit": 3 },
        "persistence": { "backend": "sqlite", "path": "/tmp/x.db" },
        "entities": { "max_idle_seconds": 60 }
    })");
    Config cfg = Config::from_json(j);

    REQUIRE(cfg.provider == "ollama");
    REQUIRE(cfg.model == "llama3");
    REQUIRE(cfg.temperature == 0.1);
    REQUIRE(cfg.base_url_for("ollama") == "http://gpu:11434");
    REQUIRE(cfg.ledger.budget_max == 500);
    REQUIRE(cfg.ledger.l1_threshold == 2);
    REQUIRE(cfg.ledger.hierarchical_threshold == 0.4);
    REQUIRE(cfg.ledger.protected_tail == 3);
    REQUIRE(cfg.ledger.budget_block_size == 4);
    REQUIRE(cfg.ledger.max_ingest_chars == 800);
    REQUIRE(cfg.summarizer.backend == "provider");
    REQUIRE(cfg.summarizer.persona == "Sage");
    REQUIRE(cfg.summarizer.timeout_seconds == 5);
    REQUIRE(cfg.fallback.backend == "http");
    REQUIRE(cfg.fallback.base_url == "http://mem:8000");
    REQUIRE(cfg.fallback.limit == 3);
    REQUIRE(cfg.persistence.backend == "sqlite");
    REQUIRE(cfg.persistence.path == "/tmp/x.db");
    REQUIRE(cfg.entities.max_idle_seconds == 60);
}

TEST_CASE("Config::from_json: wrong types keep defaults", "[config]") {
    auto j = nlohmann::json::parse(R"({
        "model": 42,
        "ledger": { "budget_max": -5, "l1_threshold": "many" }
    })");
    Config cfg = Config::from_json(j);
    REQUIRE(cfg.model == "claude-sonnet-4-20250514");
    REQUIRE(cfg.ledger.budget_max == 10000);
    REQUIRE(cfg.ledger.l1_threshold == 5);
}

// ── merge_defaults ───────────────────────────────────────────────

TEST_CASE("merge_defaults: adds missing keys, keeps user values", "[config]") {
    auto existing = nlohmann::json::parse(R"({"ledger": {"budget_max": 42}, "custom": true})");
    auto merged = merge_defaults(existing, Config::defaults_json());

    REQUIRE(merged["ledger"]["budget_max"] == 42);
    REQUIRE(merged["ledger"]["l1_threshold"] == 5);
    REQUIRE(merged["custom"] == true);
    REQUIRE(merged.contains("summarizer"));
}

// ── Config::load ────────────────────────────────────────────────

// Helper: create a temp directory
static std::string make_temp_dir() {
    auto path = std::filesystem::temp_directory_path() / "strata_cfg_XXXXXX";
    std::string tmpl = path.string();
    char* result = mkdtemp(tmpl.data());
    return result ? std::string(result) : "";
}

// RAII guard: redirects HOME to a temp dir, clears env vars, restores on destruction
struct ConfigTestGuard {
    std::string dir;
    std::string old_home;

    ConfigTestGuard() {
        dir = make_temp_dir();
        old_home = std::getenv("HOME") ? std::getenv("HOME") : "";
        setenv("HOME", dir.c_str(), 1);
        unsetenv("ANTHROPIC_API_KEY");
        unsetenv("OLLAMA_BASE_URL");
        unsetenv("STRATA_FALLBACK_URL");
        unsetenv("STRATA_FALLBACK_API_KEY");
        unsetenv("STRATA_PERSISTENCE_PATH");
    }

    ~ConfigTestGuard() {
        setenv("HOME", old_home.c_str(), 1);
        std::filesystem::remove_all(dir);
    }

    ConfigTestGuard(const ConfigTestGuard&) = delete;
    ConfigTestGuard& operator=(const ConfigTestGuard&) = delete;

    std::string config_path() const { return dir + "/.strata/config.json"; }

    void write_config(const std::string& content) {
        std::filesystem::create_directories(dir + "/.strata");
        std::ofstream f(config_path());
        f << content;
    }

    std::string read_config() const {
        std::ifstream f(config_path());
        std::stringstream ss;
        ss << f.rdbuf();
        return ss.str();
    }
};

TEST_CASE("Config::load: reads config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({
        "providers": { "anthropic": { "api_key": "sk-file-ant" } },
        "ledger": { "budget_max": 2000, "l1_threshold": 3 },
        "persistence": { "backend": "none" }
    })");

    Config cfg = Config::load();
    REQUIRE(cfg.api_key_for("anthropic") == "sk-file-ant");
    REQUIRE(cfg.ledger.budget_max == 2000);
    REQUIRE(cfg.ledger.l1_threshold == 3);
    REQUIRE(cfg.persistence.backend == "none");
}

TEST_CASE("Config::load: env vars override config file", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"fallback": {"base_url": "http://file"}})");
    setenv("STRATA_FALLBACK_URL", "http://env", 1);
    setenv("STRATA_FALLBACK_API_KEY", "tok", 1);
    setenv("STRATA_PERSISTENCE_PATH", "/tmp/elsewhere", 1);

    Config cfg = Config::load();
    REQUIRE(cfg.fallback.base_url == "http://env");
    REQUIRE(cfg.fallback.api_key == "tok");
    REQUIRE(cfg.persistence.path == "/tmp/elsewhere");

    unsetenv("STRATA_FALLBACK_URL");
    unsetenv("STRATA_FALLBACK_API_KEY");
    unsetenv("STRATA_PERSISTENCE_PATH");
}

TEST_CASE("Config::load: malformed JSON falls back to defaults", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config("not valid json {{{");

    Config cfg = Config::load();
    REQUIRE(cfg.provider == "anthropic");
    REQUIRE(cfg.ledger.budget_max == 10000);
}

TEST_CASE("Config::load: invalid ledger settings are replaced", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"ledger": {"budget_max": 0, "l1_threshold": 9}})");

    Config cfg = Config::load();
    REQUIRE(cfg.ledger.budget_max == 10000);
    REQUIRE(cfg.ledger.l1_threshold == 5);
}

// ── Default config creation and migration ────────────────────────

TEST_CASE("Config::load: missing file creates default config", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    Config cfg = Config::load();
    REQUIRE(cfg.ledger.budget_max == 10000);
    REQUIRE(std::filesystem::exists(g.config_path()));

    auto j = nlohmann::json::parse(g.read_config());
    REQUIRE(j["ledger"]["l1_threshold"] == 5);
    REQUIRE(j["summarizer"]["backend"] == "extractive");
}

TEST_CASE("Config::load: migrates partial config with new defaults", "[config]") {
    ConfigTestGuard g;
    REQUIRE_FALSE(g.dir.empty());

    g.write_config(R"({"ledger": {"budget_max": 777}})");
    Config::load();

    auto j = nlohmann::json::parse(g.read_config());
    REQUIRE(j["ledger"]["budget_max"] == 777);
    REQUIRE(j["ledger"]["protected_tail"] == 2);
    REQUIRE(j.contains("fallback"));
}
