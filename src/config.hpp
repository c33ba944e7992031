#pragma once
#include <string>
#include <cstdint>
#include <unordered_map>
#include <nlohmann/json.hpp>

namespace strata {

struct ProviderEntry {
    std::string api_key;
    std::string base_url;
};

// Budget and rule thresholds for one ledger.
struct LedgerConfig {
    uint32_t budget_max = 10000;          // target ceiling on active chars
    uint32_t l1_threshold = 5;            // raw items per level-1 summary
    double hierarchical_threshold = 0.5;  // summary ratio that triggers MergeUp
    uint32_t protected_tail = 2;          // most recent raw items never summarized
    uint32_t budget_block_size = 3;       // max raw items per BudgetReplace
    uint32_t max_ingest_chars = 20000;    // larger ingestions are rejected

    // Returns an empty string when valid, otherwise the reason.
    std::string validate() const;
};

struct SummarizerConfig {
    std::string backend = "extractive";   // "extractive" or "provider"
    std::string persona = "Algareth";
    uint32_t timeout_seconds = 60;        // 0 = no timeout
    uint32_t l1_max_words = 80;
    uint32_t merge_max_words = 60;
    uint32_t max_retries = 2;
};

struct FallbackConfig {
    std::string backend = "none";         // "none", "stub" or "http"
    std::string base_url;
    std::string api_key;
    uint32_t timeout_seconds = 10;
    uint32_t limit = 5;
};

struct PersistenceConfig {
    std::string backend = "json";         // "json", "sqlite" or "none"
    std::string path;                     // empty = backend default under ~/.strata
};

struct EntityConfig {
    uint64_t max_idle_seconds = 3600;
};

struct Config {
    std::string provider = "anthropic";
    std::string model = "claude-sonnet-4-20250514";
    double temperature = 0.3;

    std::unordered_map<std::string, ProviderEntry> providers;

    LedgerConfig ledger;
    SummarizerConfig summarizer;
    FallbackConfig fallback;
    PersistenceConfig persistence;
    EntityConfig entities;

    // Load from ~/.strata/config.json + env vars
    static Config load();

    // Parse an already-merged config object (used by load() and tests)
    static Config from_json(const nlohmann::json& j);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Apply environment variable overrides in place
    void apply_env();

    std::string api_key_for(const std::string& provider) const;
    std::string base_url_for(const std::string& provider) const;
};

// Recursively add keys from defaults that are missing in existing.
nlohmann::json merge_defaults(const nlohmann::json& existing,
                              const nlohmann::json& defaults);

} // namespace strata
