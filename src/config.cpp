#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>

namespace strata {

std::string LedgerConfig::validate() const {
    if (budget_max == 0) return "ledger.budget_max must be > 0";
    if (l1_threshold == 0) return "ledger.l1_threshold must be > 0";
    if (!(hierarchical_threshold > 0.0 && hierarchical_threshold < 1.0))
        return "ledger.hierarchical_threshold must be in (0,1)";
    if (protected_tail < 2) return "ledger.protected_tail must be >= 2";
    if (budget_block_size < 2) return "ledger.budget_block_size must be >= 2";
    if (max_ingest_chars == 0) return "ledger.max_ingest_chars must be > 0";
    return {};
}

nlohmann::json Config::defaults_json() {
    return {
        {"provider", "anthropic"},
        {"model", "claude-sonnet-4-20250514"},
        {"temperature", 0.3},
        {"providers", {
            {"anthropic", {{"api_key", ""}}},
            {"ollama", {{"base_url", "http://localhost:11434"}}}
        }},
        {"ledger", {
            {"budget_max", 10000},
            {"l1_threshold", 5},
            {"hierarchical_threshold", 0.5},
            {"protected_tail", 2},
            {"budget_block_size", 3},
            {"max_ingest_chars", 20000}
        }},
        {"summarizer", {
            {"backend", "extractive"},
            {"persona", "Algareth"},
            {"timeout_seconds", 60},
            {"l1_max_words", 80},
            {"merge_max_words", 60},
            {"max_retries", 2}
        }},
        {"fallback", {
            {"backend", "none"},
            {"base_url", ""},
            {"api_key", ""},
            {"timeout_seconds", 10},
            {"limit", 5}
        }},
        {"persistence", {
            {"backend", "json"},
            {"path", ""}
        }},
        {"entities", {
            {"max_idle_seconds", 3600}
        }}
    };
}

nlohmann::json merge_defaults(const nlohmann::json& existing,
                              const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

// Small typed readers: only overwrite the target when the JSON type matches.
static void read_string(const nlohmann::json& obj, const char* key, std::string& out) {
    if (obj.contains(key) && obj[key].is_string()) out = obj[key].get<std::string>();
}

template<typename T>
static void read_unsigned(const nlohmann::json& obj, const char* key, T& out) {
    if (obj.contains(key) && obj[key].is_number_unsigned()) out = obj[key].get<T>();
}

static void read_double(const nlohmann::json& obj, const char* key, double& out) {
    if (obj.contains(key) && obj[key].is_number()) out = obj[key].get<double>();
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;

    read_string(j, "provider", cfg.provider);
    read_string(j, "model", cfg.model);
    read_double(j, "temperature", cfg.temperature);

    if (j.contains("providers") && j["providers"].is_object()) {
        for (auto& [name, obj] : j["providers"].items()) {
            if (!obj.is_object()) continue;
            ProviderEntry entry;
            read_string(obj, "api_key", entry.api_key);
            read_string(obj, "base_url", entry.base_url);
            cfg.providers[name] = std::move(entry);
        }
    }

    if (j.contains("ledger") && j["ledger"].is_object()) {
        const auto& l = j["ledger"];
        read_unsigned(l, "budget_max", cfg.ledger.budget_max);
        read_unsigned(l, "l1_threshold", cfg.ledger.l1_threshold);
        read_double(l, "hierarchical_threshold", cfg.ledger.hierarchical_threshold);
        read_unsigned(l, "protected_tail", cfg.ledger.protected_tail);
        read_unsigned(l, "budget_block_size", cfg.ledger.budget_block_size);
        read_unsigned(l, "max_ingest_chars", cfg.ledger.max_ingest_chars);
    }

    if (j.contains("summarizer") && j["summarizer"].is_object()) {
        const auto& s = j["summarizer"];
        read_string(s, "backend", cfg.summarizer.backend);
        read_string(s, "persona", cfg.summarizer.persona);
        read_unsigned(s, "timeout_seconds", cfg.summarizer.timeout_seconds);
        read_unsigned(s, "l1_max_words", cfg.summarizer.l1_max_words);
        read_unsigned(s, "merge_max_words", cfg.summarizer.merge_max_words);
        read_unsigned(s, "max_retries", cfg.summarizer.max_retries);
    }

    if (j.contains("fallback") && j["fallback"].is_object()) {
        const auto& f = j["fallback"];
        read_string(f, "backend", cfg.fallback.backend);
        read_string(f, "base_url", cfg.fallback.base_url);
        read_string(f, "api_key", cfg.fallback.api_key);
        read_unsigned(f, "timeout_seconds", cfg.fallback.timeout_seconds);
        read_unsigned(f, "limit", cfg.fallback.limit);
    }

    if (j.contains("persistence") && j["persistence"].is_object()) {
        const auto& p = j["persistence"];
        read_string(p, "backend", cfg.persistence.backend);
        read_string(p, "path", cfg.persistence.path);
    }

    if (j.contains("entities") && j["entities"].is_object()) {
        read_unsigned(j["entities"], "max_idle_seconds", cfg.entities.max_idle_seconds);
    }

    return cfg;
}

Config Config::load() {
    std::string config_path = expand_home("~/.strata/config.json");
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original && atomic_write_file(config_path, j.dump(4) + "\n")) {
                std::cerr << "[config] Migrated config with new defaults: "
                          << config_path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Ignoring malformed " << config_path
                      << ": " << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n")) {
            std::cerr << "[config] Created default config: " << config_path << "\n";
        }
    }

    Config cfg = from_json(j);
    cfg.apply_env();

    std::string err = cfg.ledger.validate();
    if (!err.empty()) {
        std::cerr << "[config] " << err << "; using default ledger settings\n";
        cfg.ledger = LedgerConfig{};
    }
    return cfg;
}

void Config::apply_env() {
    // Environment variables always override config file
    if (const char* v = std::getenv("ANTHROPIC_API_KEY"))
        providers["anthropic"].api_key = v;
    if (const char* v = std::getenv("OLLAMA_BASE_URL"))
        providers["ollama"].base_url = v;
    if (const char* v = std::getenv("STRATA_FALLBACK_URL"))
        fallback.base_url = v;
    if (const char* v = std::getenv("STRATA_FALLBACK_API_KEY"))
        fallback.api_key = v;
    if (const char* v = std::getenv("STRATA_PERSISTENCE_PATH"))
        persistence.path = v;
}

std::string Config::api_key_for(const std::string& prov) const {
    auto it = providers.find(prov);
    if (it != providers.end()) return it->second.api_key;
    return {};
}

std::string Config::base_url_for(const std::string& prov) const {
    auto it = providers.find(prov);
    if (it != providers.end()) return it->second.base_url;
    return {};
}

} // namespace strata
