#pragma once
#include "provider.hpp"
#include "fallback.hpp"
#include "persistence.hpp"
#include "http.hpp"
#include "config.hpp"
#include <string>
#include <vector>
#include <memory>
#include <functional>
#include <unordered_map>
#include <mutex>

namespace strata {

// Factory function types
using ProviderFactory = std::function<std::unique_ptr<Provider>(
    const std::string& api_key, HttpClient& http, const std::string& base_url)>;

using FallbackFactory = std::function<std::unique_ptr<ExternalMemoryFallback>(
    const FallbackConfig& config, HttpClient& http)>;

using SinkFactory = std::function<std::unique_ptr<PersistenceSink>(
    const PersistenceConfig& config)>;

// Central registry for self-registering plugins.
// All methods are thread-safe.
class PluginRegistry {
public:
    static PluginRegistry& instance();

    // Registration
    void register_provider(const std::string& name, ProviderFactory factory);
    void register_fallback(const std::string& name, FallbackFactory factory);
    void register_sink(const std::string& name, SinkFactory factory);

    // Creation (throw std::invalid_argument for unknown names)
    std::unique_ptr<Provider> create_provider(const std::string& name,
                                              const std::string& api_key,
                                              HttpClient& http,
                                              const std::string& base_url) const;

    std::unique_ptr<ExternalMemoryFallback> create_fallback(const std::string& name,
                                                            const FallbackConfig& config,
                                                            HttpClient& http) const;

    std::unique_ptr<PersistenceSink> create_sink(const std::string& name,
                                                 const PersistenceConfig& config) const;

    // Query
    std::vector<std::string> provider_names() const;
    std::vector<std::string> fallback_names() const;
    std::vector<std::string> sink_names() const;
    bool has_provider(const std::string& name) const;
    bool has_fallback(const std::string& name) const;
    bool has_sink(const std::string& name) const;

    // Testing support
    void clear();

private:
    PluginRegistry() = default;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, ProviderFactory> providers_;
    std::unordered_map<std::string, FallbackFactory> fallbacks_;
    std::unordered_map<std::string, SinkFactory> sinks_;
};

// ── Self-registrar helpers (used at file scope in each plugin .cpp) ──

struct ProviderRegistrar {
    ProviderRegistrar(const std::string& name, ProviderFactory factory) {
        PluginRegistry::instance().register_provider(name, std::move(factory));
    }
};

struct FallbackRegistrar {
    FallbackRegistrar(const std::string& name, FallbackFactory factory) {
        PluginRegistry::instance().register_fallback(name, std::move(factory));
    }
};

struct SinkRegistrar {
    SinkRegistrar(const std::string& name, SinkFactory factory) {
        PluginRegistry::instance().register_sink(name, std::move(factory));
    }
};

} // namespace strata
