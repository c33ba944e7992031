#include "plugin.hpp"
#include <stdexcept>
#include <algorithm>

namespace strata {

PluginRegistry& PluginRegistry::instance() {
    static PluginRegistry registry;
    return registry;
}

void PluginRegistry::register_provider(const std::string& name, ProviderFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    providers_[name] = std::move(factory);
}

void PluginRegistry::register_fallback(const std::string& name, FallbackFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    fallbacks_[name] = std::move(factory);
}

void PluginRegistry::register_sink(const std::string& name, SinkFactory factory) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_[name] = std::move(factory);
}

std::unique_ptr<Provider> PluginRegistry::create_provider(const std::string& name,
                                                          const std::string& api_key,
                                                          HttpClient& http,
                                                          const std::string& base_url) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = providers_.find(name);
    if (it == providers_.end()) {
        throw std::invalid_argument("Unknown provider: " + name);
    }
    return it->second(api_key, http, base_url);
}

std::unique_ptr<ExternalMemoryFallback> PluginRegistry::create_fallback(
        const std::string& name, const FallbackConfig& config, HttpClient& http) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = fallbacks_.find(name);
    if (it == fallbacks_.end()) {
        throw std::invalid_argument("Unknown fallback backend: " + name);
    }
    return it->second(config, http);
}

std::unique_ptr<PersistenceSink> PluginRegistry::create_sink(
        const std::string& name, const PersistenceConfig& config) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sinks_.find(name);
    if (it == sinks_.end()) {
        throw std::invalid_argument("Unknown persistence backend: " + name);
    }
    return it->second(config);
}

template<typename Map>
static std::vector<std::string> sorted_keys(const Map& map) {
    std::vector<std::string> names;
    names.reserve(map.size());
    for (const auto& [name, _] : map) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::vector<std::string> PluginRegistry::provider_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sorted_keys(providers_);
}

std::vector<std::string> PluginRegistry::fallback_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sorted_keys(fallbacks_);
}

std::vector<std::string> PluginRegistry::sink_names() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sorted_keys(sinks_);
}

bool PluginRegistry::has_provider(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return providers_.count(name) > 0;
}

bool PluginRegistry::has_fallback(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fallbacks_.count(name) > 0;
}

bool PluginRegistry::has_sink(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sinks_.count(name) > 0;
}

void PluginRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    providers_.clear();
    fallbacks_.clear();
    sinks_.clear();
}

} // namespace strata
