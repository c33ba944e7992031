#include "fallback.hpp"
#include "config.hpp"
#include "plugin.hpp"

namespace strata {

std::unique_ptr<ExternalMemoryFallback> create_fallback(const FallbackConfig& config,
                                                        HttpClient& http) {
    if (config.backend.empty() || config.backend == "none") return nullptr;
    return PluginRegistry::instance().create_fallback(config.backend, config, http);
}

} // namespace strata
