#include "stub_fallback.hpp"
#include "../plugin.hpp"
#include <functional>
#include <sstream>

static strata::FallbackRegistrar reg_stub("stub",
    [](const strata::FallbackConfig&, strata::HttpClient&) {
        return std::make_unique<strata::StubFallback>();
    });

namespace strata {

std::vector<FallbackResult> StubFallback::search(const std::string& query, size_t limit) {
    if (limit == 0 || query.empty()) return {};
    std::ostringstream id;
    id << "ext_" << std::hex << (std::hash<std::string>{}(query) & 0xffffffffu);
    return {{id.str(), "[External] result for " + query, 0.5}};
}

} // namespace strata
