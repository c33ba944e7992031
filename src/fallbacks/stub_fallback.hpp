#pragma once
#include "../fallback.hpp"

namespace strata {

// Deterministic stand-in for a semantic memory service: one synthetic result
// per query, id derived from the query text.
class StubFallback : public ExternalMemoryFallback {
public:
    std::vector<FallbackResult> search(const std::string& query, size_t limit) override;
    std::string name() const override { return "stub"; }
};

} // namespace strata
