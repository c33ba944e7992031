#pragma once
#include "../fallback.hpp"
#include "../http.hpp"
#include <string>

namespace strata {

// JSON-over-HTTP memory service: POST {base_url}/search {"query","limit"}.
// Accepts {"results":[...]} or a bare array of {id, memory|content|text, score}.
class HttpFallback : public ExternalMemoryFallback {
public:
    HttpFallback(std::string base_url, std::string api_key, HttpClient& http,
                 long timeout_seconds = 10);

    std::vector<FallbackResult> search(const std::string& query, size_t limit) override;
    std::string name() const override { return "http"; }

private:
    std::string base_url_;
    std::string api_key_;
    HttpClient& http_;
    long timeout_seconds_;
};

} // namespace strata
