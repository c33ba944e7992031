#pragma once
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace strata {

struct FallbackConfig;
class HttpClient;

// The external memory service could not answer.
class FallbackError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct FallbackResult {
    std::string id;
    std::string text;
    double score = 0.0;   // [0,1], higher is better
};

// External memory service queried when the local archive cannot answer a
// decompression or search. Results come back ranked best first; failures are
// raised as FallbackError.
class ExternalMemoryFallback {
public:
    virtual ~ExternalMemoryFallback() = default;

    virtual std::vector<FallbackResult> search(const std::string& query, size_t limit) = 0;

    virtual std::string name() const = 0;
};

// Factory over the plugin registry. Returns nullptr for backend "none".
// Throws std::invalid_argument for unknown backends.
std::unique_ptr<ExternalMemoryFallback> create_fallback(const FallbackConfig& config,
                                                        HttpClient& http);

} // namespace strata
