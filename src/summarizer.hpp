#pragma once
#include "memory_item.hpp"
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace strata {

struct SummarizerConfig;
class Provider;

// A summarize/merge call failed, timed out, or produced unusable output.
class PortError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Contract to the text-generation backend. Implementations never mutate the
// inputs and report every failure as PortError, never as an empty success.
class SummarizationPort {
public:
    virtual ~SummarizationPort() = default;

    // Bounded summary of raw items, naming speaker.
    virtual std::string summarize(const std::vector<MemoryItem>& items,
                                  const std::string& speaker) = 0;

    // Shorter synthesis of same-level summaries for target_level.
    virtual std::string merge(const std::vector<MemoryItem>& summaries,
                              uint32_t target_level,
                              const std::string& speaker) = 0;

    virtual std::string name() const = 0;
};

// Builds the configured backend ("extractive" or "provider"), wrapped in a
// TimeoutSummarizer when timeout_seconds > 0. provider may be null for the
// extractive backend. Throws std::invalid_argument for unknown backends or a
// missing provider.
std::shared_ptr<SummarizationPort> create_summarizer(const SummarizerConfig& config,
                                                     std::shared_ptr<Provider> provider,
                                                     const std::string& model,
                                                     double temperature);

} // namespace strata
