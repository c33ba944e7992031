#pragma once
#include "../summarizer.hpp"
#include "../config.hpp"
#include <memory>
#include <string>

namespace strata {

class Provider;

// Summaries written by an LLM provider in the configured persona's voice.
// Each call makes up to config.max_retries attempts before raising PortError.
class ProviderSummarizer : public SummarizationPort {
public:
    ProviderSummarizer(std::shared_ptr<Provider> provider, std::string model,
                       double temperature, const SummarizerConfig& config);

    std::string summarize(const std::vector<MemoryItem>& items,
                          const std::string& speaker) override;
    std::string merge(const std::vector<MemoryItem>& summaries,
                      uint32_t target_level,
                      const std::string& speaker) override;
    std::string name() const override { return "provider"; }

private:
    std::string complete(const std::string& prompt, uint32_t max_words);

    std::shared_ptr<Provider> provider_;
    std::string model_;
    double temperature_;
    SummarizerConfig config_;
};

} // namespace strata
