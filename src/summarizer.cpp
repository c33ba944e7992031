#include "summarizer.hpp"
#include "config.hpp"
#include "provider.hpp"
#include "summarizers/extractive.hpp"
#include "summarizers/provider_summarizer.hpp"
#include "summarizers/timeout.hpp"

namespace strata {

std::shared_ptr<SummarizationPort> create_summarizer(const SummarizerConfig& config,
                                                     std::shared_ptr<Provider> provider,
                                                     const std::string& model,
                                                     double temperature) {
    std::shared_ptr<SummarizationPort> port;
    if (config.backend == "extractive") {
        port = std::make_shared<ExtractiveSummarizer>(config.l1_max_words,
                                                      config.merge_max_words);
    } else if (config.backend == "provider") {
        if (!provider) {
            throw std::invalid_argument("summarizer backend 'provider' needs a provider");
        }
        port = std::make_shared<ProviderSummarizer>(std::move(provider), model,
                                                    temperature, config);
    } else {
        throw std::invalid_argument("Unknown summarizer backend: " + config.backend);
    }

    if (config.timeout_seconds > 0) {
        port = std::make_shared<TimeoutSummarizer>(
            port, std::chrono::seconds(config.timeout_seconds));
    }
    return port;
}

} // namespace strata
