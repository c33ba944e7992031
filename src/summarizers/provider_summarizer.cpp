#include "provider_summarizer.hpp"
#include "../provider.hpp"
#include "../summary_prompt.hpp"
#include "../util.hpp"
#include <algorithm>
#include <iostream>

namespace strata {

ProviderSummarizer::ProviderSummarizer(std::shared_ptr<Provider> provider,
                                       std::string model, double temperature,
                                       const SummarizerConfig& config)
    : provider_(std::move(provider)), model_(std::move(model)),
      temperature_(temperature), config_(config) {}

std::string ProviderSummarizer::summarize(const std::vector<MemoryItem>& items,
                                          const std::string& speaker) {
    if (items.empty()) throw PortError("summarize called with no items");
    return complete(build_l1_prompt(items, speaker, config_.persona, config_.l1_max_words),
                    config_.l1_max_words);
}

std::string ProviderSummarizer::merge(const std::vector<MemoryItem>& summaries,
                                      uint32_t target_level,
                                      const std::string& speaker) {
    if (summaries.size() < 2) throw PortError("merge needs at least two summaries");
    return complete(build_merge_prompt(summaries, target_level, speaker,
                                       config_.persona, config_.merge_max_words),
                    config_.merge_max_words);
}

// A blank reply counts as a failed attempt, same as a provider error.
std::string ProviderSummarizer::complete(const std::string& prompt, uint32_t max_words) {
    const std::string system = build_persona_prompt(config_.persona);
    const uint32_t attempts = std::max<uint32_t>(config_.max_retries, 1);
    std::string last_error;

    for (uint32_t attempt = 1; attempt <= attempts; ++attempt) {
        try {
            std::string text = trim(provider_->chat_simple(system, prompt, model_, temperature_));
            if (!text.empty()) return truncate_words(text, max_words);
            last_error = "empty summary";
        } catch (const std::exception& e) {
            last_error = e.what();
        }
        std::cerr << "[summarizer] " << provider_->provider_name() << " attempt "
                  << attempt << "/" << attempts << " failed: " << last_error << "\n";
    }
    throw PortError(provider_->provider_name() + ": " + last_error);
}

} // namespace strata
