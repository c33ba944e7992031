#pragma once
#include "../summarizer.hpp"
#include <cstdint>

namespace strata {

// Offline, deterministic summarizer: topics plus the leading sentence of each
// input, capped by word count and by half the input size.
class ExtractiveSummarizer : public SummarizationPort {
public:
    ExtractiveSummarizer(uint32_t l1_max_words = 80, uint32_t merge_max_words = 60);

    std::string summarize(const std::vector<MemoryItem>& items,
                          const std::string& speaker) override;
    std::string merge(const std::vector<MemoryItem>& summaries,
                      uint32_t target_level,
                      const std::string& speaker) override;
    std::string name() const override { return "extractive"; }

private:
    uint32_t l1_max_words_;
    uint32_t merge_max_words_;
};

} // namespace strata
