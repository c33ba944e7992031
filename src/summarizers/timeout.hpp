#pragma once
#include "../summarizer.hpp"
#include <chrono>
#include <memory>

namespace strata {

// Bounds both port calls. On expiry the call raises PortError; the inner call
// keeps running on its detached worker and its result is discarded.
class TimeoutSummarizer : public SummarizationPort {
public:
    TimeoutSummarizer(std::shared_ptr<SummarizationPort> inner,
                      std::chrono::milliseconds timeout);

    std::string summarize(const std::vector<MemoryItem>& items,
                          const std::string& speaker) override;
    std::string merge(const std::vector<MemoryItem>& summaries,
                      uint32_t target_level,
                      const std::string& speaker) override;
    std::string name() const override { return inner_->name(); }

private:
    template<typename Call>
    std::string run(const char* op, Call call);

    std::shared_ptr<SummarizationPort> inner_;
    std::chrono::milliseconds timeout_;
};

} // namespace strata
