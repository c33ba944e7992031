#include "timeout.hpp"
#include <exception>
#include <future>
#include <thread>

namespace strata {

TimeoutSummarizer::TimeoutSummarizer(std::shared_ptr<SummarizationPort> inner,
                                     std::chrono::milliseconds timeout)
    : inner_(std::move(inner)), timeout_(timeout) {}

template<typename Call>
std::string TimeoutSummarizer::run(const char* op, Call call) {
    auto promise = std::make_shared<std::promise<std::string>>();
    auto future = promise->get_future();

    // The worker owns copies of everything it touches.
    std::thread([promise, call]() {
        try {
            promise->set_value(call());
        } catch (...) {
            promise->set_exception(std::current_exception());
        }
    }).detach();

    if (future.wait_for(timeout_) != std::future_status::ready) {
        throw PortError(std::string(op) + " timed out after " +
                        std::to_string(timeout_.count()) + "ms");
    }
    try {
        return future.get();
    } catch (const PortError&) {
        throw;
    } catch (const std::exception& e) {
        throw PortError(std::string(op) + " failed: " + e.what());
    }
}

std::string TimeoutSummarizer::summarize(const std::vector<MemoryItem>& items,
                                         const std::string& speaker) {
    auto inner = inner_;
    return run("summarize", [inner, items, speaker]() {
        return inner->summarize(items, speaker);
    });
}

std::string TimeoutSummarizer::merge(const std::vector<MemoryItem>& summaries,
                                     uint32_t target_level,
                                     const std::string& speaker) {
    auto inner = inner_;
    return run("merge", [inner, summaries, target_level, speaker]() {
        return inner->merge(summaries, target_level, speaker);
    });
}

} // namespace strata
