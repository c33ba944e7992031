#pragma once
#include "memory_item.hpp"
#include <string>
#include <vector>
#include <memory>

namespace strata {

struct ChatMessage {
    Role role;
    std::string content;
};

// Abstract base class for LLM providers (the text-generation backend behind
// ProviderSummarizer).
class Provider {
public:
    virtual ~Provider() = default;

    virtual std::string chat(const std::vector<ChatMessage>& messages,
                             const std::string& model,
                             double temperature) = 0;

    virtual std::string chat_simple(const std::string& system_prompt,
                                    const std::string& message,
                                    const std::string& model,
                                    double temperature);

    virtual std::string provider_name() const = 0;
};

class HttpClient; // forward declaration

// Factory: create provider by name. Throws std::invalid_argument for
// unknown names.
std::unique_ptr<Provider> create_provider(const std::string& name,
                                          const std::string& api_key,
                                          HttpClient& http,
                                          const std::string& base_url = "");

} // namespace strata
