#include "anthropic.hpp"
#include "../http.hpp"
#include "../plugin.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <chrono>
#include <cmath>
#include <iostream>
#include <stdexcept>
#include <thread>

static strata::ProviderRegistrar reg_anthropic("anthropic",
    [](const std::string& key, strata::HttpClient& http, const std::string& base_url) {
        return std::make_unique<strata::AnthropicProvider>(key, http, base_url);
    });

using json = nlohmann::json;

namespace strata {

AnthropicProvider::AnthropicProvider(const std::string& api_key, HttpClient& http,
                                     const std::string& base_url)
    : api_key_(api_key), http_(http),
      base_url_(base_url.empty() ? "https://api.anthropic.com/v1" : base_url) {}

bool AnthropicProvider::is_retryable(long status_code) {
    return status_code == 429 || status_code == 408 || status_code == 409 ||
           (status_code >= 500 && status_code < 600);
}

void AnthropicProvider::backoff_sleep(uint32_t attempt) {
    double delay = std::min(INITIAL_DELAY_S * std::pow(2.0, static_cast<double>(attempt)),
                            MAX_DELAY_S);
    auto ms = static_cast<long>(delay * 1000);
    std::cerr << "[anthropic] Rate limited, retrying in " << ms << "ms...\n";
    std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}

json AnthropicProvider::build_request(const std::vector<ChatMessage>& messages,
                                      const std::string& model,
                                      double temperature) const {
    json request;
    request["model"] = model;
    request["max_tokens"] = 1024;
    request["temperature"] = temperature;

    // System messages go into the top-level "system" field
    std::string system_text;
    json msgs = json::array();
    for (const auto& msg : messages) {
        if (msg.role == Role::System) {
            if (!system_text.empty()) system_text += "\n";
            system_text += msg.content;
            continue;
        }
        msgs.push_back({{"role", role_to_string(msg.role)}, {"content", msg.content}});
    }
    if (!system_text.empty()) {
        request["system"] = system_text;
    }
    request["messages"] = msgs;
    return request;
}

std::string AnthropicProvider::chat(const std::vector<ChatMessage>& messages,
                                    const std::string& model,
                                    double temperature) {
    std::string body = build_request(messages, model, temperature).dump();

    std::vector<Header> headers = {
        {"x-api-key", api_key_},
        {"anthropic-version", API_VERSION},
        {"content-type", "application/json"}
    };

    for (uint32_t attempt = 0; attempt <= MAX_RETRIES; ++attempt) {
        auto response = http_.post(base_url_ + "/messages", body, headers);

        if (response.status_code >= 200 && response.status_code < 300) {
            auto resp = json::parse(response.body);

            std::string text;
            if (resp.contains("content") && resp["content"].is_array()) {
                for (const auto& block : resp["content"]) {
                    if (block.value("type", "") == "text") {
                        text += block.value("text", "");
                    }
                }
            }
            return text;
        }

        if (is_retryable(response.status_code) && attempt < MAX_RETRIES) {
            backoff_sleep(attempt);
            continue;
        }

        throw std::runtime_error("Anthropic API error (HTTP " +
            std::to_string(response.status_code) + "): " + response.body);
    }

    throw std::runtime_error("Anthropic API error: max retries exceeded");
}

} // namespace strata
