#include "ollama.hpp"
#include "../http.hpp"
#include "../plugin.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

static strata::ProviderRegistrar reg_ollama("ollama",
    [](const std::string&, strata::HttpClient& http, const std::string& base_url) {
        std::string url = base_url.empty() ? "http://localhost:11434" : base_url;
        return std::make_unique<strata::OllamaProvider>(http, url);
    });

using json = nlohmann::json;

namespace strata {

OllamaProvider::OllamaProvider(HttpClient& http, const std::string& base_url)
    : http_(http), base_url_(base_url) {}

std::string OllamaProvider::chat(const std::vector<ChatMessage>& messages,
                                 const std::string& model,
                                 double temperature) {
    json request;
    request["model"] = model;
    request["stream"] = false;
    request["options"] = {{"temperature", temperature}};

    json msgs = json::array();
    for (const auto& msg : messages) {
        msgs.push_back({{"role", role_to_string(msg.role)}, {"content", msg.content}});
    }
    request["messages"] = msgs;

    std::string url = base_url_ + "/api/chat";
    std::vector<Header> headers = {
        {"Content-Type", "application/json"}
    };

    auto response = http_.post(url, request.dump(), headers);

    if (response.status_code < 200 || response.status_code >= 300) {
        throw std::runtime_error("Ollama API error (HTTP " +
            std::to_string(response.status_code) + "): " + response.body);
    }

    auto resp = json::parse(response.body);
    if (resp.contains("message") && resp["message"].is_object() &&
        resp["message"].contains("content") && resp["message"]["content"].is_string()) {
        return resp["message"]["content"].get<std::string>();
    }
    return "";
}

} // namespace strata
