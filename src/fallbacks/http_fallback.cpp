#include "http_fallback.hpp"
#include "../config.hpp"
#include "../plugin.hpp"
#include <nlohmann/json.hpp>

static strata::FallbackRegistrar reg_http("http",
    [](const strata::FallbackConfig& cfg, strata::HttpClient& http) {
        return std::make_unique<strata::HttpFallback>(
            cfg.base_url, cfg.api_key, http, static_cast<long>(cfg.timeout_seconds));
    });

using json = nlohmann::json;

namespace strata {

HttpFallback::HttpFallback(std::string base_url, std::string api_key, HttpClient& http,
                           long timeout_seconds)
    : base_url_(std::move(base_url)), api_key_(std::move(api_key)),
      http_(http), timeout_seconds_(timeout_seconds) {
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
}

static std::string result_text(const json& r) {
    for (const char* key : {"memory", "content", "text"}) {
        if (r.contains(key) && r[key].is_string()) return r[key].get<std::string>();
    }
    return "";
}

std::vector<FallbackResult> HttpFallback::search(const std::string& query, size_t limit) {
    if (base_url_.empty()) throw FallbackError("http fallback has no base_url");

    json body = {{"query", query}, {"limit", limit}};
    std::vector<Header> headers = {
        {"Content-Type", "application/json"}
    };
    if (!api_key_.empty()) {
        headers.push_back({"Authorization", "Bearer " + api_key_});
    }

    auto response = http_.post(base_url_ + "/search", body.dump(), headers, timeout_seconds_);
    if (response.status_code == 0) {
        throw FallbackError("memory service unreachable: " + response.error);
    }
    if (!response.ok()) {
        throw FallbackError("memory service error (HTTP " +
                            std::to_string(response.status_code) + ")");
    }

    json j = json::parse(response.body, nullptr, false);
    if (j.is_discarded()) throw FallbackError("memory service returned invalid JSON");

    const json* list = nullptr;
    if (j.is_array()) {
        list = &j;
    } else if (j.is_object() && j.contains("results") && j["results"].is_array()) {
        list = &j["results"];
    } else {
        throw FallbackError("memory service response has no results array");
    }

    std::vector<FallbackResult> out;
    for (const auto& r : *list) {
        if (!r.is_object()) continue;
        FallbackResult res;
        res.text = result_text(r);
        if (res.text.empty()) continue;
        if (r.contains("id") && r["id"].is_string()) {
            res.id = r["id"].get<std::string>();
        } else if (r.contains("id") && r["id"].is_number_integer()) {
            res.id = std::to_string(r["id"].get<long long>());
        }
        if (r.contains("score") && r["score"].is_number()) {
            res.score = r["score"].get<double>();
        }
        out.push_back(std::move(res));
        if (out.size() >= limit) break;
    }
    return out;
}

} // namespace strata
