#include <catch2/catch.hpp>
#include "mock_http_client.hpp"
#include "fallback.hpp"
#include "config.hpp"
#include "fallbacks/http_fallback.hpp"
#include "fallbacks/stub_fallback.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;
using namespace strata;

static std::string find_header(const std::vector<Header>& headers, const std::string& name) {
    for (const auto& h : headers) {
        if (h.first == name) return h.second;
    }
    return "";
}

// ════════════════════════════════════════════════════════════════
// HttpFallback
// ════════════════════════════════════════════════════════════════

TEST_CASE("HttpFallback: sends query and limit", "[fallback][http]") {
    MockHttpClient mock;
    mock.next_response = {200, R"({"results": []})"};

    HttpFallback fallback("http://mem:8000/", "secret", mock, 7);
    REQUIRE(fallback.search("dragon lore", 3).empty());

    REQUIRE(mock.last_url == "http://mem:8000/search");
    REQUIRE(mock.last_timeout == 7);
    REQUIRE(find_header(mock.last_headers, "Authorization") == "Bearer secret");
    auto body = json::parse(mock.last_body);
    REQUIRE(body["query"] == "dragon lore");
    REQUIRE(body["limit"] == 3);
}

TEST_CASE("HttpFallback: no api key, no Authorization header", "[fallback][http]") {
    MockHttpClient mock;
    mock.next_response = {200, "[]"};

    HttpFallback fallback("http://mem", "", mock);
    fallback.search("q", 1);
    REQUIRE(find_header(mock.last_headers, "Authorization").empty());
}

TEST_CASE("HttpFallback: parses results object", "[fallback][http]") {
    MockHttpClient mock;
    mock.next_response = {200, R"({"results": [
        {"id": "mem-1", "memory": "likes dragons", "score": 0.9},
        {"id": 42, "content": "lives in Lyon", "score": 0.4},
        {"id": "mem-3", "score": 0.1}
    ]})"};

    HttpFallback fallback("http://mem", "", mock);
    auto results = fallback.search("q", 5);
    REQUIRE(results.size() == 2);
    REQUIRE(results[0].id == "mem-1");
    REQUIRE(results[0].text == "likes dragons");
    REQUIRE(results[0].score == 0.9);
    REQUIRE(results[1].id == "42");
    REQUIRE(results[1].text == "lives in Lyon");
}

TEST_CASE("HttpFallback: parses bare array and honors limit", "[fallback][http]") {
    MockHttpClient mock;
    mock.next_response = {200, R"([
        {"text": "one"}, {"text": "two"}, {"text": "three"}
    ])"};

    HttpFallback fallback("http://mem", "", mock);
    auto results = fallback.search("q", 2);
    REQUIRE(results.size() == 2);
    REQUIRE(results[0].text == "one");
    REQUIRE(results[0].id.empty());
    REQUIRE(results[0].score == 0.0);
}

TEST_CASE("HttpFallback: failures raise FallbackError", "[fallback][http]") {
    MockHttpClient mock;
    HttpFallback fallback("http://mem", "", mock);

    mock.next_response = {0, "", "connection refused"};
    REQUIRE_THROWS_AS(fallback.search("q", 1), FallbackError);

    mock.next_response = {503, "down"};
    REQUIRE_THROWS_AS(fallback.search("q", 1), FallbackError);

    mock.next_response = {200, "not json"};
    REQUIRE_THROWS_AS(fallback.search("q", 1), FallbackError);

    mock.next_response = {200, R"({"memories": []})"};
    REQUIRE_THROWS_AS(fallback.search("q", 1), FallbackError);

    HttpFallback unconfigured("", "", mock);
    REQUIRE_THROWS_AS(unconfigured.search("q", 1), FallbackError);
}

// ════════════════════════════════════════════════════════════════
// StubFallback
// ════════════════════════════════════════════════════════════════

TEST_CASE("StubFallback: one deterministic result per query", "[fallback][stub]") {
    StubFallback stub;
    auto a = stub.search("dragons", 5);
    auto b = stub.search("dragons", 5);
    REQUIRE(a.size() == 1);
    REQUIRE(a[0].id == b[0].id);
    REQUIRE(a[0].id.rfind("ext_", 0) == 0);
    REQUIRE(a[0].text == "[External] result for dragons");
    REQUIRE(stub.search("wyverns", 5)[0].id != a[0].id);
}

TEST_CASE("StubFallback: empty query or zero limit", "[fallback][stub]") {
    StubFallback stub;
    REQUIRE(stub.search("", 5).empty());
    REQUIRE(stub.search("q", 0).empty());
}

// ════════════════════════════════════════════════════════════════
// Factory
// ════════════════════════════════════════════════════════════════

TEST_CASE("create_fallback: none disables, others resolve", "[fallback]") {
    MockHttpClient mock;
    FallbackConfig cfg;
    REQUIRE(create_fallback(cfg, mock) == nullptr);

    cfg.backend = "stub";
    REQUIRE(create_fallback(cfg, mock)->name() == "stub");

    cfg.backend = "http";
    cfg.base_url = "http://mem";
    REQUIRE(create_fallback(cfg, mock)->name() == "http");

    cfg.backend = "psychic";
    REQUIRE_THROWS_AS(create_fallback(cfg, mock), std::invalid_argument);
}
