#include <catch2/catch.hpp>
#include "summarizer.hpp"
#include "summary_prompt.hpp"
#include "config.hpp"
#include "provider.hpp"
#include "summarizers/extractive.hpp"
#include "summarizers/provider_summarizer.hpp"
#include "summarizers/timeout.hpp"
#include "util.hpp"
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace strata;

static std::vector<MemoryItem> conversation(size_t pad = 0) {
    std::string filler(pad, ' ');
    return {
        MemoryItem::raw("m1", "The dragon sleeps under the mountain. It snores loudly." + filler,
                        Role::User, 1),
        MemoryItem::raw("m2", "I will bring gold to the dragon before winter!" + filler,
                        Role::Assistant, 2),
    };
}

// ── Prompts ──────────────────────────────────────────────────────

TEST_CASE("build_l1_prompt: names speaker and persona, lists turns", "[prompt]") {
    auto prompt = build_l1_prompt(conversation(), "Lucie", "Algareth", 80);
    REQUIRE(prompt.find("At most 80 words") != std::string::npos);
    REQUIRE(prompt.find("Refer to the other party as Lucie") != std::string::npos);
    REQUIRE(prompt.find("Lucie: The dragon sleeps") != std::string::npos);
    REQUIRE(prompt.find("Algareth: I will bring gold") != std::string::npos);
    REQUIRE(prompt.find("**Exchange:**") != std::string::npos);
}

TEST_CASE("build_merge_prompt: numbered summaries and target level", "[prompt]") {
    std::vector<MemoryItem> summaries = {
        MemoryItem::summary("l1_a", "first", 1, {"m1"}, 1),
        MemoryItem::summary("l1_b", "second", 1, {"m2"}, 2),
    };
    auto prompt = build_merge_prompt(summaries, 2, "Lucie", "Algareth", 60);
    REQUIRE(prompt.find("level-1 summaries into one level-2 summary") != std::string::npos);
    REQUIRE(prompt.find("[1] first") != std::string::npos);
    REQUIRE(prompt.find("[2] second") != std::string::npos);
    REQUIRE(prompt.find("**Synthesis:**") != std::string::npos);
}

TEST_CASE("build_persona_prompt: mentions persona", "[prompt]") {
    REQUIRE(build_persona_prompt("Sage").find("You are Sage") == 0);
}

// ── ExtractiveSummarizer ─────────────────────────────────────────

TEST_CASE("ExtractiveSummarizer: deterministic and shorter than its input", "[summarizer]") {
    ExtractiveSummarizer s;
    auto items = conversation();
    auto a = s.summarize(items, "Lucie");
    auto b = s.summarize(items, "Lucie");
    REQUIRE(a == b);
    REQUIRE_FALSE(a.empty());
    REQUIRE(a.size() <= 60);
    REQUIRE(a.rfind("**Key concepts:**", 0) == 0);
}

TEST_CASE("ExtractiveSummarizer: names the speaker when room allows", "[summarizer]") {
    ExtractiveSummarizer s;
    auto out = s.summarize(conversation(400), "Lucie");
    REQUIRE(out.find("**Exchange:** with Lucie:") != std::string::npos);
    REQUIRE(out.find("The dragon sleeps under the mountain") != std::string::npos);
}

TEST_CASE("ExtractiveSummarizer: respects the word cap", "[summarizer]") {
    ExtractiveSummarizer s(10, 10);
    auto out = s.summarize(conversation(400), "Lucie");
    REQUIRE(split_words(out).size() <= 10);
}

TEST_CASE("ExtractiveSummarizer: merge keeps each input's essence", "[summarizer]") {
    ExtractiveSummarizer s;
    std::string pad(200, ' ');
    std::vector<MemoryItem> summaries = {
        MemoryItem::summary("l1_a", "**Key concepts:** dragon\n**Exchange:** we met the dragon" + pad,
                            1, {"m1"}, 1),
        MemoryItem::summary("l1_b", "**Key concepts:** gold\n**Exchange:** we paid in gold" + pad,
                            1, {"m2"}, 2),
    };
    auto out = s.merge(summaries, 2, "Lucie");
    REQUIRE(out.find("**Synthesis:** L2 with Lucie:") != std::string::npos);
    REQUIRE(out.find("we met the dragon;") != std::string::npos);
    REQUIRE(out.find("we paid in gold;") != std::string::npos);
}

TEST_CASE("ExtractiveSummarizer: bad inputs raise PortError", "[summarizer]") {
    ExtractiveSummarizer s;
    REQUIRE_THROWS_AS(s.summarize({}, "Lucie"), PortError);
    std::vector<MemoryItem> one = {MemoryItem::summary("l1_a", "only", 1, {"m1"}, 1)};
    REQUIRE_THROWS_AS(s.merge(one, 2, "Lucie"), PortError);
}

// ── ProviderSummarizer ───────────────────────────────────────────

class ScriptedProvider : public Provider {
public:
    std::string reply = "**Key concepts:** dragon\n**Exchange:** Lucie feeds the dragon.";
    std::vector<std::string> replies;   // served before reply
    bool fail = false;
    int fail_first = 0;                 // calls that throw before succeeding
    int call_count = 0;
    std::vector<ChatMessage> last_messages;
    std::string last_model;

    std::string chat(const std::vector<ChatMessage>& messages,
                     const std::string& model,
                     double) override {
        call_count++;
        last_messages = messages;
        last_model = model;
        if (fail || call_count <= fail_first) {
            throw std::runtime_error("HTTP 500 on call " + std::to_string(call_count));
        }
        if (!replies.empty()) {
            std::string r = replies.front();
            replies.erase(replies.begin());
            return r;
        }
        return reply;
    }

    std::string provider_name() const override { return "scripted"; }
};

TEST_CASE("ProviderSummarizer: sends persona and level-1 prompt", "[summarizer]") {
    auto provider = std::make_shared<ScriptedProvider>();
    SummarizerConfig cfg;
    cfg.persona = "Algareth";
    ProviderSummarizer s(provider, "test-model", 0.2, cfg);

    auto out = s.summarize(conversation(), "Lucie");
    REQUIRE(out == provider->reply);
    REQUIRE(provider->last_model == "test-model");
    REQUIRE(provider->last_messages.size() == 2);
    REQUIRE(provider->last_messages[0].role == Role::System);
    REQUIRE(provider->last_messages[0].content.find("You are Algareth") == 0);
    REQUIRE(provider->last_messages[1].content.find("Lucie: The dragon sleeps") != std::string::npos);
}

TEST_CASE("ProviderSummarizer: long replies truncated to the word cap", "[summarizer]") {
    auto provider = std::make_shared<ScriptedProvider>();
    std::string many;
    for (int i = 0; i < 200; ++i) many += "word ";
    provider->reply = many;
    SummarizerConfig cfg;
    cfg.merge_max_words = 20;
    ProviderSummarizer s(provider, "m", 0.2, cfg);

    std::vector<MemoryItem> summaries = {
        MemoryItem::summary("l1_a", "first", 1, {"m1"}, 1),
        MemoryItem::summary("l1_b", "second", 1, {"m2"}, 2),
    };
    auto out = s.merge(summaries, 2, "Lucie");
    REQUIRE(split_words(out).size() == 20);
}

TEST_CASE("ProviderSummarizer: provider failure and empty reply are errors", "[summarizer]") {
    auto provider = std::make_shared<ScriptedProvider>();
    ProviderSummarizer s(provider, "m", 0.2, SummarizerConfig{});

    provider->fail = true;
    REQUIRE_THROWS_AS(s.summarize(conversation(), "Lucie"), PortError);

    provider->fail = false;
    provider->reply = "   \n ";
    REQUIRE_THROWS_AS(s.summarize(conversation(), "Lucie"), PortError);
}

TEST_CASE("ProviderSummarizer: retries a failing provider", "[summarizer]") {
    auto provider = std::make_shared<ScriptedProvider>();
    provider->fail_first = 2;
    SummarizerConfig cfg;
    cfg.max_retries = 3;
    ProviderSummarizer s(provider, "m", 0.2, cfg);

    REQUIRE(s.summarize(conversation(), "Lucie") == provider->reply);
    REQUIRE(provider->call_count == 3);
}

TEST_CASE("ProviderSummarizer: blank reply is retried", "[summarizer]") {
    auto provider = std::make_shared<ScriptedProvider>();
    provider->replies = {"  "};
    SummarizerConfig cfg;
    cfg.max_retries = 2;
    ProviderSummarizer s(provider, "m", 0.2, cfg);

    REQUIRE(s.summarize(conversation(), "Lucie") == provider->reply);
    REQUIRE(provider->call_count == 2);
}

TEST_CASE("ProviderSummarizer: gives up after max_retries attempts", "[summarizer]") {
    auto provider = std::make_shared<ScriptedProvider>();
    provider->fail = true;
    SummarizerConfig cfg;
    cfg.max_retries = 3;
    ProviderSummarizer s(provider, "m", 0.2, cfg);

    try {
        s.summarize(conversation(), "Lucie");
        FAIL("expected PortError");
    } catch (const PortError& e) {
        std::string msg = e.what();
        REQUIRE(msg.find("scripted") != std::string::npos);
        REQUIRE(msg.find("HTTP 500 on call 3") != std::string::npos);
    }
    REQUIRE(provider->call_count == 3);
}

TEST_CASE("ProviderSummarizer: zero retries still makes one attempt", "[summarizer]") {
    auto provider = std::make_shared<ScriptedProvider>();
    SummarizerConfig cfg;
    cfg.max_retries = 0;
    ProviderSummarizer s(provider, "m", 0.2, cfg);

    std::vector<MemoryItem> summaries = {
        MemoryItem::summary("l1_a", "first", 1, {"m1"}, 1),
        MemoryItem::summary("l1_b", "second", 1, {"m2"}, 2),
    };
    REQUIRE_FALSE(s.merge(summaries, 2, "Lucie").empty());
    REQUIRE(provider->call_count == 1);
}

// ── TimeoutSummarizer ────────────────────────────────────────────

class SlowPort : public SummarizationPort {
public:
    std::chrono::milliseconds delay{0};
    bool throw_plain = false;

    std::string summarize(const std::vector<MemoryItem>&, const std::string&) override {
        std::this_thread::sleep_for(delay);
        if (throw_plain) throw std::runtime_error("socket closed");
        return "slow summary";
    }
    std::string merge(const std::vector<MemoryItem>&, uint32_t, const std::string&) override {
        std::this_thread::sleep_for(delay);
        return "slow merge";
    }
    std::string name() const override { return "slow"; }
};

TEST_CASE("TimeoutSummarizer: fast calls pass through", "[summarizer]") {
    auto inner = std::make_shared<SlowPort>();
    TimeoutSummarizer s(inner, std::chrono::milliseconds(1000));
    REQUIRE(s.summarize(conversation(), "Lucie") == "slow summary");
    REQUIRE(s.merge({}, 2, "Lucie") == "slow merge");
    REQUIRE(s.name() == "slow");
}

TEST_CASE("TimeoutSummarizer: expiry raises PortError", "[summarizer]") {
    auto inner = std::make_shared<SlowPort>();
    inner->delay = std::chrono::milliseconds(300);
    TimeoutSummarizer s(inner, std::chrono::milliseconds(20));
    REQUIRE_THROWS_AS(s.summarize(conversation(), "Lucie"), PortError);
}

TEST_CASE("TimeoutSummarizer: inner exceptions become PortError", "[summarizer]") {
    auto inner = std::make_shared<SlowPort>();
    inner->throw_plain = true;
    TimeoutSummarizer s(inner, std::chrono::milliseconds(1000));
    REQUIRE_THROWS_AS(s.summarize(conversation(), "Lucie"), PortError);
}

// ── create_summarizer ────────────────────────────────────────────

TEST_CASE("create_summarizer: backends and timeout wrapping", "[summarizer]") {
    SummarizerConfig cfg;
    cfg.timeout_seconds = 0;
    auto plain = create_summarizer(cfg, nullptr, "m", 0.3);
    REQUIRE(dynamic_cast<ExtractiveSummarizer*>(plain.get()) != nullptr);

    cfg.timeout_seconds = 5;
    auto wrapped = create_summarizer(cfg, nullptr, "m", 0.3);
    REQUIRE(dynamic_cast<TimeoutSummarizer*>(wrapped.get()) != nullptr);
    REQUIRE(wrapped->name() == "extractive");

    cfg.backend = "provider";
    auto via_provider = create_summarizer(cfg, std::make_shared<ScriptedProvider>(), "m", 0.3);
    REQUIRE(via_provider->name() == "provider");
}

TEST_CASE("create_summarizer: invalid setups rejected", "[summarizer]") {
    SummarizerConfig cfg;
    cfg.backend = "provider";
    REQUIRE_THROWS_AS(create_summarizer(cfg, nullptr, "m", 0.3), std::invalid_argument);

    cfg.backend = "telepathy";
    REQUIRE_THROWS_AS(create_summarizer(cfg, nullptr, "m", 0.3), std::invalid_argument);
}
