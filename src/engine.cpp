#include "engine.hpp"
#include "fallback.hpp"
#include "item_json.hpp"
#include "summarizer.hpp"
#include "topics.hpp"
#include "util.hpp"
#include <algorithm>
#include <iostream>

namespace strata {

static constexpr int kStateVersion = 1;

static SummarizationPort& require_port(const std::shared_ptr<SummarizationPort>& port) {
    if (!port) throw std::invalid_argument("MemoryEngine requires a summarization port");
    return *port;
}

static const LedgerConfig& require_valid(const LedgerConfig& config) {
    std::string err = config.validate();
    if (!err.empty()) throw std::invalid_argument(err);
    return config;
}

MemoryEngine::MemoryEngine(const LedgerConfig& config,
                           std::shared_ptr<SummarizationPort> port,
                           std::shared_ptr<ExternalMemoryFallback> fallback,
                           size_t fallback_limit)
    : config_(require_valid(config)),
      port_(std::move(port)),
      fallback_(std::move(fallback)),
      fallback_limit_(fallback_limit),
      policy_(config_, require_port(port_)) {}

IngestResult MemoryEngine::ingest(const std::string& text, Role role,
                                  const std::string& speaker) {
    IngestResult result;
    if (trim(text).empty()) {
        result.error = "empty text";
    } else if (text.size() > config_.max_ingest_chars) {
        result.error = "text too long (" + std::to_string(text.size()) + " > " +
                       std::to_string(config_.max_ingest_chars) + " chars)";
    }
    if (!result.error.empty()) {
        std::cerr << "[engine] Rejected ingestion: " << result.error << "\n";
        return result;
    }

    MemoryItem item = MemoryItem::raw(make_item_id(0), text, role, epoch_millis());
    item.set_topics(extract_topics(text));
    item.set_quality(Quality{authority_score(text, role), 0.5, 0.1});

    std::lock_guard<std::mutex> lock(mutex_);
    result.item_id = item.id();
    archive_.append(item);
    ledger_.append(std::move(item));
    result.actions = policy_.evaluate(ledger_, archive_, speaker.empty() ? "User" : speaker);
    result.accepted = true;
    return result;
}

static std::string context_line(const MemoryItem& item) {
    if (item.is_summary()) {
        return "[L" + std::to_string(item.level()) + " summary] " + item.text();
    }
    return std::string(role_to_string(item.role())) + ": " + item.text();
}

std::string MemoryEngine::build_context(const std::string& /*query*/, size_t max_chars) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto& items = ledger_.items();

    std::vector<size_t> summaries;
    std::vector<size_t> raws;
    for (size_t i = 0; i < items.size(); ++i) {
        (items[i].is_summary() ? summaries : raws).push_back(i);
    }
    // Higher level first, then most recent ledger position.
    std::sort(summaries.begin(), summaries.end(), [&](size_t a, size_t b) {
        if (items[a].level() != items[b].level()) return items[a].level() > items[b].level();
        return a > b;
    });
    std::reverse(raws.begin(), raws.end());

    std::vector<std::string> head;
    std::vector<size_t> picked_raw;
    size_t used = 0;
    bool full = false;
    for (size_t idx : summaries) {
        std::string line = context_line(items[idx]);
        if (used + line.size() + 1 > max_chars) { full = true; break; }
        used += line.size() + 1;
        head.push_back(std::move(line));
    }
    if (!full) {
        for (size_t idx : raws) {
            size_t cost = context_line(items[idx]).size() + 1;
            if (used + cost > max_chars) break;
            used += cost;
            picked_raw.push_back(idx);
        }
    }
    std::sort(picked_raw.begin(), picked_raw.end());

    std::string out;
    for (const auto& line : head) out += line + "\n";
    for (size_t idx : picked_raw) out += context_line(items[idx]) + "\n";
    return out;
}

EngineStats MemoryEngine::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    EngineStats s;
    for (const auto& item : ledger_.items()) {
        s.active_by_level[item.level()]++;
    }
    s.archive = archive_.stats();
    s.archived_by_level = s.archive.counts_by_level;
    s.active_items = ledger_.size();
    s.active_chars = ledger_.active_char_total();
    s.budget_max = config_.budget_max;
    s.budget_used_percent = 100.0 * static_cast<double>(s.active_chars) /
                            static_cast<double>(config_.budget_max);
    s.summary_ratio = ledger_.summary_ratio();
    return s;
}

std::vector<MemoryItem> MemoryEngine::archive_items_locked() const {
    std::vector<MemoryItem> out;
    for (uint32_t level : archive_.levels()) {
        const auto& items = archive_.items_at(level);
        out.insert(out.end(), items.begin(), items.end());
    }
    return out;
}

nlohmann::json MemoryEngine::export_state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json ledger = nlohmann::json::array();
    for (const auto& item : ledger_.items()) ledger.push_back(item_to_json(item));
    nlohmann::json archive = nlohmann::json::array();
    for (const auto& item : archive_items_locked()) archive.push_back(item_to_json(item));
    return {
        {"version", kStateVersion},
        {"exported_at", epoch_millis()},
        {"ledger", ledger},
        {"archive", archive}
    };
}

ImportResult MemoryEngine::import_state(const nlohmann::json& state) {
    ImportResult result;
    MemoryLedger ledger;
    ArchiveStore archive;
    try {
        if (!state.is_object()) throw std::invalid_argument("state is not an object");
        int version = state.value("version", 0);
        if (version != kStateVersion) {
            throw std::invalid_argument("unsupported state version " + std::to_string(version));
        }
        if (!state.contains("ledger") || !state["ledger"].is_array() ||
            !state.contains("archive") || !state["archive"].is_array()) {
            throw std::invalid_argument("state needs 'ledger' and 'archive' arrays");
        }
        for (const auto& j : state["archive"]) {
            archive.append(item_from_json(j));
        }
        for (const auto& j : state["ledger"]) {
            MemoryItem item = item_from_json(j);
            if (!archive.get(item.id())) archive.append(item);
            ledger.append(std::move(item));
        }
    } catch (const std::exception& e) {
        result.error = e.what();
        std::cerr << "[engine] Import rejected: " << result.error << "\n";
        return result;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    ledger_ = std::move(ledger);
    archive_ = std::move(archive);
    result.ok = true;
    result.ledger_items = ledger_.size();
    result.archived_items = archive_.size();
    return result;
}

DecompressionResult MemoryEngine::decompress(const std::string& item_id,
                                             uint32_t target_level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    DecompressionEngine engine(archive_, fallback_.get());
    return engine.decompress(item_id, target_level);
}

SearchResult MemoryEngine::search(const std::string& query, uint32_t max_level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    ProactiveSearchEngine engine(archive_, fallback_.get(), fallback_limit_);
    return engine.search(query, max_level);
}

SearchResult MemoryEngine::advanced_search(const SearchOptions& options) const {
    std::lock_guard<std::mutex> lock(mutex_);
    ProactiveSearchEngine engine(archive_, fallback_.get(), fallback_limit_);
    return engine.advanced_search(options);
}

std::vector<MemoryItem> MemoryEngine::ledger_snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return ledger_.items();
}

std::vector<MemoryItem> MemoryEngine::archive_snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return archive_items_locked();
}

void MemoryEngine::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    ledger_.clear();
}

} // namespace strata
