#pragma once
#include "archive.hpp"
#include "compression.hpp"
#include "config.hpp"
#include "decompression.hpp"
#include "ledger.hpp"
#include "search.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace strata {

class SummarizationPort;
class ExternalMemoryFallback;

struct IngestResult {
    bool accepted = false;
    std::string error;                       // set when rejected
    std::string item_id;                     // id of the new raw item
    std::vector<CompressionAction> actions;  // empty = no rule fired
};

struct EngineStats {
    std::map<uint32_t, size_t> active_by_level;
    std::map<uint32_t, size_t> archived_by_level;
    size_t active_items = 0;
    size_t active_chars = 0;
    size_t budget_max = 0;
    double budget_used_percent = 0.0;
    double summary_ratio = 0.0;
    ArchiveStats archive;
};

struct ImportResult {
    bool ok = false;
    std::string error;
    size_t ledger_items = 0;
    size_t archived_items = 0;
};

// One conversational entity's memory: ledger, archive, compaction policy and
// the read paths over them. Every public call is serialized on one mutex, so
// an ingest (including its summarization calls) completes before the next
// starts.
class MemoryEngine {
public:
    // Throws std::invalid_argument for an invalid config or a null port.
    MemoryEngine(const LedgerConfig& config,
                 std::shared_ptr<SummarizationPort> port,
                 std::shared_ptr<ExternalMemoryFallback> fallback = nullptr,
                 size_t fallback_limit = 5);

    // Rejects empty or oversized text without touching the ledger.
    IngestResult ingest(const std::string& text, Role role, const std::string& speaker);

    // Highest-level summaries first (most recent breaks ties), then the most
    // recent raw items, packed until max_chars. Raw items are emitted in
    // chronological order.
    std::string build_context(const std::string& query, size_t max_chars) const;

    EngineStats stats() const;

    nlohmann::json export_state() const;

    // All-or-nothing: on error the current state is kept.
    ImportResult import_state(const nlohmann::json& state);

    DecompressionResult decompress(const std::string& item_id, uint32_t target_level) const;
    SearchResult search(const std::string& query, uint32_t max_level) const;
    SearchResult advanced_search(const SearchOptions& options) const;

    // Read-only copies for inspection.
    std::vector<MemoryItem> ledger_snapshot() const;
    std::vector<MemoryItem> archive_snapshot() const;   // level asc, then insertion order

    // Empties the active ledger; the archive is kept.
    void clear();

    const LedgerConfig& config() const { return config_; }

private:
    std::vector<MemoryItem> archive_items_locked() const;

    LedgerConfig config_;
    std::shared_ptr<SummarizationPort> port_;
    std::shared_ptr<ExternalMemoryFallback> fallback_;
    size_t fallback_limit_;

    mutable std::mutex mutex_;
    MemoryLedger ledger_;
    ArchiveStore archive_;
    CompressionPolicyEngine policy_;
};

} // namespace strata
