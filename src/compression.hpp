#pragma once
#include "archive.hpp"
#include "config.hpp"
#include "ledger.hpp"
#include "memory_item.hpp"
#include <optional>
#include <string>
#include <vector>

namespace strata {

class SummarizationPort;

enum class ActionKind { None, CreateL1, BudgetReplace, MergeUp };

const char* action_kind_to_string(ActionKind kind);

struct CompressionAction {
    ActionKind kind = ActionKind::None;
    std::vector<MemoryItem> produced;
    std::vector<std::string> evicted_ids;
    size_t budget_after = 0;   // active char total once this action committed
};

// Applies the three compaction rules in fixed order (CreateL1, BudgetReplace,
// MergeUp), each at most once per evaluation. A rule whose port call fails is
// skipped with the ledger untouched, and evaluation moves on to the next rule.
class CompressionPolicyEngine {
public:
    // Throws std::invalid_argument if config.validate() reports an error.
    CompressionPolicyEngine(const LedgerConfig& config, SummarizationPort& port);

    // Returns every action that fired, in rule order. Empty means None.
    std::vector<CompressionAction> evaluate(MemoryLedger& ledger,
                                            ArchiveStore& archive,
                                            const std::string& speaker);

    const LedgerConfig& config() const { return config_; }

private:
    std::optional<CompressionAction> create_l1(MemoryLedger& ledger, ArchiveStore& archive,
                                               const std::string& speaker);
    std::optional<CompressionAction> budget_replace(MemoryLedger& ledger, ArchiveStore& archive,
                                                    const std::string& speaker);
    std::optional<CompressionAction> merge_up(MemoryLedger& ledger, ArchiveStore& archive,
                                              const std::string& speaker);

    // Summarize the raw items at ledger positions indices (ascending) into one
    // level-1 item placed where the first of them was.
    std::optional<CompressionAction> replace_with_l1(MemoryLedger& ledger, ArchiveStore& archive,
                                                     const std::vector<size_t>& indices,
                                                     ActionKind kind,
                                                     const std::string& speaker);

    // Ledger positions of raw items outside the protected tail, oldest first.
    std::vector<size_t> unprotected_raw(const MemoryLedger& ledger) const;

    LedgerConfig config_;
    SummarizationPort& port_;
};

} // namespace strata
