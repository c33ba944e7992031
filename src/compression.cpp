#include "compression.hpp"
#include "summarizer.hpp"
#include "topics.hpp"
#include "util.hpp"
#include <algorithm>
#include <iostream>
#include <map>
#include <stdexcept>

namespace strata {

const char* action_kind_to_string(ActionKind kind) {
    switch (kind) {
        case ActionKind::None:          return "none";
        case ActionKind::CreateL1:      return "create_l1";
        case ActionKind::BudgetReplace: return "budget_replace";
        case ActionKind::MergeUp:       return "merge_up";
    }
    return "none";
}

CompressionPolicyEngine::CompressionPolicyEngine(const LedgerConfig& config,
                                                 SummarizationPort& port)
    : config_(config), port_(port) {
    std::string err = config_.validate();
    if (!err.empty()) throw std::invalid_argument(err);
}

std::vector<CompressionAction> CompressionPolicyEngine::evaluate(MemoryLedger& ledger,
                                                                 ArchiveStore& archive,
                                                                 const std::string& speaker) {
    std::vector<CompressionAction> actions;
    if (auto a = create_l1(ledger, archive, speaker)) actions.push_back(std::move(*a));
    if (auto a = budget_replace(ledger, archive, speaker)) actions.push_back(std::move(*a));
    if (auto a = merge_up(ledger, archive, speaker)) actions.push_back(std::move(*a));
    return actions;
}

std::vector<size_t> CompressionPolicyEngine::unprotected_raw(const MemoryLedger& ledger) const {
    std::vector<size_t> raw;
    const auto& items = ledger.items();
    for (size_t i = 0; i < items.size(); ++i) {
        if (items[i].is_raw()) raw.push_back(i);
    }
    size_t keep = std::min<size_t>(config_.protected_tail, raw.size());
    raw.resize(raw.size() - keep);
    return raw;
}

std::optional<CompressionAction> CompressionPolicyEngine::create_l1(MemoryLedger& ledger,
                                                                    ArchiveStore& archive,
                                                                    const std::string& speaker) {
    size_t threshold = config_.l1_threshold;
    if (ledger.raw_count() < threshold + config_.protected_tail) return std::nullopt;

    auto window = unprotected_raw(ledger);
    if (window.size() < threshold) return std::nullopt;
    window.resize(threshold);
    return replace_with_l1(ledger, archive, window, ActionKind::CreateL1, speaker);
}

std::optional<CompressionAction> CompressionPolicyEngine::budget_replace(MemoryLedger& ledger,
                                                                         ArchiveStore& archive,
                                                                         const std::string& speaker) {
    if (ledger.active_char_total() <= config_.budget_max) return std::nullopt;

    auto candidates = unprotected_raw(ledger);
    if (candidates.size() < config_.budget_block_size) return std::nullopt;

    // Oldest run of adjacent ledger positions, at least two long.
    std::vector<size_t> block;
    for (size_t i = 0; i < candidates.size(); ++i) {
        if (!block.empty() && candidates[i] != block.back() + 1) {
            if (block.size() >= 2) break;
            block.clear();
        }
        block.push_back(candidates[i]);
        if (block.size() == config_.budget_block_size) break;
    }
    if (block.size() < 2) return std::nullopt;
    return replace_with_l1(ledger, archive, block, ActionKind::BudgetReplace, speaker);
}

std::optional<CompressionAction> CompressionPolicyEngine::replace_with_l1(
        MemoryLedger& ledger, ArchiveStore& archive, const std::vector<size_t>& indices,
        ActionKind kind, const std::string& speaker) {
    std::vector<MemoryItem> window;
    std::vector<std::string> ids;
    for (size_t idx : indices) {
        window.push_back(ledger.items()[idx]);
        ids.push_back(window.back().id());
    }

    std::string text;
    try {
        text = port_.summarize(window, speaker);
    } catch (const std::exception& e) {
        std::cerr << "[compress] " << action_kind_to_string(kind)
                  << " skipped, summarize failed: " << e.what() << "\n";
        return std::nullopt;
    }

    MemoryItem summary = MemoryItem::summary(make_item_id(1), text, 1, ids, epoch_millis());
    summary.set_topics(extract_topics(window));
    summary.set_quality(Quality{0.8, 0.7, 0.2});

    ledger.remove_many(ids);
    ledger.insert_at(indices.front(), summary);
    archive.append(summary);

    CompressionAction action;
    action.kind = kind;
    action.produced.push_back(std::move(summary));
    action.evicted_ids = std::move(ids);
    action.budget_after = ledger.active_char_total();

    std::cerr << "[compress] " << action_kind_to_string(kind) << " covered "
              << action.evicted_ids.size() << " raw items -> "
              << action.produced.front().id() << " (" << action.budget_after
              << " chars active)\n";
    return action;
}

std::optional<CompressionAction> CompressionPolicyEngine::merge_up(MemoryLedger& ledger,
                                                                   ArchiveStore& archive,
                                                                   const std::string& speaker) {
    if (!(ledger.summary_ratio() > config_.hierarchical_threshold)) return std::nullopt;

    // Ledger positions of active summaries, grouped by level (ascending).
    std::map<uint32_t, std::vector<size_t>> by_level;
    const auto& items = ledger.items();
    for (size_t i = 0; i < items.size(); ++i) {
        if (items[i].is_summary()) by_level[items[i].level()].push_back(i);
    }

    const std::vector<size_t>* pair = nullptr;
    uint32_t level = 0;
    for (const auto& [lv, positions] : by_level) {
        if (positions.size() >= 2) {
            pair = &positions;
            level = lv;
            break;
        }
    }
    if (!pair) return std::nullopt;

    std::vector<MemoryItem> inputs = {items[(*pair)[0]], items[(*pair)[1]]};
    const MemoryItem& a = inputs[0];
    const MemoryItem& b = inputs[1];
    uint32_t target = level + 1;

    std::string text;
    try {
        text = port_.merge(inputs, target, speaker);
    } catch (const std::exception& e) {
        std::cerr << "[compress] merge_up skipped, merge to L" << target
                  << " failed: " << e.what() << "\n";
        return std::nullopt;
    }

    MemoryItem merged = MemoryItem::summary(make_item_id(target), text, target,
                                            {a.id(), b.id()}, epoch_millis());
    std::vector<std::string> grand = a.covers();
    grand.insert(grand.end(), b.covers().begin(), b.covers().end());
    merged.set_inherited_covers(std::move(grand));
    merged.set_topics(extract_topics(inputs));
    merged.set_quality(Quality{0.9, 0.8, 0.1});

    std::vector<std::string> evicted = {a.id(), b.id()};
    ledger.remove_many(evicted);
    ledger.append(merged);
    archive.append(merged);

    CompressionAction action;
    action.kind = ActionKind::MergeUp;
    action.produced.push_back(std::move(merged));
    action.evicted_ids = std::move(evicted);
    action.budget_after = ledger.active_char_total();

    std::cerr << "[compress] merge_up L" << level << " pair -> "
              << action.produced.front().id() << " (" << action.budget_after
              << " chars active)\n";
    return action;
}

} // namespace strata
