#include "decompression.hpp"
#include "fallback.hpp"
#include "util.hpp"
#include <iostream>

namespace strata {

DecompressionEngine::DecompressionEngine(const ArchiveStore& archive,
                                         ExternalMemoryFallback* fallback)
    : archive_(archive), fallback_(fallback) {}

static std::string count_label(uint32_t level, size_t n, bool fallback) {
    std::string s = "L" + std::to_string(level) + ": " + std::to_string(n) +
                    (n == 1 ? " item" : " items");
    if (fallback) s += " (fallback)";
    return s;
}

DecompressionResult DecompressionEngine::decompress(const std::string& item_id,
                                                    uint32_t target_level) const {
    DecompressionResult result;
    const MemoryItem* root = archive_.get(item_id);
    if (!root) {
        result.path.push_back("not found: " + item_id);
        return result;
    }

    uint32_t level = root->level();
    std::vector<MemoryItem> working = {*root};
    result.path.push_back("L" + std::to_string(level) + ": " + item_id);

    while (level > target_level && !working.empty()) {
        uint32_t below = level - 1;
        std::vector<MemoryItem> next;
        size_t found = 0;
        size_t substituted = 0;

        for (const auto& parent : working) {
            // Fallback items have no covers; they stand in at every level.
            if (parent.from_fallback()) {
                next.push_back(parent);
                continue;
            }
            size_t missing = 0;
            for (const auto& child_id : parent.covers()) {
                if (!archived_child(child_id, below)) ++missing;
            }
            std::vector<FallbackResult> external;
            if (missing > 0) external = query_external(parent, missing);

            // One item per cover id, in covers order.
            size_t miss_index = 0;
            for (const auto& child_id : parent.covers()) {
                if (const MemoryItem* child = archived_child(child_id, below)) {
                    next.push_back(*child);
                    ++found;
                    continue;
                }
                next.push_back(substitute(parent, child_id, miss_index, external, below));
                ++miss_index;
                ++substituted;
            }
        }

        if (found > 0) result.path.push_back(count_label(below, found, false));
        if (substituted > 0) {
            result.path.push_back(count_label(below, substituted, true));
            result.used_fallback = true;
        }
        working = std::move(next);
        level = below;
    }

    result.reached_level = static_cast<int>(level);
    result.items = std::move(working);
    result.success = !result.items.empty();
    return result;
}

const MemoryItem* DecompressionEngine::archived_child(const std::string& id,
                                                     uint32_t level) const {
    const MemoryItem* child = archive_.get(id);
    return (child && child->level() == level) ? child : nullptr;
}

std::vector<FallbackResult> DecompressionEngine::query_external(const MemoryItem& parent,
                                                                size_t missing) const {
    if (!fallback_) return {};
    try {
        auto results = fallback_->search(parent.text(), missing);
        if (results.size() > missing) results.resize(missing);
        return results;
    } catch (const std::exception& e) {
        std::cerr << "[decompress] " << fallback_->name() << " fallback failed for "
                  << parent.id() << ": " << e.what() << "\n";
    }
    return {};
}

// The external results fill the missing slots in order; once they run out,
// the remaining slots get synthetic placeholders.
MemoryItem DecompressionEngine::substitute(const MemoryItem& parent,
                                           const std::string& missing_id,
                                           size_t miss_index,
                                           const std::vector<FallbackResult>& external,
                                           uint32_t level) const {
    uint64_t now = epoch_millis();
    if (miss_index < external.size()) {
        const auto& result = external[miss_index];
        std::string id = result.id.empty() ? missing_id : result.id;
        return MemoryItem::placeholder(id, result.text, level, now);
    }
    return MemoryItem::placeholder(
        missing_id,
        "[Fallback] item " + std::to_string(miss_index + 1) + " of " +
            parent.text().substr(0, 50) + "...",
        level, now);
}

} // namespace strata
