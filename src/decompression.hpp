#pragma once
#include "archive.hpp"
#include "fallback.hpp"
#include "memory_item.hpp"
#include <string>
#include <vector>

namespace strata {

struct DecompressionResult {
    bool success = false;
    int reached_level = -1;            // -1 when the id was not found
    std::vector<MemoryItem> items;     // working set at reached_level, in covers order
    std::vector<std::string> path;     // "L2: l2_ab12", "L1: 2 items", "L0: 3 items (fallback)"
    bool used_fallback = false;
};

// Walks the covers graph downward through the archive. Every cover id yields
// exactly one item, in covers order. Missing children are replaced by
// fallback-tagged items: external results while they last, synthetic
// placeholders after that.
class DecompressionEngine {
public:
    DecompressionEngine(const ArchiveStore& archive, ExternalMemoryFallback* fallback);

    DecompressionResult decompress(const std::string& item_id, uint32_t target_level) const;

private:
    const MemoryItem* archived_child(const std::string& id, uint32_t level) const;

    // Empty when there is no fallback or it fails.
    std::vector<FallbackResult> query_external(const MemoryItem& parent, size_t missing) const;

    MemoryItem substitute(const MemoryItem& parent, const std::string& missing_id,
                          size_t miss_index, const std::vector<FallbackResult>& external,
                          uint32_t level) const;

    const ArchiveStore& archive_;
    ExternalMemoryFallback* fallback_;
};

} // namespace strata
