#pragma once
#include "memory_item.hpp"
#include <map>
#include <string>
#include <vector>
#include <cstdint>
#include <unordered_map>

namespace strata {

struct ArchiveStats {
    size_t total = 0;
    std::map<uint32_t, size_t> counts_by_level;
    uint64_t oldest_at = 0;   // 0 when empty
    uint64_t newest_at = 0;
    std::string oldest_id;
    std::string newest_id;
};

// Append-only, per-level record of every item ever produced. Items are never
// removed; eviction only ever happens in the MemoryLedger.
class ArchiveStore {
public:
    // Returns false (and ignores the item) when the id is already archived.
    bool append(const MemoryItem& item);

    const MemoryItem* get(const std::string& id) const;

    // Archived items at level, in insertion order. Empty if none.
    const std::vector<MemoryItem>& items_at(uint32_t level) const;

    // Populated levels, ascending.
    std::vector<uint32_t> levels() const;
    uint32_t max_level() const;

    size_t size() const { return index_.size(); }
    bool empty() const { return index_.empty(); }

    ArchiveStats stats() const;

private:
    std::map<uint32_t, std::vector<MemoryItem>> by_level_;
    // id -> (level, position within level)
    std::unordered_map<std::string, std::pair<uint32_t, size_t>> index_;
};

} // namespace strata
