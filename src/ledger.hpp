#pragma once
#include "memory_item.hpp"
#include <string>
#include <vector>
#include <optional>
#include <cstddef>

namespace strata {

// Ordered container of the currently active items (raw + summaries that have
// not been merged further). Pure data structure: callers enforce the
// covers/protected-tail invariants.
class MemoryLedger {
public:
    void append(MemoryItem item);

    // Removes every item whose id is in ids. Returns the number removed.
    size_t remove_many(const std::vector<std::string>& ids);

    // index is clamped to size().
    void insert_at(size_t index, MemoryItem item);

    void clear() { items_.clear(); }

    size_t active_char_total() const;

    // #summaries / #items; 0 for an empty ledger.
    double summary_ratio() const;

    size_t raw_count() const;
    size_t summary_count() const;
    size_t size() const { return items_.size(); }
    bool empty() const { return items_.empty(); }

    const std::vector<MemoryItem>& items() const { return items_; }

    std::optional<size_t> index_of(const std::string& id) const;
    const MemoryItem* find(const std::string& id) const;

private:
    std::vector<MemoryItem> items_;
};

} // namespace strata
