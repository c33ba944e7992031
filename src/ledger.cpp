#include "ledger.hpp"
#include <algorithm>
#include <unordered_set>

namespace strata {

void MemoryLedger::append(MemoryItem item) {
    items_.push_back(std::move(item));
}

size_t MemoryLedger::remove_many(const std::vector<std::string>& ids) {
    std::unordered_set<std::string> doomed(ids.begin(), ids.end());
    size_t before = items_.size();
    items_.erase(std::remove_if(items_.begin(), items_.end(),
                                [&](const MemoryItem& it) {
                                    return doomed.count(it.id()) > 0;
                                }),
                 items_.end());
    return before - items_.size();
}

void MemoryLedger::insert_at(size_t index, MemoryItem item) {
    if (index > items_.size()) index = items_.size();
    items_.insert(items_.begin() + static_cast<std::ptrdiff_t>(index),
                  std::move(item));
}

size_t MemoryLedger::active_char_total() const {
    size_t total = 0;
    for (const auto& it : items_) total += it.char_count();
    return total;
}

double MemoryLedger::summary_ratio() const {
    if (items_.empty()) return 0.0;
    return static_cast<double>(summary_count()) / static_cast<double>(items_.size());
}

size_t MemoryLedger::raw_count() const {
    return static_cast<size_t>(std::count_if(items_.begin(), items_.end(),
        [](const MemoryItem& it) { return it.is_raw(); }));
}

size_t MemoryLedger::summary_count() const {
    return items_.size() - raw_count();
}

std::optional<size_t> MemoryLedger::index_of(const std::string& id) const {
    for (size_t i = 0; i < items_.size(); ++i) {
        if (items_[i].id() == id) return i;
    }
    return std::nullopt;
}

const MemoryItem* MemoryLedger::find(const std::string& id) const {
    auto idx = index_of(id);
    return idx ? &items_[*idx] : nullptr;
}

} // namespace strata
