#include "archive.hpp"
#include <iostream>

namespace strata {

bool ArchiveStore::append(const MemoryItem& item) {
    if (index_.count(item.id())) {
        std::cerr << "[archive] Duplicate id ignored: " << item.id() << "\n";
        return false;
    }
    auto& bucket = by_level_[item.level()];
    index_[item.id()] = {item.level(), bucket.size()};
    bucket.push_back(item);
    return true;
}

const MemoryItem* ArchiveStore::get(const std::string& id) const {
    auto it = index_.find(id);
    if (it == index_.end()) return nullptr;
    return &by_level_.at(it->second.first)[it->second.second];
}

const std::vector<MemoryItem>& ArchiveStore::items_at(uint32_t level) const {
    static const std::vector<MemoryItem> empty;
    auto it = by_level_.find(level);
    return it == by_level_.end() ? empty : it->second;
}

std::vector<uint32_t> ArchiveStore::levels() const {
    std::vector<uint32_t> out;
    for (const auto& [level, items] : by_level_) {
        if (!items.empty()) out.push_back(level);
    }
    return out;
}

uint32_t ArchiveStore::max_level() const {
    auto lv = levels();
    return lv.empty() ? 0 : lv.back();
}

ArchiveStats ArchiveStore::stats() const {
    ArchiveStats s;
    for (const auto& [level, items] : by_level_) {
        if (items.empty()) continue;
        s.counts_by_level[level] = items.size();
        s.total += items.size();
        for (const auto& item : items) {
            if (s.oldest_id.empty() || item.created_at() < s.oldest_at) {
                s.oldest_at = item.created_at();
                s.oldest_id = item.id();
            }
            if (s.newest_id.empty() || item.created_at() >= s.newest_at) {
                s.newest_at = item.created_at();
                s.newest_id = item.id();
            }
        }
    }
    return s;
}

} // namespace strata
