#include "memory_item.hpp"
#include "util.hpp"
#include <stdexcept>
#include <unordered_set>

namespace strata {

static std::vector<std::string> dedup_keep_order(std::vector<std::string> values) {
    std::unordered_set<std::string> seen;
    std::vector<std::string> out;
    out.reserve(values.size());
    for (auto& v : values) {
        if (seen.insert(v).second) {
            out.push_back(std::move(v));
        }
    }
    return out;
}

MemoryItem MemoryItem::raw(std::string id, std::string text, Role role,
                           uint64_t created_at) {
    MemoryItem item;
    item.id_ = std::move(id);
    item.kind_ = ItemKind::Raw;
    item.level_ = 0;
    item.text_ = std::move(text);
    item.char_count_ = item.text_.size();
    item.role_ = role;
    item.created_at_ = created_at;
    return item;
}

MemoryItem MemoryItem::summary(std::string id, std::string text, uint32_t level,
                               std::vector<std::string> covers,
                               uint64_t created_at) {
    if (level == 0) {
        throw std::invalid_argument("summary level must be >= 1: " + id);
    }
    if (covers.empty()) {
        throw std::invalid_argument("summary must cover at least one item: " + id);
    }
    MemoryItem item;
    item.id_ = std::move(id);
    item.kind_ = ItemKind::Summary;
    item.level_ = level;
    item.text_ = std::move(text);
    item.char_count_ = item.text_.size();
    item.role_ = Role::Assistant;
    item.covers_ = dedup_keep_order(std::move(covers));
    item.created_at_ = created_at;
    return item;
}

MemoryItem MemoryItem::placeholder(std::string id, std::string text,
                                   uint32_t level, uint64_t created_at) {
    MemoryItem item;
    item.id_ = std::move(id);
    item.kind_ = level == 0 ? ItemKind::Raw : ItemKind::Summary;
    item.level_ = level;
    item.text_ = std::move(text);
    item.char_count_ = item.text_.size();
    item.role_ = Role::Assistant;
    item.created_at_ = created_at;
    item.origin_ = ItemOrigin::Fallback;
    item.quality_ = Quality{0.5, 0.5, 0.1};
    return item;
}

void MemoryItem::set_inherited_covers(std::vector<std::string> ids) {
    inherited_covers_ = dedup_keep_order(std::move(ids));
}

void MemoryItem::set_topics(std::vector<std::string> topics) {
    topics_ = dedup_keep_order(std::move(topics));
}

const char* role_to_string(Role role) {
    switch (role) {
        case Role::User:      return "user";
        case Role::Assistant: return "assistant";
        case Role::System:    return "system";
    }
    return "user";
}

Role role_from_string(const std::string& s) {
    if (s == "assistant") return Role::Assistant;
    if (s == "system")    return Role::System;
    return Role::User;
}

const char* kind_to_string(ItemKind kind) {
    return kind == ItemKind::Summary ? "summary" : "raw";
}

std::string make_item_id(uint32_t level) {
    if (level == 0) return "msg_" + generate_id();
    return "l" + std::to_string(level) + "_" + generate_id();
}

} // namespace strata
