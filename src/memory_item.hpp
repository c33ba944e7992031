#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace strata {

enum class ItemKind { Raw, Summary };

enum class Role { User, Assistant, System };

// Where an item came from: the local archive, or a degraded substitute
// produced by a fallback path (never archived, never in the ledger).
enum class ItemOrigin { Local, Fallback };

// Ranking signals in [0,1]. Not used for correctness.
struct Quality {
    double authority = 0.5;
    double feedback = 0.5;
    double access_cost = 0.1;
};

// A ledger/archive entry. Raw items are level 0 and cover nothing; summaries
// are level >= 1 and cover at least one item exactly one level below. The
// factories enforce this, so there is no public way to build a summary
// without covers.
class MemoryItem {
public:
    static MemoryItem raw(std::string id, std::string text, Role role,
                          uint64_t created_at);

    // Throws std::invalid_argument if level == 0 or covers is empty.
    static MemoryItem summary(std::string id, std::string text, uint32_t level,
                              std::vector<std::string> covers,
                              uint64_t created_at);

    // Synthetic stand-in returned by degraded decompression/search paths.
    static MemoryItem placeholder(std::string id, std::string text,
                                  uint32_t level, uint64_t created_at);

    const std::string& id() const { return id_; }
    ItemKind kind() const { return kind_; }
    bool is_raw() const { return kind_ == ItemKind::Raw; }
    bool is_summary() const { return kind_ == ItemKind::Summary; }
    uint32_t level() const { return level_; }
    const std::string& text() const { return text_; }
    size_t char_count() const { return char_count_; }
    Role role() const { return role_; }
    uint64_t created_at() const { return created_at_; }
    ItemOrigin origin() const { return origin_; }
    bool from_fallback() const { return origin_ == ItemOrigin::Fallback; }

    // Direct children, one level below, in coverage order.
    const std::vector<std::string>& covers() const { return covers_; }

    // For merged summaries: deduplicated covers of the merged inputs, in
    // input order. Empty for raw items and level-1 summaries.
    const std::vector<std::string>& inherited_covers() const { return inherited_covers_; }
    void set_inherited_covers(std::vector<std::string> ids);

    const std::vector<std::string>& topics() const { return topics_; }
    void set_topics(std::vector<std::string> topics); // deduplicates

    const Quality& quality() const { return quality_; }
    void set_quality(const Quality& q) { quality_ = q; }

private:
    MemoryItem() = default;

    std::string id_;
    ItemKind kind_ = ItemKind::Raw;
    uint32_t level_ = 0;
    std::string text_;
    size_t char_count_ = 0;
    Role role_ = Role::User;
    std::vector<std::string> topics_;
    std::vector<std::string> covers_;
    std::vector<std::string> inherited_covers_;
    uint64_t created_at_ = 0;
    Quality quality_;
    ItemOrigin origin_ = ItemOrigin::Local;
};

// Role string conversions
const char* role_to_string(Role role);
Role role_from_string(const std::string& s);

const char* kind_to_string(ItemKind kind);

// Item id with a level prefix: "msg_<hex>" for raw items, "l<k>_<hex>" for summaries.
std::string make_item_id(uint32_t level);

} // namespace strata
