#pragma once
#include "memory_item.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

namespace strata {

// Shared JSON <-> MemoryItem conversion used by snapshots, persistence sinks
// and the CLI export.

inline nlohmann::json item_to_json(const MemoryItem& item) {
    nlohmann::json j = {
        {"id", item.id()},
        {"kind", kind_to_string(item.kind())},
        {"level", item.level()},
        {"text", item.text()},
        {"role", role_to_string(item.role())},
        {"created_at", item.created_at()},
        {"topics", item.topics()},
        {"quality", {
            {"authority", item.quality().authority},
            {"feedback", item.quality().feedback},
            {"access_cost", item.quality().access_cost}
        }}
    };
    if (item.is_summary()) {
        j["covers"] = item.covers();
        if (!item.inherited_covers().empty()) {
            j["inherited_covers"] = item.inherited_covers();
        }
    }
    return j;
}

inline std::vector<std::string> string_array(const nlohmann::json& j,
                                          const char* key) {
    std::vector<std::string> out;
    if (j.contains(key) && j[key].is_array()) {
        for (const auto& v : j[key]) {
            if (v.is_string()) out.push_back(v.get<std::string>());
        }
    }
    return out;
}

// Throws std::invalid_argument for records that would break item invariants
// (missing id, summary without covers).
inline MemoryItem item_from_json(const nlohmann::json& j) {
    if (!j.is_object()) throw std::invalid_argument("item record is not an object");

    std::string id = j.value("id", "");
    if (id.empty()) throw std::invalid_argument("item record has no id");

    std::string text = j.value("text", "");
    uint64_t created_at = j.value("created_at", uint64_t{0});
    Role role = role_from_string(j.value("role", "user"));

    bool summary = j.value("kind", "raw") == "summary";
    MemoryItem item = summary
        ? MemoryItem::summary(id, text, j.value("level", 1u),
                              string_array(j, "covers"), created_at)
        : MemoryItem::raw(id, text, role, created_at);

    item.set_topics(string_array(j, "topics"));
    if (summary) {
        item.set_inherited_covers(string_array(j, "inherited_covers"));
    }
    if (j.contains("quality") && j["quality"].is_object()) {
        const auto& q = j["quality"];
        Quality quality;
        quality.authority = q.value("authority", quality.authority);
        quality.feedback = q.value("feedback", quality.feedback);
        quality.access_cost = q.value("access_cost", quality.access_cost);
        item.set_quality(quality);
    }
    return item;
}

} // namespace strata
