#include "persistence.hpp"
#include "config.hpp"
#include "plugin.hpp"
#include <cctype>

namespace strata {

std::unique_ptr<PersistenceSink> create_sink(const PersistenceConfig& config) {
    return PluginRegistry::instance().create_sink(config.backend, config);
}

std::string encode_entity_id(const std::string& entity_id) {
    if (entity_id.empty()) return "%";
    bool dots_only = entity_id == "." || entity_id == "..";

    static const char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(entity_id.size());
    for (unsigned char c : entity_id) {
        bool keep = std::isalnum(c) || c == '_' || c == '-' || (c == '.' && !dots_only);
        if (keep) {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

} // namespace strata
