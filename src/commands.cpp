#include "commands.hpp"
#include "engine.hpp"
#include "entity_manager.hpp"
#include "util.hpp"
#include <cstdio>
#include <cstdlib>
#include <sstream>

namespace strata {

static std::string percent(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f%%", v);
    return buf;
}

static std::string score(double v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f", v);
    return buf;
}

static std::string preview(const std::string& text, size_t max_words = 16) {
    std::string flat = text;
    for (auto& c : flat) {
        if (c == '\n') c = ' ';
    }
    return truncate_words(flat, max_words);
}

static std::string split_head(const std::string& args, std::string& rest) {
    std::string a = trim(args);
    auto space = a.find(' ');
    rest = (space == std::string::npos) ? "" : trim(a.substr(space + 1));
    return (space == std::string::npos) ? a : a.substr(0, space);
}

std::string cmd_stats(const MemoryEngine& engine) {
    auto s = engine.stats();
    std::ostringstream ss;
    ss << "Active: " << s.active_items << " items, " << s.active_chars << "/"
       << s.budget_max << " chars (" << percent(s.budget_used_percent) << ")\n"
       << "Summary ratio: " << score(s.summary_ratio) << "\n"
       << "Active by level:";
    for (const auto& [level, n] : s.active_by_level) ss << " L" << level << "=" << n;
    ss << "\nArchive: " << s.archive.total << " items,";
    for (const auto& [level, n] : s.archived_by_level) ss << " L" << level << "=" << n;
    if (s.archive.total > 0) {
        ss << "\n  oldest " << s.archive.oldest_id << " at " << iso_timestamp(s.archive.oldest_at)
           << "\n  newest " << s.archive.newest_id << " at " << iso_timestamp(s.archive.newest_at);
    }
    ss << "\n";
    return ss.str();
}

std::string cmd_ledger(const MemoryEngine& engine) {
    auto items = engine.ledger_snapshot();
    if (items.empty()) return "Ledger is empty.\n";
    std::ostringstream ss;
    for (const auto& item : items) {
        ss << "L" << item.level() << " " << item.id() << " ";
        if (item.is_summary()) {
            ss << "[covers " << item.covers().size() << "] ";
        } else {
            ss << "[" << role_to_string(item.role()) << "] ";
        }
        ss << preview(item.text()) << "\n";
    }
    return ss.str();
}

static void print_hits(std::ostringstream& ss, const SearchResult& r) {
    ss << "Path:";
    for (const auto& p : r.path) ss << " [" << p << "]";
    ss << (r.used_fallback ? " (fallback)" : "") << "\n";
    for (const auto& hit : r.results) {
        ss << "  L" << hit.item.level() << " " << hit.item.id()
           << " (" << source_to_string(hit.source) << ", " << score(hit.relevance) << ") "
           << preview(hit.item.text()) << "\n";
    }
}

std::string cmd_search(const MemoryEngine& engine, const std::string& query) {
    if (trim(query).empty()) return "Usage: /search <query>\n";
    auto s = engine.stats();
    uint32_t max_level = s.archived_by_level.empty() ? 0 : s.archived_by_level.rbegin()->first;
    auto r = engine.search(query, max_level);
    if (r.results.empty()) return "No results.\n";
    std::ostringstream ss;
    print_hits(ss, r);
    return ss.str();
}

std::string cmd_find(const MemoryEngine& engine, const std::string& query) {
    if (trim(query).empty()) return "Usage: /find <query>\n";
    SearchOptions opts;
    opts.query = query;
    auto r = engine.advanced_search(opts);
    if (r.results.empty()) return "No results.\n";
    std::ostringstream ss;
    print_hits(ss, r);
    return ss.str();
}

std::string cmd_decompress(const MemoryEngine& engine, const std::string& args) {
    std::string rest;
    std::string id = split_head(args, rest);
    if (id.empty()) return "Usage: /decompress <id> [level]\n";

    uint32_t target = 0;
    if (!rest.empty()) {
        char* end = nullptr;
        unsigned long v = std::strtoul(rest.c_str(), &end, 10);
        if (end == rest.c_str() || *end != '\0') return "Invalid level: " + rest + "\n";
        target = static_cast<uint32_t>(v);
    }

    auto r = engine.decompress(id, target);
    std::ostringstream ss;
    ss << "Path:";
    for (const auto& p : r.path) ss << " [" << p << "]";
    ss << "\n";
    if (!r.success) {
        ss << "Nothing to decompress.\n";
        return ss.str();
    }
    ss << "Reached L" << r.reached_level << (r.used_fallback ? " using fallback" : "") << ":\n";
    for (const auto& item : r.items) {
        ss << "  " << item.id() << (item.from_fallback() ? " (fallback)" : "") << ": "
           << preview(item.text(), 40) << "\n";
    }
    return ss.str();
}

std::string cmd_context(const MemoryEngine& engine, const std::string& query,
                        size_t max_chars) {
    std::string ctx = engine.build_context(query, max_chars);
    return ctx.empty() ? "Context is empty.\n" : ctx;
}

std::string cmd_export(const MemoryEngine& engine) {
    return engine.export_state().dump(2) + "\n";
}

std::string cmd_help() {
    return "Commands:\n"
           "  <text>                  Ingest text as the user\n"
           "  /as <role> <text>       Ingest as user, assistant or system\n"
           "  /stats                  Budget, ratio and archive counts\n"
           "  /ledger                 List active items\n"
           "  /search <query>         Top-down archive search\n"
           "  /find <query>           Relevance-ranked search\n"
           "  /decompress <id> [lvl]  Expand a summary down to level lvl (default 0)\n"
           "  /context [query]        Show the assembled prompt context\n"
           "  /export                 Dump ledger and archive as JSON\n"
           "  /clear                  Empty the active ledger (archive is kept)\n"
           "  /quit                   Exit\n";
}

std::string cmd_ingest(EntityManager& entities, const std::string& entity_id,
                       const std::string& text, Role role, const std::string& speaker) {
    auto r = entities.ingest(entity_id, text, role, speaker);
    if (!r.accepted) return "Rejected: " + r.error + "\n";
    std::ostringstream ss;
    ss << "Stored " << r.item_id << "\n";
    for (const auto& a : r.actions) {
        ss << "  " << action_kind_to_string(a.kind) << ": " << a.evicted_ids.size()
           << " items -> " << a.produced.front().id() << " (L"
           << a.produced.front().level() << "), " << a.budget_after << " chars active\n";
    }
    return ss.str();
}

std::string cmd_as(EntityManager& entities, const std::string& entity_id,
                   const std::string& args, const std::string& speaker) {
    std::string text;
    std::string role = split_head(args, text);
    if (role != "user" && role != "assistant" && role != "system") {
        return "Usage: /as <user|assistant|system> <text>\n";
    }
    return cmd_ingest(entities, entity_id, text, role_from_string(role), speaker);
}

std::string cmd_clear(EntityManager& entities, const std::string& entity_id) {
    entities.get(entity_id)->clear();
    return "Ledger cleared. Archive kept.\n";
}

std::string handle_line(const std::string& line, EntityManager& entities,
                        const std::string& entity_id, const std::string& speaker,
                        bool& quit) {
    quit = false;
    std::string l = trim(line);
    if (l.empty()) return "";
    if (l[0] != '/') return cmd_ingest(entities, entity_id, l, Role::User, speaker);

    std::string args;
    std::string cmd = split_head(l, args);
    if (cmd == "/quit" || cmd == "/exit") {
        quit = true;
        return "";
    }
    if (cmd == "/help") return cmd_help();
    if (cmd == "/as") return cmd_as(entities, entity_id, args, speaker);
    if (cmd == "/clear") return cmd_clear(entities, entity_id);

    auto engine = entities.get(entity_id);
    if (cmd == "/stats") return cmd_stats(*engine);
    if (cmd == "/ledger") return cmd_ledger(*engine);
    if (cmd == "/search") return cmd_search(*engine, args);
    if (cmd == "/find") return cmd_find(*engine, args);
    if (cmd == "/decompress") return cmd_decompress(*engine, args);
    if (cmd == "/context") return cmd_context(*engine, args);
    if (cmd == "/export") return cmd_export(*engine);
    return "Unknown command: " + cmd + "\n";
}

} // namespace strata
