#include "sqlite_sink.hpp"
#include "../config.hpp"
#include "../plugin.hpp"
#include "../util.hpp"
#include <sqlite3.h>
#include <filesystem>
#include <iostream>
#include <stdexcept>

static strata::SinkRegistrar reg_sqlite("sqlite",
    [](const strata::PersistenceConfig& config) {
        std::string path = config.path;
        if (path.empty()) {
            path = strata::expand_home("~/.strata/strata.db");
        }
        return std::make_unique<strata::SqliteSink>(path);
    });

namespace strata {

// RAII wrapper for sqlite3_stmt
struct StmtGuard {
    sqlite3_stmt* stmt = nullptr;
    ~StmtGuard() { if (stmt) sqlite3_finalize(stmt); }
};

SqliteSink::SqliteSink(const std::string& path) : path_(path) {
    // Ensure parent directory exists
    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }

    if (sqlite3_open(path_.c_str(), &db_) != SQLITE_OK) {
        std::string err = db_ ? sqlite3_errmsg(db_) : "unknown error";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw std::runtime_error("SqliteSink: failed to open database: " + err);
    }

    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);
    sqlite3_exec(db_, "PRAGMA synchronous=NORMAL;", nullptr, nullptr, nullptr);

    init_schema();
}

SqliteSink::~SqliteSink() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool SqliteSink::exec(const char* sql) {
    char* err = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &err) != SQLITE_OK) {
        std::cerr << "[sqlite_sink] " << (err ? err : "unknown error") << "\n";
        sqlite3_free(err);
        return false;
    }
    return true;
}

void SqliteSink::init_schema() {
    bool ok = exec(
        "CREATE TABLE IF NOT EXISTS snapshots ("
        "  entity_id  TEXT PRIMARY KEY,"
        "  state      TEXT NOT NULL,"
        "  updated_at INTEGER NOT NULL"
        ");");
    ok = ok && exec(
        "CREATE TABLE IF NOT EXISTS archive_items ("
        "  entity_id  TEXT NOT NULL,"
        "  id         TEXT NOT NULL,"
        "  level      INTEGER NOT NULL,"
        "  kind       TEXT NOT NULL,"
        "  text       TEXT NOT NULL,"
        "  covers     TEXT NOT NULL,"
        "  created_at INTEGER NOT NULL,"
        "  PRIMARY KEY (entity_id, id)"
        ");");
    ok = ok && exec(
        "CREATE INDEX IF NOT EXISTS idx_archive_level "
        "ON archive_items(entity_id, level);");
    if (!ok) {
        throw std::runtime_error("SqliteSink: failed to create schema in " + path_);
    }
}

bool SqliteSink::snapshot(const std::string& entity_id, const nlohmann::json& state) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!exec("BEGIN;")) return false;

    bool ok = true;
    {
        StmtGuard g;
        const char* sql =
            "INSERT INTO snapshots (entity_id, state, updated_at) VALUES (?, ?, ?) "
            "ON CONFLICT(entity_id) DO UPDATE SET state = excluded.state, "
            "updated_at = excluded.updated_at;";
        std::string body = state.dump();
        ok = sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) == SQLITE_OK;
        if (ok) {
            sqlite3_bind_text(g.stmt, 1, entity_id.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(g.stmt, 2, body.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_int64(g.stmt, 3, static_cast<sqlite3_int64>(epoch_seconds()));
            ok = sqlite3_step(g.stmt) == SQLITE_DONE;
        }
    }

    if (ok && state.contains("archive") && state["archive"].is_array()) {
        StmtGuard g;
        const char* sql =
            "INSERT OR IGNORE INTO archive_items "
            "(entity_id, id, level, kind, text, covers, created_at) "
            "VALUES (?, ?, ?, ?, ?, ?, ?);";
        ok = sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) == SQLITE_OK;
        for (const auto& item : state["archive"]) {
            if (!ok) break;
            if (!item.is_object()) continue;
            std::string id = item.value("id", "");
            std::string kind = item.value("kind", "raw");
            std::string text = item.value("text", "");
            std::string covers = item.contains("covers") ? item["covers"].dump() : "[]";
            sqlite3_reset(g.stmt);
            sqlite3_bind_text(g.stmt, 1, entity_id.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(g.stmt, 2, id.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_int(g.stmt, 3, item.value("level", 0));
            sqlite3_bind_text(g.stmt, 4, kind.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(g.stmt, 5, text.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_text(g.stmt, 6, covers.c_str(), -1, SQLITE_TRANSIENT);
            sqlite3_bind_int64(g.stmt, 7,
                static_cast<sqlite3_int64>(item.value("created_at", uint64_t{0})));
            ok = sqlite3_step(g.stmt) == SQLITE_DONE;
        }
    }

    if (!ok) {
        std::cerr << "[sqlite_sink] Snapshot of " << entity_id << " failed: "
                  << sqlite3_errmsg(db_) << "\n";
        exec("ROLLBACK;");
        return false;
    }
    return exec("COMMIT;");
}

std::optional<nlohmann::json> SqliteSink::load(const std::string& entity_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    StmtGuard g;
    const char* sql = "SELECT state FROM snapshots WHERE entity_id = ?;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) return std::nullopt;
    sqlite3_bind_text(g.stmt, 1, entity_id.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(g.stmt) != SQLITE_ROW) return std::nullopt;

    const auto* text = sqlite3_column_text(g.stmt, 0);
    if (!text) return std::nullopt;
    auto j = nlohmann::json::parse(reinterpret_cast<const char*>(text), nullptr, false);
    if (j.is_discarded()) {
        std::cerr << "[sqlite_sink] Ignoring corrupt snapshot for " << entity_id << "\n";
        return std::nullopt;
    }
    return j;
}

size_t SqliteSink::archived_count(const std::string& entity_id, int level) {
    std::lock_guard<std::mutex> lock(mutex_);
    StmtGuard g;
    const char* sql = level < 0
        ? "SELECT COUNT(*) FROM archive_items WHERE entity_id = ?;"
        : "SELECT COUNT(*) FROM archive_items WHERE entity_id = ? AND level = ?;";
    if (sqlite3_prepare_v2(db_, sql, -1, &g.stmt, nullptr) != SQLITE_OK) return 0;
    sqlite3_bind_text(g.stmt, 1, entity_id.c_str(), -1, SQLITE_TRANSIENT);
    if (level >= 0) sqlite3_bind_int(g.stmt, 2, level);
    if (sqlite3_step(g.stmt) != SQLITE_ROW) return 0;
    return static_cast<size_t>(sqlite3_column_int64(g.stmt, 0));
}

} // namespace strata
