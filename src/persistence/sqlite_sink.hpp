#pragma once
#include "../persistence.hpp"
#include <mutex>
#include <string>

struct sqlite3; // forward declare

namespace strata {

// Snapshots in table snapshots(entity_id, state, updated_at), plus an
// append-only mirror of every archived item in archive_items so the archive
// is queryable with plain SQL.
class SqliteSink : public PersistenceSink {
public:
    explicit SqliteSink(const std::string& path);
    ~SqliteSink() override;

    // Non-copyable
    SqliteSink(const SqliteSink&) = delete;
    SqliteSink& operator=(const SqliteSink&) = delete;

    bool snapshot(const std::string& entity_id, const nlohmann::json& state) override;
    std::optional<nlohmann::json> load(const std::string& entity_id) override;
    std::string backend_name() const override { return "sqlite"; }

    // Rows in archive_items for entity_id (optionally one level).
    size_t archived_count(const std::string& entity_id, int level = -1);

private:
    void init_schema();
    bool exec(const char* sql);

    std::string path_;
    sqlite3* db_ = nullptr;
    std::mutex mutex_;
};

} // namespace strata
