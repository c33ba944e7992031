#pragma once
#include <memory>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace strata {

struct PersistenceConfig;

// Durable store for per-entity engine snapshots (MemoryEngine::export_state).
// Invoked by the orchestration layer, never by the engine itself.
class PersistenceSink {
public:
    virtual ~PersistenceSink() = default;

    // Replace the stored snapshot for entity_id. Returns false on failure.
    virtual bool snapshot(const std::string& entity_id, const nlohmann::json& state) = 0;

    // Last stored snapshot, or nullopt if none (or unreadable).
    virtual std::optional<nlohmann::json> load(const std::string& entity_id) = 0;

    virtual std::string backend_name() const = 0;
};

// Factory over the plugin registry. Throws std::invalid_argument for unknown
// backends.
std::unique_ptr<PersistenceSink> create_sink(const PersistenceConfig& config);

// Entity id -> file name component. [A-Za-z0-9_.-] are kept and every other
// byte becomes %XX, so distinct ids never share a name. "." and ".." are
// fully escaped; the empty id maps to "%".
std::string encode_entity_id(const std::string& entity_id);

} // namespace strata
