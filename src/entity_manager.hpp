#pragma once
#include "config.hpp"
#include "engine.hpp"
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace strata {

class SummarizationPort;
class ExternalMemoryFallback;
class PersistenceSink;

struct Entity {
    std::string id;
    std::shared_ptr<MemoryEngine> engine;
    uint64_t last_active = 0;
};

// Orchestration layer: one MemoryEngine per conversational entity, restored
// from the persistence sink on first use and snapshotted after every
// ingestion that compacted. Engines of distinct entities run independently.
class EntityManager {
public:
    using Clock = std::function<uint64_t()>;   // epoch seconds

    EntityManager(const LedgerConfig& config,
                  std::shared_ptr<SummarizationPort> port,
                  std::shared_ptr<ExternalMemoryFallback> fallback,
                  std::shared_ptr<PersistenceSink> sink,
                  size_t fallback_limit = 5,
                  Clock clock = {});

    // Get or create (restoring a stored snapshot when there is one).
    std::shared_ptr<MemoryEngine> get(const std::string& entity_id);

    IngestResult ingest(const std::string& entity_id, const std::string& text,
                        Role role, const std::string& speaker);

    // Snapshot now. False if the entity is not loaded or the sink failed.
    bool persist(const std::string& entity_id);
    void persist_all();

    // Drop without persisting.
    void remove(const std::string& entity_id);

    // Persist and drop entities idle for longer than max_idle_seconds.
    // Returns the number evicted.
    size_t evict_idle(uint64_t max_idle_seconds = 3600);

    // Loaded entity ids, sorted.
    std::vector<std::string> list() const;

private:
    bool snapshot(const std::string& entity_id, const MemoryEngine& engine);

    LedgerConfig config_;
    std::shared_ptr<SummarizationPort> port_;
    std::shared_ptr<ExternalMemoryFallback> fallback_;
    std::shared_ptr<PersistenceSink> sink_;
    size_t fallback_limit_;
    Clock clock_;

    std::unordered_map<std::string, Entity> entities_;
    mutable std::mutex mutex_;
};

} // namespace strata
