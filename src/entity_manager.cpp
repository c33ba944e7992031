#include "entity_manager.hpp"
#include "persistence.hpp"
#include "util.hpp"
#include <algorithm>
#include <iostream>

namespace strata {

EntityManager::EntityManager(const LedgerConfig& config,
                             std::shared_ptr<SummarizationPort> port,
                             std::shared_ptr<ExternalMemoryFallback> fallback,
                             std::shared_ptr<PersistenceSink> sink,
                             size_t fallback_limit,
                             Clock clock)
    : config_(config), port_(std::move(port)), fallback_(std::move(fallback)),
      sink_(std::move(sink)), fallback_limit_(fallback_limit),
      clock_(clock ? std::move(clock) : Clock(epoch_seconds)) {}

std::shared_ptr<MemoryEngine> EntityManager::get(const std::string& entity_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entities_.find(entity_id);
    if (it != entities_.end()) {
        it->second.last_active = clock_();
        return it->second.engine;
    }

    auto engine = std::make_shared<MemoryEngine>(config_, port_, fallback_, fallback_limit_);
    if (sink_) {
        if (auto state = sink_->load(entity_id)) {
            auto imported = engine->import_state(*state);
            if (imported.ok) {
                std::cerr << "[entities] Restored " << entity_id << " ("
                          << imported.ledger_items << " active, "
                          << imported.archived_items << " archived)\n";
            } else {
                std::cerr << "[entities] Starting " << entity_id
                          << " empty, stored snapshot unusable: " << imported.error << "\n";
            }
        }
    }

    Entity entity;
    entity.id = entity_id;
    entity.engine = engine;
    entity.last_active = clock_();
    entities_[entity_id] = std::move(entity);
    return engine;
}

IngestResult EntityManager::ingest(const std::string& entity_id, const std::string& text,
                                   Role role, const std::string& speaker) {
    auto engine = get(entity_id);
    IngestResult result = engine->ingest(text, role, speaker);
    if (result.accepted && !result.actions.empty()) {
        snapshot(entity_id, *engine);
    }
    return result;
}

bool EntityManager::snapshot(const std::string& entity_id, const MemoryEngine& engine) {
    if (!sink_) return true;
    if (!sink_->snapshot(entity_id, engine.export_state())) {
        std::cerr << "[entities] Snapshot of " << entity_id << " to "
                  << sink_->backend_name() << " failed\n";
        return false;
    }
    return true;
}

bool EntityManager::persist(const std::string& entity_id) {
    std::shared_ptr<MemoryEngine> engine;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entities_.find(entity_id);
        if (it == entities_.end()) return false;
        engine = it->second.engine;
    }
    return snapshot(entity_id, *engine);
}

void EntityManager::persist_all() {
    for (const auto& id : list()) {
        persist(id);
    }
}

void EntityManager::remove(const std::string& entity_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    entities_.erase(entity_id);
}

size_t EntityManager::evict_idle(uint64_t max_idle_seconds) {
    std::vector<Entity> evicted;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        uint64_t now = clock_();
        for (auto it = entities_.begin(); it != entities_.end(); ) {
            if (now - it->second.last_active > max_idle_seconds) {
                evicted.push_back(std::move(it->second));
                it = entities_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (const auto& entity : evicted) {
        snapshot(entity.id, *entity.engine);
    }
    return evicted.size();
}

std::vector<std::string> EntityManager::list() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(entities_.size());
    for (const auto& [id, _] : entities_) {
        ids.push_back(id);
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

} // namespace strata
