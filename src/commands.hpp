#pragma once
#include "memory_item.hpp"
#include <string>

namespace strata {

class MemoryEngine;
class EntityManager;

// Command handlers behind the REPL. Each returns the text to show.

std::string cmd_stats(const MemoryEngine& engine);
std::string cmd_ledger(const MemoryEngine& engine);
std::string cmd_search(const MemoryEngine& engine, const std::string& query);
std::string cmd_find(const MemoryEngine& engine, const std::string& query);
// args: "<id> [target_level]" (target defaults to 0)
std::string cmd_decompress(const MemoryEngine& engine, const std::string& args);
std::string cmd_context(const MemoryEngine& engine, const std::string& query,
                        size_t max_chars = 4000);
std::string cmd_export(const MemoryEngine& engine);
std::string cmd_help();

// These mutate entity state.
std::string cmd_ingest(EntityManager& entities, const std::string& entity_id,
                       const std::string& text, Role role, const std::string& speaker);
// args: "<user|assistant|system> <text>"
std::string cmd_as(EntityManager& entities, const std::string& entity_id,
                   const std::string& args, const std::string& speaker);
std::string cmd_clear(EntityManager& entities, const std::string& entity_id);

// Dispatches one REPL line: slash commands, or plain text ingested as the
// user. Sets quit for /quit and /exit.
std::string handle_line(const std::string& line, EntityManager& entities,
                        const std::string& entity_id, const std::string& speaker,
                        bool& quit);

} // namespace strata
