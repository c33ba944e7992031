#pragma once
#include "memory_item.hpp"
#include <string>
#include <vector>

namespace strata {

// Persona system prompt shared by both summarization calls.
std::string build_persona_prompt(const std::string& persona);

// Level-1 prompt over raw conversation items, addressed to speaker by name.
std::string build_l1_prompt(const std::vector<MemoryItem>& items,
                            const std::string& speaker,
                            const std::string& persona,
                            uint32_t max_words);

// Level-k merge prompt over same-level summaries.
std::string build_merge_prompt(const std::vector<MemoryItem>& summaries,
                               uint32_t target_level,
                               const std::string& speaker,
                               const std::string& persona,
                               uint32_t max_words);

} // namespace strata
