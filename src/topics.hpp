#pragma once
#include "memory_item.hpp"
#include <string>
#include <vector>

namespace strata {

// Lowercased words with punctuation turned into separators.
std::vector<std::string> tokenize(const std::string& text);

bool is_stop_word(const std::string& word);

// Up to 6 topics: words longer than 3 chars that are neither stop words nor
// numbers. Words longer than 6 chars rank first (by frequency, at most 4);
// when fewer than 3 of those exist the most frequent words fill up to 6.
std::vector<std::string> extract_topics(const std::string& text);
std::vector<std::string> extract_topics(const std::vector<MemoryItem>& items);

// Query keywords for relevance scoring: length > 2, no stop words, at most 5,
// first-occurrence order.
std::vector<std::string> extract_keywords(const std::string& query);

// min(1, len/1000*0.3 + words/50*0.2), +0.3 for assistant messages.
double authority_score(const std::string& text, Role role);

} // namespace strata
