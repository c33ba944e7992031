#pragma once
#include "archive.hpp"
#include "memory_item.hpp"
#include <string>
#include <vector>

namespace strata {

class ExternalMemoryFallback;

enum class ResultSource { Archive, Fallback };

const char* source_to_string(ResultSource source);

struct SearchHit {
    MemoryItem item;
    double relevance = 0.0;
    ResultSource source = ResultSource::Archive;
};

struct SearchResult {
    std::vector<SearchHit> results;
    std::vector<std::string> path;   // e.g. "L2: 1 result"
    bool used_fallback = false;
};

struct SearchOptions {
    std::string query;
    std::vector<uint32_t> levels = {3, 2, 1, 0};
    double min_relevance = 0.1;
    size_t max_results = 10;
    bool include_fallback = true;
};

// Queries the archive top-down and falls back to the external memory service
// when no local item matches.
class ProactiveSearchEngine {
public:
    ProactiveSearchEngine(const ArchiveStore& archive, ExternalMemoryFallback* fallback,
                          size_t fallback_limit = 5);

    // Case-insensitive containment on text or topics, levels max_level..0,
    // stopping at the first level with a match.
    SearchResult search(const std::string& query, uint32_t max_level) const;

    // Relevance-ranked search over an explicit level set.
    SearchResult advanced_search(const SearchOptions& options) const;

    // Score in [0,1]; 0 when neither the query nor any keyword matches.
    static double relevance(const MemoryItem& item, const std::string& query,
                            const std::vector<std::string>& keywords);

private:
    std::vector<SearchHit> query_fallback(const std::string& query, size_t limit,
                                          std::vector<std::string>& path) const;

    const ArchiveStore& archive_;
    ExternalMemoryFallback* fallback_;
    size_t fallback_limit_;
};

} // namespace strata
