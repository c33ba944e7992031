#include "search.hpp"
#include "fallback.hpp"
#include "topics.hpp"
#include "util.hpp"
#include <algorithm>
#include <iostream>

namespace strata {

const char* source_to_string(ResultSource source) {
    return source == ResultSource::Fallback ? "fallback" : "archive";
}

ProactiveSearchEngine::ProactiveSearchEngine(const ArchiveStore& archive,
                                             ExternalMemoryFallback* fallback,
                                             size_t fallback_limit)
    : archive_(archive), fallback_(fallback), fallback_limit_(fallback_limit) {}

static std::string results_label(const std::string& where, size_t n) {
    return where + ": " + std::to_string(n) + (n == 1 ? " result" : " results");
}

static bool matches(const MemoryItem& item, const std::string& query) {
    if (contains_ci(item.text(), query)) return true;
    for (const auto& topic : item.topics()) {
        if (contains_ci(topic, query)) return true;
    }
    return false;
}

SearchResult ProactiveSearchEngine::search(const std::string& query, uint32_t max_level) const {
    SearchResult result;
    std::string q = trim(query);
    if (q.empty()) return result;

    auto keywords = extract_keywords(q);
    for (int64_t level = max_level; level >= 0; --level) {
        for (const auto& item : archive_.items_at(static_cast<uint32_t>(level))) {
            if (!matches(item, q)) continue;
            double score = relevance(item, q, keywords);
            result.results.push_back({item, score, ResultSource::Archive});
        }
        if (!result.results.empty()) {
            result.path.push_back(results_label("L" + std::to_string(level),
                                                result.results.size()));
            return result;
        }
    }

    result.results = query_fallback(q, fallback_limit_, result.path);
    result.used_fallback = !result.results.empty();
    return result;
}

SearchResult ProactiveSearchEngine::advanced_search(const SearchOptions& options) const {
    SearchResult result;
    std::string q = trim(options.query);
    if (q.empty()) return result;

    auto keywords = extract_keywords(q);
    for (uint32_t level : options.levels) {
        size_t before = result.results.size();
        for (const auto& item : archive_.items_at(level)) {
            double score = relevance(item, q, keywords);
            if (score > 0.0 && score >= options.min_relevance) {
                result.results.push_back({item, score, ResultSource::Archive});
            }
        }
        size_t added = result.results.size() - before;
        if (added > 0) {
            result.path.push_back(results_label("L" + std::to_string(level), added));
        }
    }

    std::stable_sort(result.results.begin(), result.results.end(),
                     [](const SearchHit& a, const SearchHit& b) {
                         if (a.relevance != b.relevance) return a.relevance > b.relevance;
                         if (a.item.level() != b.item.level()) return a.item.level() > b.item.level();
                         return a.item.created_at() > b.item.created_at();
                     });
    if (result.results.size() > options.max_results) {
        result.results.erase(result.results.begin() + static_cast<std::ptrdiff_t>(options.max_results), result.results.end());
    }

    if (result.results.empty() && options.include_fallback) {
        result.results = query_fallback(q, options.max_results, result.path);
        result.used_fallback = !result.results.empty();
    }
    return result;
}

double ProactiveSearchEngine::relevance(const MemoryItem& item, const std::string& query,
                                        const std::vector<std::string>& keywords) {
    double score = 0.0;
    if (contains_ci(item.text(), query)) score += 0.8;
    for (const auto& kw : keywords) {
        if (contains_ci(item.text(), kw)) score += 0.3;
    }
    for (const auto& topic : item.topics()) {
        bool hit = std::any_of(keywords.begin(), keywords.end(),
                               [&](const std::string& kw) { return contains_ci(topic, kw); });
        if (hit) score += 0.2;
    }
    if (score == 0.0) return 0.0;

    // Granular levels first, then authority.
    score += std::max(0, 4 - static_cast<int>(item.level())) * 0.1;
    score += item.quality().authority * 0.1;
    return std::min(score, 1.0);
}

std::vector<SearchHit> ProactiveSearchEngine::query_fallback(const std::string& query,
                                                             size_t limit,
                                                             std::vector<std::string>& path) const {
    std::vector<SearchHit> hits;
    if (!fallback_ || limit == 0) return hits;

    try {
        auto results = fallback_->search(query, limit);
        uint64_t now = epoch_millis();
        for (auto& r : results) {
            std::string id = r.id.empty() ? "ext_" + generate_id() : r.id;
            double score = std::min(1.0, std::max(0.0, r.score));
            hits.push_back({MemoryItem::placeholder(id, r.text, 0, now), score,
                            ResultSource::Fallback});
            if (hits.size() >= limit) break;
        }
    } catch (const std::exception& e) {
        std::cerr << "[search] " << fallback_->name() << " fallback failed: "
                  << e.what() << "\n";
    }
    path.push_back(results_label("fallback", hits.size()));
    return hits;
}

} // namespace strata
