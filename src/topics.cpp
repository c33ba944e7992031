#include "topics.hpp"
#include "util.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_map>
#include <unordered_set>

namespace strata {

std::vector<std::string> tokenize(const std::string& text) {
    std::vector<std::string> words;
    std::string current;
    for (unsigned char c : text) {
        // Bytes >= 0x80 stay inside words so UTF-8 letters are not split.
        if (std::isalnum(c) || c == '_' || c >= 0x80) {
            current += static_cast<char>(std::tolower(c));
        } else if (!current.empty()) {
            words.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) words.push_back(std::move(current));
    return words;
}

bool is_stop_word(const std::string& word) {
    static const std::unordered_set<std::string> stop = {
        "the", "and", "for", "are", "but", "not", "you", "all", "any", "can",
        "had", "her", "was", "one", "our", "out", "has", "have", "him", "his",
        "how", "its", "may", "who", "did", "get", "let", "she", "too", "use",
        "that", "this", "with", "from", "they", "them", "then", "than", "there",
        "their", "what", "when", "where", "which", "while", "would", "could",
        "should", "about", "into", "just", "like", "also", "very", "some",
        "been", "were", "will", "your", "more", "most", "such", "only", "over",
        "these", "those", "because", "does", "each", "much", "many", "here",
        // French, as the persona converses in both
        "comme", "sont", "plus", "pour", "avec", "dans", "sur", "par", "que",
        "qui", "quoi", "comment", "pourquoi", "quand", "donc", "mais", "alors",
        "aussi", "bien", "tout", "tous", "toute", "toutes", "cette", "ces",
        "cet", "ceux", "celles", "les", "des", "une", "est"
    };
    return stop.count(word) > 0;
}

static bool is_number(const std::string& word) {
    return std::all_of(word.begin(), word.end(),
                       [](unsigned char c) { return std::isdigit(c); });
}

std::vector<std::string> extract_topics(const std::string& text) {
    std::vector<std::string> order;
    std::unordered_map<std::string, int> freq;
    for (auto& w : tokenize(text)) {
        if (w.size() <= 3 || is_stop_word(w) || is_number(w)) continue;
        if (freq[w]++ == 0) order.push_back(w);
    }

    // Frequency desc, first occurrence breaks ties.
    std::stable_sort(order.begin(), order.end(),
                     [&](const std::string& a, const std::string& b) {
                         return freq[a] > freq[b];
                     });

    std::vector<std::string> topics;
    for (const auto& w : order) {
        if (w.size() > 6) topics.push_back(w);
        if (topics.size() == 4) break;
    }
    if (topics.size() >= 3) return topics;

    for (const auto& w : order) {
        if (topics.size() >= 6) break;
        if (std::find(topics.begin(), topics.end(), w) == topics.end()) {
            topics.push_back(w);
        }
    }
    return topics;
}

std::vector<std::string> extract_topics(const std::vector<MemoryItem>& items) {
    std::string all;
    for (const auto& item : items) {
        if (!all.empty()) all += ' ';
        all += item.text();
    }
    return extract_topics(all);
}

std::vector<std::string> extract_keywords(const std::string& query) {
    std::vector<std::string> out;
    for (auto& w : tokenize(query)) {
        if (w.size() <= 2 || is_stop_word(w)) continue;
        if (std::find(out.begin(), out.end(), w) != out.end()) continue;
        out.push_back(std::move(w));
        if (out.size() == 5) break;
    }
    return out;
}

double authority_score(const std::string& text, Role role) {
    double len = static_cast<double>(text.size());
    double words = static_cast<double>(split_words(text).size());
    double score = len / 1000.0 * 0.3 + words / 50.0 * 0.2;
    if (role == Role::Assistant) score += 0.3;
    return std::min(1.0, score);
}

} // namespace strata
