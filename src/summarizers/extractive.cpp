#include "extractive.hpp"
#include "../topics.hpp"
#include "../util.hpp"
#include <algorithm>
#include <sstream>

namespace strata {

static constexpr size_t kSentenceWords = 12;
static constexpr size_t kMinChars = 60;

static std::string first_sentence(const std::string& text) {
    size_t end = text.find_first_of(".!?\n");
    std::string s = trim(end == std::string::npos ? text : text.substr(0, end));
    return truncate_words(s, kSentenceWords);
}

// Text after a "**Label:**" marker up to the end of that line, if present.
static std::string section(const std::string& text, const std::string& label) {
    std::string marker = "**" + label + ":**";
    size_t pos = text.find(marker);
    if (pos == std::string::npos) return "";
    pos += marker.size();
    size_t end = text.find('\n', pos);
    return trim(text.substr(pos, end == std::string::npos ? std::string::npos : end - pos));
}

static std::string fit(const std::string& text, size_t max_words, size_t max_chars) {
    std::string out = truncate_words(text, max_words);
    if (out.size() <= max_chars) return out;
    size_t cut = out.rfind(' ', max_chars > 3 ? max_chars - 3 : 0);
    if (cut == std::string::npos || cut == 0) cut = max_chars > 3 ? max_chars - 3 : max_chars;
    return trim(out.substr(0, cut)) + "...";
}

static size_t char_budget(const std::vector<MemoryItem>& items) {
    size_t total = 0;
    for (const auto& item : items) total += item.char_count();
    return std::max(kMinChars, total / 2);
}

static std::string concepts_line(const std::vector<MemoryItem>& items) {
    auto topics = extract_topics(items);
    if (topics.size() > 5) topics.resize(5);
    std::ostringstream ss;
    ss << "**Key concepts:** ";
    for (size_t i = 0; i < topics.size(); ++i) {
        ss << (i ? ", " : "") << topics[i];
    }
    return ss.str();
}

ExtractiveSummarizer::ExtractiveSummarizer(uint32_t l1_max_words, uint32_t merge_max_words)
    : l1_max_words_(l1_max_words), merge_max_words_(merge_max_words) {}

std::string ExtractiveSummarizer::summarize(const std::vector<MemoryItem>& items,
                                            const std::string& speaker) {
    if (items.empty()) throw PortError("summarize called with no items");

    std::ostringstream ss;
    ss << concepts_line(items) << "\n**Exchange:** with " << speaker << ":";
    for (const auto& item : items) {
        std::string s = first_sentence(item.text());
        if (!s.empty()) ss << " " << s << ";";
    }
    return fit(ss.str(), l1_max_words_, char_budget(items));
}

std::string ExtractiveSummarizer::merge(const std::vector<MemoryItem>& summaries,
                                        uint32_t target_level,
                                        const std::string& speaker) {
    if (summaries.size() < 2) throw PortError("merge needs at least two summaries");

    std::ostringstream ss;
    ss << concepts_line(summaries) << "\n**Synthesis:** L" << target_level
       << " with " << speaker << ":";
    for (const auto& s : summaries) {
        std::string essence = section(s.text(), "Exchange");
        if (essence.empty()) essence = section(s.text(), "Synthesis");
        if (essence.empty()) essence = first_sentence(s.text());
        ss << " " << truncate_words(essence, kSentenceWords) << ";";
    }
    return fit(ss.str(), merge_max_words_, char_budget(summaries));
}

} // namespace strata
