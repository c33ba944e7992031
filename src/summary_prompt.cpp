#include "summary_prompt.hpp"
#include "topics.hpp"
#include <sstream>

namespace strata {

std::string build_persona_prompt(const std::string& persona) {
    std::ostringstream ss;
    ss << "You are " << persona << ", keeping a compact first-person memory of "
       << "your conversations.\n"
       << "Summaries replace the original text in your working memory, so keep "
       << "names, decisions and open questions; drop pleasantries.\n"
       << "Output only the summary, no preamble.\n";
    return ss.str();
}

static void append_topics_hint(std::ostringstream& ss,
                               const std::vector<MemoryItem>& items) {
    auto topics = extract_topics(items);
    if (topics.empty()) return;
    ss << "Candidate key concepts:";
    for (size_t i = 0; i < topics.size(); ++i) {
        ss << (i == 0 ? " " : ", ") << topics[i];
    }
    ss << "\n\n";
}

std::string build_l1_prompt(const std::vector<MemoryItem>& items,
                            const std::string& speaker,
                            const std::string& persona,
                            uint32_t max_words) {
    std::ostringstream ss;
    ss << "Write a concise level-1 summary of this conversation excerpt.\n\n"
       << "Rules:\n"
       << "- At most " << max_words << " words.\n"
       << "- Capture key concepts, not details.\n"
       << "- Refer to the other party as " << speaker << ".\n"
       << "- Write in the first person as " << persona << ".\n\n"
       << "Format:\n"
       << "**Key concepts:** [3-5 concepts]\n"
       << "**Exchange:** [the essence in 1-2 sentences]\n"
       << "**Impression:** [your own reaction]\n\n";
    append_topics_hint(ss, items);

    ss << "Conversation:\n";
    for (const auto& item : items) {
        std::string who = item.role() == Role::User ? speaker
                        : item.role() == Role::Assistant ? persona
                        : std::string("system");
        ss << who << ": " << item.text() << "\n";
    }
    ss << "\nLevel-1 summary:";
    return ss.str();
}

std::string build_merge_prompt(const std::vector<MemoryItem>& summaries,
                               uint32_t target_level,
                               const std::string& speaker,
                               const std::string& persona,
                               uint32_t max_words) {
    std::ostringstream ss;
    ss << "Merge these level-" << (target_level - 1) << " summaries into one "
       << "level-" << target_level << " summary.\n\n"
       << "Rules:\n"
       << "- At most " << max_words << " words.\n"
       << "- Keep the key concepts shared across the summaries.\n"
       << "- Refer to the other party as " << speaker << ".\n"
       << "- Write in the first person as " << persona << ".\n\n"
       << "Format:\n"
       << "**Key concepts:** [3-5 concepts]\n"
       << "**Synthesis:** [merged essence in 1-2 sentences]\n"
       << "**Evolution:** [how the conversation developed]\n\n";
    append_topics_hint(ss, summaries);

    ss << "Summaries to merge:\n";
    for (size_t i = 0; i < summaries.size(); ++i) {
        ss << "[" << (i + 1) << "] " << summaries[i].text() << "\n\n";
    }
    ss << "Level-" << target_level << " summary:";
    return ss.str();
}

} // namespace strata
