#include "archname/batch/TitleGroupAnalyzer.h"
#include "archname/text/Sanitizer.h"
#include "archname/Utf8.h"
#include <algorithm>

namespace arn {

TitleGroupAnalyzer::TitleGroupAnalyzer(const NamingConfig& config)
    : m_config(config) {
}

std::vector<std::string> TitleGroupAnalyzer::splitWords(std::string_view title) {
    const std::string clean = Sanitizer::sanitize(title);

    std::vector<std::string> words;
    size_t start = 0;
    while (start < clean.size()) {
        size_t end = clean.find(' ', start);
        if (end == std::string::npos) {
            end = clean.size();
        }
        if (end > start) {
            words.push_back(clean.substr(start, end - start));
        }
        start = end + 1;
    }
    return words;
}

std::string TitleGroupAnalyzer::joinWords(const std::vector<std::string>& words, size_t count) {
    std::string out;
    for (size_t i = 0; i < count && i < words.size(); ++i) {
        if (i > 0) {
            out += ' ';
        }
        out += words[i];
    }
    return out;
}

bool TitleGroupAnalyzer::isArticle(const std::string& word) {
    const std::string lower = Utf8::toLower(word);
    return lower == "the" || lower == "a" || lower == "an";
}

void TitleGroupAnalyzer::analyze(const std::vector<std::string>& titles) {
    std::map<std::string, size_t> counts;
    m_similar.clear();
    m_titleCount = titles.size();

    for (const auto& title : titles) {
        const std::vector<std::string> words = splitWords(title);
        if (words.size() < MIN_PREFIX_WORDS) {
            continue;
        }
        const size_t longest = std::min(words.size(), MAX_PREFIX_WORDS);
        for (size_t n = MIN_PREFIX_WORDS; n <= longest; ++n) {
            ++counts[joinWords(words, n)];
        }
    }

    for (const auto& [prefix, count] : counts) {
        if (count < 2) {
            continue;
        }
        // "The A ..." style prefixes group unrelated titles
        const std::vector<std::string> words = splitWords(prefix);
        if (isArticle(words[0]) && isArticle(words[1])) {
            continue;
        }
        m_similar[prefix] = count;
    }
}

size_t TitleGroupAnalyzer::budgetFor(std::string_view title, size_t baseBudget) const {
    if (m_similar.empty()) {
        return baseBudget;
    }

    const std::vector<std::string> words = splitWords(title);
    if (words.size() < 3) {
        return baseBudget;
    }

    const std::string prefix3 = joinWords(words, 3);
    const std::string prefix4 = words.size() >= 4 ? joinWords(words, 4) : prefix3;

    for (const auto& prefix : {prefix4, prefix3}) {
        auto it = m_similar.find(prefix);
        if (it != m_similar.end() && it->second >= LARGE_GROUP) {
            return std::min(baseBudget + m_config.similarGroupBonus, m_config.hardCeiling);
        }
    }
    return baseBudget;
}

} // namespace arn
