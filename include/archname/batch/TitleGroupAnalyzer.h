#ifndef ARCHNAME_BATCH_TITLE_GROUP_ANALYZER_H
#define ARCHNAME_BATCH_TITLE_GROUP_ANALYZER_H

#include "archname/NamingConfig.h"
#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace arn {

/**
 * Finds titles that share their first words and grants them extra budget
 *
 * Titles such as "Complete Rust Programming Guide Part 1" .. "Part 9" lose
 * their distinguishing tail under the normal budget; members of a group of
 * three or more get similarGroupBonus extra bytes.
 */
class TitleGroupAnalyzer {
public:
    static constexpr size_t MIN_PREFIX_WORDS = 2;
    static constexpr size_t MAX_PREFIX_WORDS = 4;
    static constexpr size_t LARGE_GROUP = 3;

    explicit TitleGroupAnalyzer(const NamingConfig& config = NamingConfig());

    /**
     * Count shared 2-4 word prefixes over a batch of titles
     * Replaces any previous analysis.
     */
    void analyze(const std::vector<std::string>& titles);

    /**
     * Budget for one title of the analyzed batch
     * @param baseBudget Budget for titles outside large groups
     * @return min(baseBudget + bonus, hardCeiling) for large-group members
     */
    size_t budgetFor(std::string_view title, size_t baseBudget) const;

    /**
     * Prefixes shared by at least two titles, with their title counts
     */
    const std::map<std::string, size_t>& similarGroups() const { return m_similar; }

    bool hasSimilarGroups() const { return !m_similar.empty(); }

    size_t titleCount() const { return m_titleCount; }

    static std::vector<std::string> splitWords(std::string_view title);

private:
    static std::string joinWords(const std::vector<std::string>& words, size_t count);
    static bool isArticle(const std::string& word);

    NamingConfig m_config;
    std::map<std::string, size_t> m_similar;
    size_t m_titleCount = 0;
};

} // namespace arn

#endif // ARCHNAME_BATCH_TITLE_GROUP_ANALYZER_H
