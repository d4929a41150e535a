#ifndef ARCHNAME_TEXT_TITLE_EXTRACTOR_H
#define ARCHNAME_TEXT_TITLE_EXTRACTOR_H

#include "archname/NamingConfig.h"
#include "archname/Types.h"
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace arn {

/**
 * One row of the title pattern table
 *
 * Group indices refer to the expression's capture groups; -1 means the
 * part is not captured. When several user groups are listed the first one
 * that participated in the match wins.
 */
struct TitlePattern {
    std::string name;
    std::regex expression;
    std::optional<Platform> platform;   // Fixed platform, or taken from platformGroup
    int platformGroup = -1;
    std::vector<int> userGroups;
    int contentGroup = -1;              // -1: content comes from the whole text
    bool splitsUser = false;            // Group 2 holds "user<delimiter>content"
};

/**
 * Splits a sanitized title into platform / user / content
 *
 * Patterns are tried in table order, first match wins:
 * 1. Connective marker      "X_上的_alice_content"
 * 2. English connective     "(3) alice on X: content"
 * 3. Id-bearing URL shapes  "x.com/alice/status/123", "youtu.be/abc123"
 * 4. Domain-only shapes     "x.com", "reddit.com/r/cpp"
 */
class TitleExtractor {
public:
    // Longest byte offset at which a colon still terminates the user
    static constexpr size_t USER_DELIMITER_WINDOW = 64;

    explicit TitleExtractor(const NamingConfig& config = NamingConfig());

    /**
     * Decompose a title
     * @param text Sanitized title
     * @return Structured title; platform and user absent when nothing matched
     */
    StructuredTitle extract(std::string_view text) const;

    /**
     * Remove path separators and structural keywords from an author token
     * @return Cleaned user, or the user placeholder when nothing remains
     */
    std::string cleanUser(std::string_view raw) const;

    /**
     * Remove URL material, site suffixes, separators and quotes
     * @return Cleaned content, or the content placeholder when nothing remains
     */
    std::string cleanContent(std::string_view raw) const;

    const std::vector<TitlePattern>& patterns() const { return m_patterns; }

    /**
     * Map a platform token ("X", "twitter", "推特", ...) to a platform
     * Unknown tokens map to Platform::Generic.
     */
    static Platform platformFromToken(std::string_view token);

    static bool isStructuralKeyword(std::string_view token);

private:
    void buildPatterns();
    void splitUserAndContent(std::string_view rest, std::string& user, std::string& content,
                             bool& hasUser) const;

    NamingConfig m_config;
    std::vector<TitlePattern> m_patterns;
};

} // namespace arn

#endif // ARCHNAME_TEXT_TITLE_EXTRACTOR_H
