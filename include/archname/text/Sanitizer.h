#ifndef ARCHNAME_TEXT_SANITIZER_H
#define ARCHNAME_TEXT_SANITIZER_H

#include <string>
#include <string_view>
#include <vector>

namespace arn {

// Inclusive codepoint range
struct CodepointRange {
    char32_t first;
    char32_t last;
};

// Symbol with its Unicode character name
struct NamedSymbol {
    char32_t first;
    char32_t last;
    const char* name;
};

/**
 * Emoji and decorative symbol removal
 *
 * Two data tables drive the filter:
 * 1. Emoji/pictograph block ranges, always removed
 * 2. Named symbols, removed when a word of the name is on the
 *    decorative keyword list (FACE, HEART, STAR, ...)
 *
 * Letters, digits, punctuation and symbols outside both tables
 * (degree sign, copyright sign, arrows, ...) are preserved.
 */
class Sanitizer {
public:
    /**
     * Strip emoji and decorative symbols, drop invalid UTF-8 and control
     * characters, collapse whitespace runs to one space and trim
     * @param text Raw title
     * @return Cleaned text, possibly empty
     */
    static std::string sanitize(std::string_view text);

    /**
     * Collapse whitespace runs (Unicode aware) to single spaces and trim
     */
    static std::string collapseWhitespace(std::string_view text);

    // Table lookups
    static bool isEmoji(char32_t cp);
    static bool isDecorativeSymbol(char32_t cp);
    static bool shouldStrip(char32_t cp);

    /**
     * Check a Unicode name against the decorative keyword list
     * Matches whole words only.
     */
    static bool isDecorativeName(std::string_view name);

    static const std::vector<CodepointRange>& emojiRanges();
    static const std::vector<NamedSymbol>& namedSymbols();
    static const std::vector<std::string_view>& decorativeKeywords();
};

} // namespace arn

#endif // ARCHNAME_TEXT_SANITIZER_H
