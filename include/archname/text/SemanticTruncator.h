#ifndef ARCHNAME_TEXT_SEMANTIC_TRUNCATOR_H
#define ARCHNAME_TEXT_SEMANTIC_TRUNCATOR_H

#include <cstddef>
#include <string>
#include <string_view>

namespace arn {

/**
 * Byte-budgeted truncation that prefers linguistic boundaries
 *
 * Order of preference once the text does not fit:
 * 1. Sentence terminal (. ! ? 。！？) in the upper half of the budget, no ellipsis
 * 2. Clause separator (, : ; ，：；、) in the upper 40% of the budget, ellipsis
 * 3. Word boundary near the cut point (CJK text may be cut anywhere), ellipsis
 * 4. Hard cut on a codepoint boundary, ellipsis
 *
 * The result never exceeds the budget and never splits a codepoint.
 */
class SemanticTruncator {
public:
    // Longest backwards walk when looking for a word boundary
    static constexpr size_t WORD_WINDOW_CODEPOINTS = 24;

    explicit SemanticTruncator(std::string ellipsis = "\xE2\x80\xA6");

    /**
     * Shrink text to at most maxBytes UTF-8 bytes
     * @param text Valid UTF-8 text (ill-formed bytes are dropped first)
     * @param maxBytes Byte budget
     * @return text itself when it fits, otherwise a shortened form
     */
    std::string truncate(std::string_view text, size_t maxBytes) const;

    /**
     * Bytes reserved for the ellipsis marker
     */
    size_t reserve() const { return m_ellipsis.size(); }

    const std::string& ellipsis() const { return m_ellipsis; }

    static bool isSentenceTerminal(char32_t cp);
    static bool isClauseSeparator(char32_t cp);

private:
    std::string withEllipsis(std::string_view prefix) const;

    std::string m_ellipsis;
};

} // namespace arn

#endif // ARCHNAME_TEXT_SEMANTIC_TRUNCATOR_H
