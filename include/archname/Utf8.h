/**
 * @file Utf8.h
 * @brief UTF-8 decoding, boundary and classification helpers
 *
 * Every budget in archname is counted in encoded bytes. These helpers keep
 * byte-level cuts on codepoint boundaries and classify codepoints for the
 * sanitizer and the truncator.
 */

#ifndef ARCHNAME_UTF8_H
#define ARCHNAME_UTF8_H

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace arn {

/**
 * @class Utf8
 * @brief Static UTF-8 utilities operating on std::string byte buffers
 */
class Utf8 {
public:
    static constexpr char32_t INVALID = 0xFFFFFFFF;

    /**
     * @brief Decode one codepoint
     * @param text Source bytes
     * @param pos Byte offset of the lead byte
     * @param cp Receives the codepoint (INVALID on error)
     * @return Sequence length in bytes, 0 if the sequence is invalid or truncated
     */
    static size_t decode(std::string_view text, size_t pos, char32_t& cp);

    /**
     * @brief Append a codepoint in UTF-8
     */
    static void append(std::string& out, char32_t cp);

    /**
     * @brief Check that the whole buffer is well-formed UTF-8
     * Rejects overlong forms, surrogates and values above U+10FFFF.
     */
    static bool isValid(std::string_view text);

    /**
     * @brief Copy of text with ill-formed sequences dropped
     */
    static std::string dropInvalid(std::string_view text);

    /**
     * @brief Check whether a byte offset starts a codepoint (or is the end)
     */
    static bool isBoundary(std::string_view text, size_t pos);

    /**
     * @brief Largest codepoint boundary at or below pos
     */
    static size_t floorBoundary(std::string_view text, size_t pos);

    /**
     * @brief Longest prefix of at most maxBytes that ends on a boundary
     */
    static std::string truncateBytes(std::string_view text, size_t maxBytes);

    /**
     * @brief Number of codepoints (invalid bytes count as one each)
     */
    static size_t length(std::string_view text);

    /**
     * @brief Decode into a codepoint vector, skipping invalid bytes
     */
    static std::vector<char32_t> toCodepoints(std::string_view text);

    /**
     * @brief Case fold for registry comparison
     *
     * Folds ASCII, Latin-1 Supplement, Latin Extended-A pairs, Greek and
     * Cyrillic capitals. Scripts without case pass through unchanged.
     */
    static std::string toLower(std::string_view text);

    // Classification
    static bool isWhitespace(char32_t cp);
    static bool isControl(char32_t cp);
    static bool isCjk(char32_t cp);
    static bool isPunctuation(char32_t cp);
    static bool isAsciiAlnum(char32_t cp);
};

} // namespace arn

#endif // ARCHNAME_UTF8_H
