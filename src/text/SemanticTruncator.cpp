#include "archname/text/SemanticTruncator.h"
#include "archname/Utf8.h"
#include <utility>
#include <vector>

namespace arn {

namespace {

struct Glyph {
    size_t offset;
    size_t length;
    char32_t cp;
};

std::vector<Glyph> indexGlyphs(std::string_view text) {
    std::vector<Glyph> glyphs;
    glyphs.reserve(text.size());

    size_t pos = 0;
    char32_t cp;
    while (pos < text.size()) {
        size_t len = Utf8::decode(text, pos, cp);
        glyphs.push_back({pos, len, cp});
        pos += len;
    }
    return glyphs;
}

// ASCII marks only count when no letter or digit follows ("3.14", "x.com", "1,000")
bool isStandalone(const std::vector<Glyph>& glyphs, size_t index) {
    if (glyphs[index].cp >= 0x80 || index + 1 >= glyphs.size()) {
        return true;
    }
    return !Utf8::isAsciiAlnum(glyphs[index + 1].cp);
}

} // namespace

SemanticTruncator::SemanticTruncator(std::string ellipsis)
    : m_ellipsis(std::move(ellipsis)) {
}

bool SemanticTruncator::isSentenceTerminal(char32_t cp) {
    return cp == '.' || cp == '!' || cp == '?' ||
           cp == 0x3002 ||      // 。
           cp == 0xFF01 ||      // ！
           cp == 0xFF1F;        // ？
}

bool SemanticTruncator::isClauseSeparator(char32_t cp) {
    return cp == ',' || cp == ':' || cp == ';' ||
           cp == 0xFF0C ||      // ，
           cp == 0xFF1A ||      // ：
           cp == 0xFF1B ||      // ；
           cp == 0x3001;        // 、
}

std::string SemanticTruncator::withEllipsis(std::string_view prefix) const {
    while (!prefix.empty() && (prefix.back() == ' ' || prefix.back() == '_')) {
        prefix.remove_suffix(1);
    }
    std::string out(prefix);
    out += m_ellipsis;
    return out;
}

std::string SemanticTruncator::truncate(std::string_view input, size_t maxBytes) const {
    if (input.size() <= maxBytes) {
        return std::string(input);
    }

    std::string cleaned;
    std::string_view text = input;
    if (!Utf8::isValid(input)) {
        cleaned = Utf8::dropInvalid(input);
        if (cleaned.size() <= maxBytes) {
            return cleaned;
        }
        text = cleaned;
    }

    const size_t reserveBytes = reserve();
    if (maxBytes < reserveBytes || maxBytes == 0) {
        return Utf8::truncateBytes(text, maxBytes);
    }

    const std::vector<Glyph> glyphs = indexGlyphs(text);
    const size_t limit = maxBytes - reserveBytes;

    // 1. Sentence terminal, kept with its mark
    size_t sentenceEnd = 0;
    for (size_t i = 0; i < glyphs.size(); ++i) {
        size_t end = glyphs[i].offset + glyphs[i].length;
        if (end > maxBytes) {
            break;
        }
        if (isSentenceTerminal(glyphs[i].cp) && end * 2 >= maxBytes && isStandalone(glyphs, i)) {
            sentenceEnd = end;
        }
    }
    if (sentenceEnd > 0) {
        return std::string(text.substr(0, sentenceEnd));
    }

    // 2. Clause separator, cut before it
    size_t clauseCut = 0;
    for (size_t i = 0; i < glyphs.size(); ++i) {
        size_t pos = glyphs[i].offset;
        if (pos > limit) {
            break;
        }
        if (isClauseSeparator(glyphs[i].cp) && pos * 10 >= maxBytes * 6 && isStandalone(glyphs, i)) {
            clauseCut = pos;
        }
    }
    if (clauseCut > 0) {
        return withEllipsis(text.substr(0, clauseCut));
    }

    // 3. Word or character boundary near the cut point
    const size_t cut = Utf8::floorBoundary(text, limit);
    size_t cutIndex = 0;
    while (cutIndex < glyphs.size() && glyphs[cutIndex].offset < cut) {
        ++cutIndex;
    }

    if (cut > 0) {
        const char32_t before = glyphs[cutIndex - 1].cp;
        const char32_t at = cutIndex < glyphs.size() ? glyphs[cutIndex].cp : Utf8::INVALID;

        if (Utf8::isCjk(before) || Utf8::isCjk(at) ||
            Utf8::isWhitespace(at) || (at != Utf8::INVALID && Utf8::isPunctuation(at))) {
            return withEllipsis(text.substr(0, cut));
        }

        const size_t windowBytes = maxBytes * 4 / 10;
        for (size_t back = 1; back <= WORD_WINDOW_CODEPOINTS && back < cutIndex; ++back) {
            const Glyph& glyph = glyphs[cutIndex - back];
            if (cut - glyph.offset > windowBytes) {
                break;
            }
            if (Utf8::isWhitespace(glyph.cp) || Utf8::isPunctuation(glyph.cp)) {
                return withEllipsis(text.substr(0, glyph.offset));
            }
        }
    }

    // 4. Hard cut
    return withEllipsis(text.substr(0, cut));
}

} // namespace arn
