#include "archname/Utf8.h"
#include <cctype>

namespace arn {

namespace {

inline bool isContinuation(unsigned char b) {
    return (b & 0xC0) == 0x80;
}

char32_t foldCodepoint(char32_t cp) {
    if (cp < 0x80) {
        return (cp >= 'A' && cp <= 'Z') ? cp + 0x20 : cp;
    }
    // Latin-1 Supplement
    if (cp >= 0xC0 && cp <= 0xDE && cp != 0xD7) {
        return cp + 0x20;
    }
    // Latin Extended-A: alternating upper/lower pairs
    if ((cp >= 0x100 && cp <= 0x12F) || (cp >= 0x132 && cp <= 0x137) ||
        (cp >= 0x14A && cp <= 0x177)) {
        return (cp % 2 == 0) ? cp + 1 : cp;
    }
    if ((cp >= 0x139 && cp <= 0x148) || (cp >= 0x179 && cp <= 0x17E)) {
        return (cp % 2 == 1) ? cp + 1 : cp;
    }
    if (cp == 0x178) {
        return 0xFF;
    }
    // Greek capitals
    if (cp >= 0x391 && cp <= 0x3AB && cp != 0x3A2) {
        return cp + 0x20;
    }
    // Cyrillic capitals
    if (cp >= 0x410 && cp <= 0x42F) {
        return cp + 0x20;
    }
    if (cp >= 0x400 && cp <= 0x40F) {
        return cp + 0x50;
    }
    // Fullwidth Latin capitals
    if (cp >= 0xFF21 && cp <= 0xFF3A) {
        return cp + 0x20;
    }
    return cp;
}

} // namespace

size_t Utf8::decode(std::string_view text, size_t pos, char32_t& cp) {
    cp = INVALID;
    if (pos >= text.size()) {
        return 0;
    }

    const auto b0 = static_cast<unsigned char>(text[pos]);
    if (b0 < 0x80) {
        cp = b0;
        return 1;
    }

    size_t len;
    char32_t value;
    unsigned char minSecond = 0x80;
    unsigned char maxSecond = 0xBF;

    if (b0 >= 0xC2 && b0 <= 0xDF) {
        len = 2;
        value = b0 & 0x1F;
    } else if (b0 >= 0xE0 && b0 <= 0xEF) {
        len = 3;
        value = b0 & 0x0F;
        if (b0 == 0xE0) minSecond = 0xA0;   // overlong
        if (b0 == 0xED) maxSecond = 0x9F;   // surrogates
    } else if (b0 >= 0xF0 && b0 <= 0xF4) {
        len = 4;
        value = b0 & 0x07;
        if (b0 == 0xF0) minSecond = 0x90;
        if (b0 == 0xF4) maxSecond = 0x8F;   // > U+10FFFF
    } else {
        return 0;
    }

    if (pos + len > text.size()) {
        return 0;
    }

    const auto b1 = static_cast<unsigned char>(text[pos + 1]);
    if (b1 < minSecond || b1 > maxSecond) {
        return 0;
    }
    value = (value << 6) | (b1 & 0x3F);

    for (size_t i = 2; i < len; ++i) {
        const auto b = static_cast<unsigned char>(text[pos + i]);
        if (!isContinuation(b)) {
            return 0;
        }
        value = (value << 6) | (b & 0x3F);
    }

    cp = value;
    return len;
}

void Utf8::append(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp <= 0x10FFFF) {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

bool Utf8::isValid(std::string_view text) {
    size_t pos = 0;
    char32_t cp;
    while (pos < text.size()) {
        size_t len = decode(text, pos, cp);
        if (len == 0) {
            return false;
        }
        pos += len;
    }
    return true;
}

std::string Utf8::dropInvalid(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    size_t pos = 0;
    char32_t cp;
    while (pos < text.size()) {
        size_t len = decode(text, pos, cp);
        if (len == 0) {
            ++pos;
            continue;
        }
        out.append(text.substr(pos, len));
        pos += len;
    }
    return out;
}

bool Utf8::isBoundary(std::string_view text, size_t pos) {
    if (pos == 0 || pos >= text.size()) {
        return pos <= text.size();
    }
    return !isContinuation(static_cast<unsigned char>(text[pos]));
}

size_t Utf8::floorBoundary(std::string_view text, size_t pos) {
    if (pos >= text.size()) {
        return text.size();
    }
    while (pos > 0 && !isBoundary(text, pos)) {
        --pos;
    }
    return pos;
}

std::string Utf8::truncateBytes(std::string_view text, size_t maxBytes) {
    if (text.size() <= maxBytes) {
        return std::string(text);
    }
    return std::string(text.substr(0, floorBoundary(text, maxBytes)));
}

size_t Utf8::length(std::string_view text) {
    size_t count = 0;
    size_t pos = 0;
    char32_t cp;
    while (pos < text.size()) {
        size_t len = decode(text, pos, cp);
        pos += (len == 0) ? 1 : len;
        ++count;
    }
    return count;
}

std::vector<char32_t> Utf8::toCodepoints(std::string_view text) {
    std::vector<char32_t> result;
    result.reserve(text.size());

    size_t pos = 0;
    char32_t cp;
    while (pos < text.size()) {
        size_t len = decode(text, pos, cp);
        if (len == 0) {
            ++pos;
            continue;
        }
        result.push_back(cp);
        pos += len;
    }
    return result;
}

std::string Utf8::toLower(std::string_view text) {
    std::string out;
    out.reserve(text.size());

    size_t pos = 0;
    char32_t cp;
    while (pos < text.size()) {
        size_t len = decode(text, pos, cp);
        if (len == 0) {
            // Keep stray bytes so distinct inputs stay distinct
            out += text[pos];
            ++pos;
            continue;
        }
        append(out, foldCodepoint(cp));
        pos += len;
    }
    return out;
}

bool Utf8::isWhitespace(char32_t cp) {
    return (cp >= 0x09 && cp <= 0x0D) || cp == 0x20 || cp == 0x85 || cp == 0xA0 ||
           cp == 0x1680 || (cp >= 0x2000 && cp <= 0x200A) ||
           cp == 0x2028 || cp == 0x2029 || cp == 0x202F || cp == 0x205F ||
           cp == 0x3000;
}

bool Utf8::isControl(char32_t cp) {
    return cp < 0x20 || cp == 0x7F || (cp >= 0x80 && cp <= 0x9F);
}

bool Utf8::isCjk(char32_t cp) {
    return (cp >= 0x1100 && cp <= 0x11FF) ||     // Hangul Jamo
           (cp >= 0x2E80 && cp <= 0x2FDF) ||     // Radicals
           (cp >= 0x3040 && cp <= 0x30FF) ||     // Kana
           (cp >= 0x3100 && cp <= 0x31FF) ||     // Bopomofo, compatibility Jamo
           (cp >= 0x3400 && cp <= 0x4DBF) ||     // Extension A
           (cp >= 0x4E00 && cp <= 0x9FFF) ||     // Unified ideographs
           (cp >= 0xAC00 && cp <= 0xD7AF) ||     // Hangul syllables
           (cp >= 0xF900 && cp <= 0xFAFF) ||     // Compatibility ideographs
           (cp >= 0xFF66 && cp <= 0xFF9F) ||     // Halfwidth kana
           (cp >= 0x20000 && cp <= 0x2FA1F);     // Supplementary ideographs
}

bool Utf8::isPunctuation(char32_t cp) {
    if (cp < 0x80) {
        return std::ispunct(static_cast<int>(cp)) != 0;
    }
    return cp == 0xA1 || cp == 0xAB || cp == 0xBB || cp == 0xBF ||
           (cp >= 0x2010 && cp <= 0x2027) ||
           (cp >= 0x2030 && cp <= 0x205E) ||
           (cp >= 0x3001 && cp <= 0x303F) ||
           (cp >= 0xFE10 && cp <= 0xFE19) ||
           (cp >= 0xFE30 && cp <= 0xFE4F) ||
           (cp >= 0xFF01 && cp <= 0xFF0F) ||
           (cp >= 0xFF1A && cp <= 0xFF20) ||
           (cp >= 0xFF3B && cp <= 0xFF40) ||
           (cp >= 0xFF5B && cp <= 0xFF65);
}

bool Utf8::isAsciiAlnum(char32_t cp) {
    return (cp >= '0' && cp <= '9') || (cp >= 'A' && cp <= 'Z') || (cp >= 'a' && cp <= 'z');
}

} // namespace arn
