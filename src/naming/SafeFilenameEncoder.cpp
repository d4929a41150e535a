#include "archname/naming/SafeFilenameEncoder.h"
#include "archname/CRC.h"
#include "archname/Utf8.h"

namespace arn {

SafeFilenameEncoder::SafeFilenameEncoder(const NamingConfig& config)
    : m_hardCeiling(config.hardCeiling), m_extension(config.extension) {
}

bool SafeFilenameEncoder::isReservedCharacter(char32_t cp) {
    switch (cp) {
        case '<': case '>': case ':': case '"':
        case '/': case '\\': case '|': case '?': case '*':
            return true;
        default:
            return false;
    }
}

std::string SafeFilenameEncoder::sanitizeCharacters(std::string_view stem) const {
    std::string result;
    result.reserve(stem.size());

    bool inWhitespace = false;
    size_t pos = 0;
    char32_t cp;

    while (pos < stem.size()) {
        size_t len = Utf8::decode(stem, pos, cp);
        if (len == 0) {
            // Ill-formed byte
            ++pos;
            continue;
        }

        if (Utf8::isWhitespace(cp)) {
            if (!inWhitespace) {
                result += '_';
                inWhitespace = true;
            }
        } else {
            inWhitespace = false;
            if (isReservedCharacter(cp) || Utf8::isControl(cp)) {
                result += '_';
            } else {
                result.append(stem.substr(pos, len));
            }
        }
        pos += len;
    }

    return result;
}

std::string SafeFilenameEncoder::encode(std::string_view stem) const {
    std::string result = sanitizeCharacters(stem);

    if (result.size() + m_extension.size() <= m_hardCeiling) {
        return result;
    }

    // Too long for the filesystem: cut and tag with a stable hash
    const std::string hash = CRC::crc32Hex(result);
    size_t room = 0;
    if (m_hardCeiling > m_extension.size() + HASH_SUFFIX_BYTES) {
        room = m_hardCeiling - m_extension.size() - HASH_SUFFIX_BYTES;
    }

    std::string cut = Utf8::truncateBytes(result, room);
    cut += '_';
    cut += hash;
    return cut;
}

bool SafeFilenameEncoder::isSafe(std::string_view stem) const {
    return encode(stem) == stem;
}

} // namespace arn
