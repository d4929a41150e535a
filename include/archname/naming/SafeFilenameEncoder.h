#ifndef ARCHNAME_NAMING_SAFE_FILENAME_ENCODER_H
#define ARCHNAME_NAMING_SAFE_FILENAME_ENCODER_H

#include "archname/NamingConfig.h"
#include <string>
#include <string_view>

namespace arn {

/**
 * Conversion of a stem to a host-filesystem-legal name
 * - < > : " / \ | ? * and control characters become '_'
 * - Whitespace runs become a single '_'
 * - Stems whose name (stem + extension) exceeds the hard ceiling are cut
 *   on a codepoint boundary and tagged with '_' + CRC-32 of the uncut stem
 */
class SafeFilenameEncoder {
public:
    // '_' plus 8 hex digits
    static constexpr size_t HASH_SUFFIX_BYTES = 9;

    explicit SafeFilenameEncoder(const NamingConfig& config = NamingConfig());

    /**
     * Character-class pass only; never lengthens the stem
     */
    std::string sanitizeCharacters(std::string_view stem) const;

    /**
     * Character-class pass followed by the hard ceiling clamp
     * Idempotent on its own output.
     */
    std::string encode(std::string_view stem) const;

    /**
     * Check that a stem needs no change from encode()
     */
    bool isSafe(std::string_view stem) const;

    static bool isReservedCharacter(char32_t cp);

private:
    size_t m_hardCeiling;
    std::string m_extension;
};

} // namespace arn

#endif // ARCHNAME_NAMING_SAFE_FILENAME_ENCODER_H
