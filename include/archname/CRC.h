#ifndef ARCHNAME_CRC_H
#define ARCHNAME_CRC_H

#include <cstdint>
#include <cstddef>
#include <string>
#include <string_view>

namespace arn {

/**
 * Stable checksums used to tag names that had to be cut
 */
class CRC {
public:
    /**
     * Calculate CRC-32 (IEEE 802.3)
     * Polynomial: 0xEDB88320 (reflected), Init: 0xFFFFFFFF
     */
    static uint32_t crc32(const uint8_t* data, size_t length);
    static uint32_t crc32(std::string_view text);

    /**
     * Update CRC-32 incrementally
     */
    static uint32_t crc32_update(uint32_t crc, const uint8_t* data, size_t length);

    /**
     * Finalize CRC-32 (XOR with 0xFFFFFFFF)
     */
    static uint32_t crc32_finalize(uint32_t crc);

    /**
     * CRC-32 of text as 8 lowercase hex digits
     */
    static std::string crc32Hex(std::string_view text);

private:
    // Lookup table (dynamically initialized)
    static uint32_t crc32_table[256];

    static void initCRC32Table();
    static bool tableInitialized;
    static void ensureTableInitialized();
};

} // namespace arn

#endif // ARCHNAME_CRC_H
