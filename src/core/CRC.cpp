#include "archname/CRC.h"
#include <cstdio>

namespace arn {

// Static member initialization
bool CRC::tableInitialized = false;
uint32_t CRC::crc32_table[256] = {0};

void CRC::initCRC32Table() {
    // CRC-32 polynomial: 0xEDB88320 (reflected)
    for (uint32_t i = 0; i < 256; ++i) {
        uint32_t crc = i;
        for (int j = 0; j < 8; ++j) {
            if (crc & 1) {
                crc = (crc >> 1) ^ 0xEDB88320;
            } else {
                crc >>= 1;
            }
        }
        crc32_table[i] = crc;
    }
}

void CRC::ensureTableInitialized() {
    if (!tableInitialized) {
        initCRC32Table();
        tableInitialized = true;
    }
}

uint32_t CRC::crc32(const uint8_t* data, size_t length) {
    return crc32_finalize(crc32_update(0xFFFFFFFF, data, length));
}

uint32_t CRC::crc32(std::string_view text) {
    return crc32(reinterpret_cast<const uint8_t*>(text.data()), text.size());
}

uint32_t CRC::crc32_update(uint32_t crc, const uint8_t* data, size_t length) {
    ensureTableInitialized();

    for (size_t i = 0; i < length; ++i) {
        uint8_t index = static_cast<uint8_t>(crc ^ data[i]);
        crc = (crc >> 8) ^ crc32_table[index];
    }
    return crc;
}

uint32_t CRC::crc32_finalize(uint32_t crc) {
    return crc ^ 0xFFFFFFFF;
}

std::string CRC::crc32Hex(std::string_view text) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%08x", static_cast<unsigned>(crc32(text)));
    return buf;
}

} // namespace arn
