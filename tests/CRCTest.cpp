#include "archname/CRC.h"
#include <gtest/gtest.h>

using arn::CRC;

TEST(CRCTest, MatchesCheckValue) {
    EXPECT_EQ(CRC::crc32("123456789"), 0xCBF43926u);
    EXPECT_EQ(CRC::crc32(""), 0u);
}

TEST(CRCTest, IncrementalUpdateMatchesOneShot) {
    const std::string text = "archived page title";
    const auto* data = reinterpret_cast<const uint8_t*>(text.data());

    uint32_t crc = 0xFFFFFFFF;
    crc = CRC::crc32_update(crc, data, 8);
    crc = CRC::crc32_update(crc, data + 8, text.size() - 8);
    EXPECT_EQ(CRC::crc32_finalize(crc), CRC::crc32(text));
}

TEST(CRCTest, HexIsEightLowercaseDigits) {
    EXPECT_EQ(CRC::crc32Hex("123456789"), "cbf43926");
    EXPECT_EQ(CRC::crc32Hex(""), "00000000");
}
