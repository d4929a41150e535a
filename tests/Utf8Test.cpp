#include "archname/Utf8.h"
#include <gtest/gtest.h>

using arn::Utf8;

TEST(Utf8Test, DecodesMultiByteSequences) {
    char32_t cp = 0;
    EXPECT_EQ(Utf8::decode("A", 0, cp), 1u);
    EXPECT_EQ(cp, U'A');
    EXPECT_EQ(Utf8::decode("\xC3\xA9", 0, cp), 2u);
    EXPECT_EQ(cp, 0xE9u);
    EXPECT_EQ(Utf8::decode("\xE4\xB8\x8A", 0, cp), 3u);
    EXPECT_EQ(cp, 0x4E0Au);
    EXPECT_EQ(Utf8::decode("\xF0\x9F\x98\x80", 0, cp), 4u);
    EXPECT_EQ(cp, 0x1F600u);
}

TEST(Utf8Test, RejectsIllFormedSequences) {
    char32_t cp = 0;
    EXPECT_EQ(Utf8::decode("\xC0\xAF", 0, cp), 0u);         // overlong
    EXPECT_EQ(Utf8::decode("\xED\xA0\x80", 0, cp), 0u);     // surrogate
    EXPECT_EQ(Utf8::decode("\xF4\x90\x80\x80", 0, cp), 0u); // above U+10FFFF
    EXPECT_EQ(Utf8::decode("\xE4\xB8", 0, cp), 0u);         // truncated
    EXPECT_EQ(cp, Utf8::INVALID);

    EXPECT_TRUE(Utf8::isValid("plain \xE4\xB8\x8A\xE7\x9A\x84"));
    EXPECT_FALSE(Utf8::isValid("bad \xFF byte"));
}

TEST(Utf8Test, DropInvalidKeepsWellFormedText) {
    EXPECT_EQ(Utf8::dropInvalid("a\xFF" "b\xE4\xB8" "c"), "abc");
    EXPECT_EQ(Utf8::dropInvalid("\xE4\xB8\x8A"), "\xE4\xB8\x8A");
}

TEST(Utf8Test, TruncateBytesStaysOnBoundary) {
    const std::string text = "ab\xE4\xB8\x8A\xE7\x9A\x84";   // "ab上的"
    EXPECT_EQ(Utf8::truncateBytes(text, 8), text);
    EXPECT_EQ(Utf8::truncateBytes(text, 7), "ab\xE4\xB8\x8A");
    EXPECT_EQ(Utf8::truncateBytes(text, 5), "ab\xE4\xB8\x8A");
    EXPECT_EQ(Utf8::truncateBytes(text, 4), "ab");
    EXPECT_EQ(Utf8::truncateBytes(text, 0), "");

    EXPECT_TRUE(Utf8::isBoundary(text, 2));
    EXPECT_FALSE(Utf8::isBoundary(text, 3));
    EXPECT_EQ(Utf8::floorBoundary(text, 4), 2u);
}

TEST(Utf8Test, LengthCountsCodepoints) {
    EXPECT_EQ(Utf8::length(""), 0u);
    EXPECT_EQ(Utf8::length("abc"), 3u);
    EXPECT_EQ(Utf8::length("\xE4\xB8\x8A\xE7\x9A\x84"), 2u);
    EXPECT_EQ(Utf8::toCodepoints("a\xC3\xA9").size(), 2u);
}

TEST(Utf8Test, ToLowerFoldsCommonScripts) {
    EXPECT_EQ(Utf8::toLower("Hello WORLD"), "hello world");
    EXPECT_EQ(Utf8::toLower("\xC3\x89t\xC3\xA9"), "\xC3\xA9t\xC3\xA9");     // Été
    EXPECT_EQ(Utf8::toLower("\xD0\x9F\xD1\x80"), "\xD0\xBF\xD1\x80");      // Пр
    EXPECT_EQ(Utf8::toLower("\xE4\xB8\x8A"), "\xE4\xB8\x8A");
}

TEST(Utf8Test, Classification) {
    EXPECT_TRUE(Utf8::isWhitespace(U' '));
    EXPECT_TRUE(Utf8::isWhitespace(0x3000));
    EXPECT_FALSE(Utf8::isWhitespace(U'x'));

    EXPECT_TRUE(Utf8::isControl(0x07));
    EXPECT_TRUE(Utf8::isControl(0x7F));
    EXPECT_FALSE(Utf8::isControl(U'a'));

    EXPECT_TRUE(Utf8::isCjk(0x4E0A));
    EXPECT_TRUE(Utf8::isCjk(0x3042));
    EXPECT_TRUE(Utf8::isCjk(0xAC00));
    EXPECT_FALSE(Utf8::isCjk(U'a'));

    EXPECT_TRUE(Utf8::isPunctuation(U','));
    EXPECT_TRUE(Utf8::isPunctuation(0x3002));
    EXPECT_FALSE(Utf8::isPunctuation(U'z'));

    EXPECT_TRUE(Utf8::isAsciiAlnum(U'7'));
    EXPECT_FALSE(Utf8::isAsciiAlnum(U'_'));
}
