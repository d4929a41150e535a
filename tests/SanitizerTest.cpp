#include "archname/text/Sanitizer.h"
#include <gtest/gtest.h>

using arn::Sanitizer;

TEST(SanitizerTest, RemovesEmojiAndCollapsesSpaces) {
    EXPECT_EQ(Sanitizer::sanitize("Hello \xF0\x9F\x98\x80 World"), "Hello World");
    EXPECT_EQ(Sanitizer::sanitize("  lead\t\ttrail  "), "lead trail");
    EXPECT_EQ(Sanitizer::sanitize("\xF0\x9F\x98\x80\xF0\x9F\x94\xA5"), "");
    EXPECT_EQ(Sanitizer::sanitize(""), "");
}

TEST(SanitizerTest, RemovesJoinedSequencesAndSelectors) {
    // man ZWJ woman ZWJ girl
    EXPECT_EQ(Sanitizer::sanitize("\xF0\x9F\x91\xA8\xE2\x80\x8D\xF0\x9F\x91\xA9"
                                  "\xE2\x80\x8D\xF0\x9F\x91\xA7 family"), "family");
    // heavy black heart + VS16
    EXPECT_EQ(Sanitizer::sanitize("\xE2\x9D\xA4\xEF\xB8\x8F love"), "love");
}

TEST(SanitizerTest, RemovesDecorativeSymbolsOnly) {
    EXPECT_EQ(Sanitizer::sanitize("I \xE2\x99\xA5 NY"), "I NY");                       // ♥
    EXPECT_EQ(Sanitizer::sanitize("\xE2\x98\x85 Star \xE2\x98\x85"), "Star");           // ★
    EXPECT_EQ(Sanitizer::sanitize("25\xC2\xB0" "C \xC2\xA9 2024 \xE2\x84\xA2"),
              "25\xC2\xB0" "C \xC2\xA9 2024 \xE2\x84\xA2");                             // ° © ™
    EXPECT_EQ(Sanitizer::sanitize("\xE2\x99\x80 \xE2\x99\x82"), "\xE2\x99\x80 \xE2\x99\x82"); // ♀ ♂
    EXPECT_EQ(Sanitizer::sanitize("a \xE2\x86\x92 b"), "a \xE2\x86\x92 b");             // →
}

TEST(SanitizerTest, KeepsLettersOfAllScripts) {
    const std::string text = "\xE4\xB8\xAD\xE6\x96\x87 \xE3\x83\x86\xE3\x82\xB9\xE3\x83\x88 "
                             "\xED\x95\x9C\xEA\xB8\x80 caf\xC3\xA9";
    EXPECT_EQ(Sanitizer::sanitize(text), text);
}

TEST(SanitizerTest, DropsControlAndInvalidBytes) {
    EXPECT_EQ(Sanitizer::sanitize("a\x01" "b"), "ab");
    EXPECT_EQ(Sanitizer::sanitize("a\xFF" "b"), "ab");
    EXPECT_EQ(Sanitizer::sanitize("line\r\nbreak"), "line break");
}

TEST(SanitizerTest, DecorativeNamesMatchWholeWords) {
    EXPECT_TRUE(Sanitizer::isDecorativeName("BLACK STAR"));
    EXPECT_TRUE(Sanitizer::isDecorativeName("WHITE SMILING FACE"));
    EXPECT_FALSE(Sanitizer::isDecorativeName("STARLIGHT"));
    EXPECT_FALSE(Sanitizer::isDecorativeName("DEGREE SIGN"));
}

TEST(SanitizerTest, TableLookups) {
    EXPECT_TRUE(Sanitizer::isEmoji(0x1F600));
    EXPECT_TRUE(Sanitizer::isEmoji(0x1F1FA));      // regional indicator
    EXPECT_FALSE(Sanitizer::isEmoji(0x4E0A));
    EXPECT_TRUE(Sanitizer::isDecorativeSymbol(0x2605));
    EXPECT_FALSE(Sanitizer::isDecorativeSymbol(0x2640));
    EXPECT_FALSE(Sanitizer::shouldStrip(U'A'));
    EXPECT_FALSE(Sanitizer::shouldStrip(0xB0));
}

TEST(SanitizerTest, CollapseWhitespaceKeepsSymbols) {
    EXPECT_EQ(Sanitizer::collapseWhitespace(" a \xE2\x98\x85\t b "), "a \xE2\x98\x85 b");
}
