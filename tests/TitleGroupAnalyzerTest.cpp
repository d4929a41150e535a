#include "archname/batch/TitleGroupAnalyzer.h"
#include <gtest/gtest.h>

using arn::TitleGroupAnalyzer;

TEST(TitleGroupAnalyzerTest, LargeGroupGetsBonus) {
    TitleGroupAnalyzer analyzer;
    analyzer.analyze({
        "Complete Rust Programming Guide Part 1",
        "Complete Rust Programming Guide Part 2",
        "Complete Rust Programming Guide Part 3",
        "Other topic entirely",
    });

    EXPECT_EQ(analyzer.titleCount(), 4u);
    ASSERT_TRUE(analyzer.hasSimilarGroups());
    EXPECT_EQ(analyzer.similarGroups().at("Complete Rust Programming Guide"), 3u);

    EXPECT_EQ(analyzer.budgetFor("Complete Rust Programming Guide Part 2", 150), 170u);
    EXPECT_EQ(analyzer.budgetFor("Other topic entirely", 150), 150u);
}

TEST(TitleGroupAnalyzerTest, BonusCappedAtCeiling) {
    TitleGroupAnalyzer analyzer;
    analyzer.analyze({"One Two Three a", "One Two Three b", "One Two Three c"});
    EXPECT_EQ(analyzer.budgetFor("One Two Three a", 250), 255u);
}

TEST(TitleGroupAnalyzerTest, PairsAreSimilarButNotLarge) {
    TitleGroupAnalyzer analyzer;
    analyzer.analyze({"Alpha Beta one", "Alpha Beta two"});
    ASSERT_TRUE(analyzer.hasSimilarGroups());
    EXPECT_EQ(analyzer.similarGroups().at("Alpha Beta"), 2u);
    EXPECT_EQ(analyzer.budgetFor("Alpha Beta one", 150), 150u);
}

TEST(TitleGroupAnalyzerTest, ArticlePrefixesIgnored) {
    TitleGroupAnalyzer analyzer;
    analyzer.analyze({"The A x", "The A y"});
    EXPECT_FALSE(analyzer.hasSimilarGroups());
}

TEST(TitleGroupAnalyzerTest, SplitWordsSanitizes) {
    auto words = TitleGroupAnalyzer::splitWords("  a \xF0\x9F\x98\x80 b ");
    ASSERT_EQ(words.size(), 2u);
    EXPECT_EQ(words[0], "a");
    EXPECT_EQ(words[1], "b");
}
