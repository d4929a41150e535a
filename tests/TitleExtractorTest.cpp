#include "archname/text/TitleExtractor.h"
#include <gtest/gtest.h>
#include <vector>

using namespace arn;

namespace {

const std::string CONNECTIVE = "\xE4\xB8\x8A\xE7\x9A\x84";   // 上的

} // namespace

class TitleExtractorTest : public ::testing::Test {
protected:
    TitleExtractor extractor;
};

TEST_F(TitleExtractorTest, ConnectiveMarker) {
    auto title = extractor.extract("X_" + CONNECTIVE + "_alice_hello world");
    ASSERT_TRUE(title.isStructured());
    EXPECT_EQ(*title.platform, Platform::X);
    EXPECT_EQ(title.platformLabel, "X");
    ASSERT_TRUE(title.user.has_value());
    EXPECT_EQ(*title.user, "alice");
    EXPECT_EQ(title.content, "hello world");
    EXPECT_EQ(title.rule, "connective");
}

TEST_F(TitleExtractorTest, ConnectiveWithChinesePlatformAlias) {
    // 推特_上的_小明_今天很好
    auto title = extractor.extract("\xE6\x8E\xA8\xE7\x89\xB9_" + CONNECTIVE +
                                   "_\xE5\xB0\x8F\xE6\x98\x8E_\xE4\xBB\x8A\xE5\xA4\xA9\xE5\xBE\x88\xE5\xA5\xBD");
    ASSERT_TRUE(title.isStructured());
    EXPECT_EQ(*title.platform, Platform::X);
    EXPECT_EQ(*title.user, "\xE5\xB0\x8F\xE6\x98\x8E");
    EXPECT_EQ(title.content, "\xE4\xBB\x8A\xE5\xA4\xA9\xE5\xBE\x88\xE5\xA5\xBD");
}

TEST_F(TitleExtractorTest, UnknownPlatformKeepsItsLabel) {
    auto title = extractor.extract("Mastodon_" + CONNECTIVE + "_carol_toots");
    ASSERT_TRUE(title.isStructured());
    EXPECT_EQ(*title.platform, Platform::Generic);
    EXPECT_EQ(title.platformLabel, "Mastodon");
    EXPECT_EQ(*title.user, "carol");
    EXPECT_EQ(title.content, "toots");
}

TEST_F(TitleExtractorTest, ColonEndsUser) {
    auto title = extractor.extract("X " + CONNECTIVE + " alice: hello there");
    ASSERT_TRUE(title.user.has_value());
    EXPECT_EQ(*title.user, "alice");
    EXPECT_EQ(title.content, "hello there");
}

TEST_F(TitleExtractorTest, LongUndelimitedRestIsContent) {
    const std::string rest(100, 'a');
    auto title = extractor.extract("X_" + CONNECTIVE + "_" + rest);
    ASSERT_TRUE(title.isStructured());
    EXPECT_FALSE(title.user.has_value());
    EXPECT_EQ(title.content, rest);
}

TEST_F(TitleExtractorTest, EnglishConnectiveWithCounter) {
    auto title = extractor.extract("(3) Bob Smith on X: Great news today");
    ASSERT_TRUE(title.isStructured());
    EXPECT_EQ(*title.platform, Platform::X);
    EXPECT_EQ(*title.user, "Bob Smith");
    EXPECT_EQ(title.content, "Great news today");
    EXPECT_EQ(title.rule, "english_on");
}

TEST_F(TitleExtractorTest, StatusUrlShape) {
    auto title = extractor.extract("x.com/alice/status/12345");
    ASSERT_TRUE(title.isStructured());
    EXPECT_EQ(*title.platform, Platform::X);
    EXPECT_EQ(*title.user, "alice");
    EXPECT_EQ(title.content, "Content");
    EXPECT_EQ(title.rule, "x_status");
}

TEST_F(TitleExtractorTest, RedditCommentsShape) {
    auto title = extractor.extract("reddit.com_r_cpp_comments_abc123_title");
    ASSERT_TRUE(title.isStructured());
    EXPECT_EQ(*title.platform, Platform::Reddit);
    EXPECT_EQ(*title.user, "cpp");
    EXPECT_EQ(title.content, "title");
}

struct PatternCase {
    const char* rule;
    std::string title;
    Platform platform;
    const char* user;       // nullptr when no author is recovered
    const char* content;
};

TEST_F(TitleExtractorTest, EveryPatternRow) {
    const std::vector<PatternCase> cases = {
        {"connective", "X_" + CONNECTIVE + "_alice_hello world", Platform::X, "alice", "hello world"},
        {"english_on", "(3) Bob Smith on X: Great news today", Platform::X, "Bob Smith",
         "Great news today"},
        {"x_status", "x.com/alice/status/12345", Platform::X, "alice", "Content"},
        {"tiktok_video", "tiktok.com/@bob/video/123 dance", Platform::TikTok, "bob", "dance"},
        {"reddit_comments", "reddit.com/r/cpp/comments/abc123 question", Platform::Reddit, "cpp",
         "question"},
        {"instagram_post", "instagram.com/nasa/p/ABC123 caption", Platform::Instagram, "nasa",
         "caption"},
        {"youtube_watch", "youtube.com/watch?v=dQw4w9WgXcQ Never gonna", Platform::YouTube, nullptr,
         "Never gonna"},
        {"youtu_be", "youtu.be/dQw4w9WgXcQ clip", Platform::YouTube, nullptr, "clip"},
        {"youtube_channel", "youtube.com/@veritasium science", Platform::YouTube, "veritasium",
         "science"},
        {"tiktok_profile", "tiktok.com/@bob dance", Platform::TikTok, "bob", "dance"},
        {"reddit_domain", "reddit.com/u/spez hello", Platform::Reddit, "spez", "hello"},
        {"linkedin_domain", "linkedin.com/in/jane-doe profile", Platform::LinkedIn, "jane-doe",
         "profile"},
        {"linkedin_domain", "linkedin.com_posts_jane-doe_activity", Platform::LinkedIn, "jane-doe",
         "activity"},
        {"instagram_domain", "instagram.com/nasa photos", Platform::Instagram, "nasa", "photos"},
        {"x_domain", "Check out twitter.com/jack now", Platform::X, "jack", "Check out now"},
    };

    for (const auto& c : cases) {
        SCOPED_TRACE(c.title);
        auto title = extractor.extract(c.title);
        ASSERT_TRUE(title.isStructured());
        EXPECT_EQ(title.rule, c.rule);
        EXPECT_EQ(*title.platform, c.platform);
        if (c.user) {
            ASSERT_TRUE(title.user.has_value());
            EXPECT_EQ(*title.user, c.user);
        } else {
            EXPECT_FALSE(title.user.has_value());
        }
        EXPECT_EQ(title.content, c.content);
    }
}

TEST_F(TitleExtractorTest, IdBearingShapesWinOverDomainShapes) {
    EXPECT_EQ(extractor.extract("instagram.com/nasa/p/ABC123").rule, "instagram_post");
    EXPECT_EQ(extractor.extract("x.com/alice/status/1").rule, "x_status");
    EXPECT_EQ(extractor.extract("tiktok.com/@bob/video/9").rule, "tiktok_video");
    EXPECT_EQ(extractor.extract("reddit.com/r/cpp/comments/a1").rule, "reddit_comments");
    EXPECT_EQ(extractor.extract("youtube.com/watch?v=abcdef").rule, "youtube_watch");
}

TEST_F(TitleExtractorTest, PatternTableOrder) {
    const std::vector<std::string> expected = {
        "connective", "english_on", "x_status", "tiktok_video", "reddit_comments",
        "instagram_post", "youtube_watch", "youtu_be", "youtube_channel", "tiktok_profile",
        "reddit_domain", "linkedin_domain", "instagram_domain", "x_domain",
    };
    std::vector<std::string> names;
    for (const auto& pattern : extractor.patterns()) {
        names.push_back(pattern.name);
    }
    EXPECT_EQ(names, expected);
}

TEST_F(TitleExtractorTest, YouTubeChannelAllowsUnderscoreAfterSlash) {
    auto title = extractor.extract("youtube.com/@my_channel");
    ASSERT_TRUE(title.isStructured());
    EXPECT_EQ(*title.platform, Platform::YouTube);
    EXPECT_EQ(*title.user, "my_channel");
}

TEST_F(TitleExtractorTest, PlainTitleIsUnstructured) {
    auto title = extractor.extract("Just a plain title");
    EXPECT_FALSE(title.isStructured());
    EXPECT_FALSE(title.user.has_value());
    EXPECT_EQ(title.content, "Just a plain title");
    EXPECT_TRUE(title.rule.empty());

    auto empty = extractor.extract("");
    EXPECT_FALSE(empty.isStructured());
    EXPECT_TRUE(empty.content.empty());
}

TEST_F(TitleExtractorTest, PlatformTokens) {
    EXPECT_EQ(TitleExtractor::platformFromToken("twitter"), Platform::X);
    EXPECT_EQ(TitleExtractor::platformFromToken("IG"), Platform::Instagram);
    EXPECT_EQ(TitleExtractor::platformFromToken("YouTube"), Platform::YouTube);
    EXPECT_EQ(TitleExtractor::platformFromToken("\xE9\xA2\x86\xE8\x8B\xB1"), Platform::LinkedIn);
    EXPECT_EQ(TitleExtractor::platformFromToken("Mastodon"), Platform::Generic);
}

TEST_F(TitleExtractorTest, CleanUser) {
    EXPECT_EQ(extractor.cleanUser("@alice/status"), "alice");
    EXPECT_EQ(extractor.cleanUser("www/com"), "user");
    EXPECT_EQ(extractor.cleanUser(""), "user");
    EXPECT_TRUE(TitleExtractor::isStructuralKeyword("Status"));
    EXPECT_FALSE(TitleExtractor::isStructuralKeyword("alice"));
}

TEST_F(TitleExtractorTest, CleanContent) {
    EXPECT_EQ(extractor.cleanContent("hello world / X"), "hello world");
    EXPECT_EQ(extractor.cleanContent("  --  "), "Content");
    EXPECT_EQ(extractor.cleanContent("\"quoted\""), "quoted");
    EXPECT_EQ(extractor.cleanContent("see https://example.com/a now"), "see now");
}
