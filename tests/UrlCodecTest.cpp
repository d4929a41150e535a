#include "archname/utils/UrlCodec.h"
#include <gtest/gtest.h>

using arn::UrlCodec;

TEST(UrlCodecTest, PercentEncodeKeepsUnreserved) {
    EXPECT_EQ(UrlCodec::percentEncode("a-b_c.d~e"), "a-b_c.d~e");
    EXPECT_EQ(UrlCodec::percentEncode("a b/\xC3\xBC"), "a%20b%2F%C3%BC");
    EXPECT_EQ(UrlCodec::percentEncode("https://x.com"), "https%3A%2F%2Fx.com");
}

TEST(UrlCodecTest, PercentDecodeLeavesMalformedEscapes) {
    EXPECT_EQ(UrlCodec::percentDecode("a%20b%2f"), "a b/");
    EXPECT_EQ(UrlCodec::percentDecode("%zz%4"), "%zz%4");
    EXPECT_EQ(UrlCodec::percentDecode("100%"), "100%");
}

TEST(UrlCodecTest, SafeCutNeverSplitsEscape) {
    const std::string encoded = "ab%2Fcd";
    EXPECT_EQ(UrlCodec::safeCut(encoded, 2), 2u);
    EXPECT_EQ(UrlCodec::safeCut(encoded, 3), 2u);
    EXPECT_EQ(UrlCodec::safeCut(encoded, 4), 2u);
    EXPECT_EQ(UrlCodec::safeCut(encoded, 5), 5u);
    EXPECT_EQ(UrlCodec::safeCut(encoded, 100), encoded.size());
    EXPECT_EQ(UrlCodec::truncateEncoded(encoded, 4), "ab");
}

TEST(UrlCodecTest, DetectsUrlIndicators) {
    EXPECT_TRUE(UrlCodec::hasUrlIndicators("Look at [URL] this"));
    EXPECT_TRUE(UrlCodec::hasUrlIndicators("see https://example.org/a"));
    EXPECT_TRUE(UrlCodec::hasUrlIndicators("https%3A%2F%2Fexample.org"));
    EXPECT_TRUE(UrlCodec::hasUrlIndicators("thread on x.com today"));
    EXPECT_FALSE(UrlCodec::hasUrlIndicators("files on box.com"));
    EXPECT_FALSE(UrlCodec::hasUrlIndicators("Plain title"));
}

TEST(UrlCodecTest, ExtractsEncodedUrlAfterMarker) {
    EXPECT_EQ(UrlCodec::extractUrl("Post [URL] https%3A%2F%2Fx.com%2Fa%2Fstatus%2F1"),
              "https://x.com/a/status/1");
    EXPECT_EQ(UrlCodec::extractUrl("Post [URL] x.com%2Fa%2Fstatus%2F1"),
              "https://x.com/a/status/1");
}

TEST(UrlCodecTest, ExtractsRawUrlWithoutTrailingPunctuation) {
    EXPECT_EQ(UrlCodec::extractUrl("read (https://example.com/page)."),
              "https://example.com/page");
}

TEST(UrlCodecTest, RebuildsUrlFromDomainShape) {
    EXPECT_EQ(UrlCodec::extractUrl("twitter.com_alice_status_12345"),
              "https://x.com/alice/status/12345");
    EXPECT_EQ(UrlCodec::extractUrl("youtu.be/dQw4w9WgXcQ"),
              "https://youtu.be/dQw4w9WgXcQ");
    EXPECT_EQ(UrlCodec::extractUrl("nothing here"), "");
}

TEST(UrlCodecTest, StripUrlsRemovesEveryForm) {
    std::string stripped = UrlCodec::stripUrls("hello https://a.com/x world");
    EXPECT_EQ(stripped.find("https"), std::string::npos);
    EXPECT_NE(stripped.find("hello"), std::string::npos);
    EXPECT_NE(stripped.find("world"), std::string::npos);

    stripped = UrlCodec::stripUrls("note [URL] https%3A%2F%2Fx.com%2Fa end");
    EXPECT_EQ(stripped.find("[URL]"), std::string::npos);
    EXPECT_EQ(stripped.find("%3A"), std::string::npos);
    EXPECT_NE(stripped.find("end"), std::string::npos);

    stripped = UrlCodec::stripUrls("alice x.com_alice_status_1 words");
    EXPECT_EQ(stripped.find("x.com"), std::string::npos);
    EXPECT_NE(stripped.find("words"), std::string::npos);
}

TEST(UrlCodecTest, StripUrlsKeepsWordsAfterJoinedShape) {
    std::string stripped = UrlCodec::stripUrls("linkedin.com_posts_jane-doe_activity");
    EXPECT_EQ(stripped.find("linkedin"), std::string::npos);
    EXPECT_EQ(stripped.find("jane-doe"), std::string::npos);
    EXPECT_NE(stripped.find("activity"), std::string::npos);

    stripped = UrlCodec::stripUrls("reddit.com_r_cpp_comments_abc123_title");
    EXPECT_EQ(stripped.find("cpp"), std::string::npos);
    EXPECT_EQ(stripped.find("abc123"), std::string::npos);
    EXPECT_NE(stripped.find("title"), std::string::npos);

    stripped = UrlCodec::stripUrls("tiktok.com_@bob_video_123_dance");
    EXPECT_EQ(stripped.find("bob"), std::string::npos);
    EXPECT_NE(stripped.find("dance"), std::string::npos);
}

TEST(UrlCodecTest, SplitsComponents) {
    auto parts = UrlCodec::split("https://user@Example.com:8080/a/b?q=1#frag");
    EXPECT_EQ(parts.scheme, "https");
    EXPECT_EQ(parts.host, "example.com");
    EXPECT_EQ(parts.path, "/a/b");
    EXPECT_EQ(parts.query, "q=1");
    EXPECT_EQ(parts.fragment, "frag");

    parts = UrlCodec::split("no-scheme/path");
    EXPECT_TRUE(parts.host.empty());
    EXPECT_EQ(parts.path, "no-scheme/path");
}
