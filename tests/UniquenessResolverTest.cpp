#include "archname/naming/UniquenessResolver.h"
#include "archname/Utf8.h"
#include <gtest/gtest.h>

using namespace arn;

namespace {

// 2024-03-05 07:08:09.123456 UTC
TimestampUtils::TimePoint fixedTime() {
    return TimestampUtils::TimePoint(std::chrono::seconds(1709622489)) +
           std::chrono::microseconds(123456);
}

NameRegistry saturated(const std::string& base) {
    NameRegistry registry;
    registry.insert(base);
    for (unsigned n = 1; n <= 999; ++n) {
        registry.insert(base + UniquenessResolver::numberedSuffix(n));
    }
    return registry;
}

} // namespace

class UniquenessResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        resolver.setClock([] { return fixedTime(); });
    }

    UniquenessResolver resolver;
};

TEST_F(UniquenessResolverTest, FreeCandidateIsKept) {
    NameRegistry registry;
    auto resolved = resolver.resolve("hello", registry, 150);
    EXPECT_EQ(resolved.stem, "hello");
    EXPECT_EQ(resolved.strategy, ResolveStrategy::AsIs);
    EXPECT_EQ(resolved.attempts, 1u);
}

TEST_F(UniquenessResolverTest, NumberedSuffixes) {
    NameRegistry registry({"hello"});
    EXPECT_EQ(resolver.resolve("hello", registry, 150).stem, "hello_001");

    registry.insert("hello_001");
    auto resolved = resolver.resolve("hello", registry, 150);
    EXPECT_EQ(resolved.stem, "hello_002");
    EXPECT_EQ(resolved.strategy, ResolveStrategy::Numbered);
    EXPECT_EQ(resolved.attempts, 3u);
}

TEST_F(UniquenessResolverTest, ComparisonIgnoresCase) {
    NameRegistry registry({"Hello"});
    EXPECT_EQ(resolver.resolve("hELLO", registry, 150).stem, "hELLO_001");
}

TEST_F(UniquenessResolverTest, TimestampAfterNumberedChainIsExhausted) {
    NameRegistry registry = saturated("hello");
    auto resolved = resolver.resolve("hello", registry, 150);
    EXPECT_EQ(resolved.stem, "hello_070809");
    EXPECT_EQ(resolved.strategy, ResolveStrategy::Timestamp);
    EXPECT_EQ(resolved.attempts, 1001u);

    registry.insert("hello_070809");
    EXPECT_EQ(resolver.resolve("hello", registry, 150).stem, "hello_20240305070809");

    registry.insert("hello_20240305070809");
    EXPECT_EQ(resolver.resolve("hello", registry, 150).stem, "hello_20240305070809123456");
}

TEST_F(UniquenessResolverTest, LiteralFallbackCounts) {
    NameRegistry registry = saturated("hello");
    registry.insert("hello_070809");
    registry.insert("hello_20240305070809");
    registry.insert("hello_20240305070809123456");

    const std::string digits =
        TimestampUtils::toBase36(static_cast<uint64_t>(TimestampUtils::microsSinceEpoch(fixedTime())));

    auto resolved = resolver.resolve("hello", registry, 150);
    EXPECT_EQ(resolved.stem, "t" + digits + "_1");
    EXPECT_EQ(resolved.strategy, ResolveStrategy::Literal);

    registry.insert(resolved.stem);
    EXPECT_EQ(resolver.resolve("hello", registry, 150).stem, "t" + digits + "_2");
}

TEST_F(UniquenessResolverTest, SuffixedNamesStayInBudget) {
    const std::string candidate(200, 'a');
    NameRegistry registry;

    auto first = resolver.resolve(candidate, registry, 40);
    EXPECT_LE(first.stem.size(), 35u);
    registry.insert(first.stem);

    auto second = resolver.resolve(candidate, registry, 40);
    EXPECT_LE(second.stem.size(), 35u);
    EXPECT_EQ(second.stem.substr(second.stem.size() - 4), "_001");
    EXPECT_TRUE(Utf8::isValid(second.stem));
}

TEST_F(UniquenessResolverTest, SmallestBudgetStillResolves) {
    NamingConfig config;
    UniquenessResolver small(config);
    small.setClock([] { return fixedTime(); });

    // Numbered chain exhausted at the smallest stem budget
    NameRegistry registry = saturated("abcdefghijkl");
    auto resolved = small.resolve("abcdefghijkl", registry, config.minimumTotalBudget());
    EXPECT_LE(resolved.stem.size(), NamingConfig::MIN_STEM_BYTES);
    EXPECT_FALSE(registry.contains(resolved.stem));
}

TEST(UniquenessResolverSuffixTest, NumberedSuffixFormat) {
    EXPECT_EQ(UniquenessResolver::numberedSuffix(7), "_007");
    EXPECT_EQ(UniquenessResolver::numberedSuffix(999), "_999");
    EXPECT_EQ(UniquenessResolver::numberedSuffix(1000), "_1000");
}
