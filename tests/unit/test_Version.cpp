#include <gtest/gtest.h>

#include "support/Fakes.hpp"
#include "version/Resolver.hpp"
#include "net/GitHub.hpp"
#include "types/Version.hpp"
#include "types/errors.hpp"
#include "util/timestamp.hpp"

#include <memory>

using namespace bob;
using namespace bob::types;
using bob::version::Resolver;

TEST(SemverTest, ParsesPartialVersions) {
    EXPECT_EQ(Semver::parse("0.9.5"), (Semver{0, 9, 5}));
    EXPECT_EQ(Semver::parse("v0.10"), (Semver{0, 10, 0}));
    EXPECT_EQ(Semver::parse("1"), (Semver{1, 0, 0}));
}

TEST(SemverTest, RejectsJunk) {
    EXPECT_FALSE(Semver::parse(""));
    EXPECT_FALSE(Semver::parse("v"));
    EXPECT_FALSE(Semver::parse("0.9."));
    EXPECT_FALSE(Semver::parse("0.9.5.1"));
    EXPECT_FALSE(Semver::parse("12345ab"));
}

TEST(SemverTest, OrdersNumerically) {
    EXPECT_LT((Semver{0, 9, 5}), (Semver{0, 10, 0}));
    EXPECT_GT((Semver{0, 2, 3}), (Semver{0, 2, 2}));
    EXPECT_EQ(Semver::parse("v0.2.2")->toString(), "0.2.2");
}

TEST(ResolverClassifyTest, Nightly) {
    const auto v = Resolver::classify("nightly");
    ASSERT_TRUE(v);
    EXPECT_EQ(v->kind, VersionKind::Nightly);
    EXPECT_EQ(v->tag, "nightly");
    EXPECT_FALSE(v->semver);
}

TEST(ResolverClassifyTest, SemverGetsVPrefix) {
    const auto v = Resolver::classify("0.9.5");
    ASSERT_TRUE(v);
    EXPECT_EQ(v->kind, VersionKind::Tagged);
    EXPECT_EQ(v->tag, "v0.9.5");
    EXPECT_EQ(v->raw, "0.9.5");
    EXPECT_EQ(v->semver, (Semver{0, 9, 5}));

    EXPECT_EQ(Resolver::classify("v0.10.0")->tag, "v0.10.0");
}

TEST(ResolverClassifyTest, HashLengthBoundaries) {
    EXPECT_EQ(Resolver::classify("abcde")->kind, VersionKind::Hash);
    EXPECT_FALSE(Resolver::classify("abcd"));
    EXPECT_EQ(Resolver::classify(std::string(40, 'a'))->kind, VersionKind::Hash);
    EXPECT_FALSE(Resolver::classify(std::string(41, 'a')));
    EXPECT_FALSE(Resolver::classify("ABCDEF1"));
}

TEST(ResolverClassifyTest, DigitLeadingHashIsNotSemver) {
    const auto v = Resolver::classify("12345ab");
    ASSERT_TRUE(v);
    EXPECT_EQ(v->kind, VersionKind::Hash);
    EXPECT_EQ(v->installDirName(), "12345ab");
}

TEST(ResolverClassifyTest, LongHashInstallsUnderShortName) {
    const std::string sha = "0123456789abcdef0123456789abcdef01234567";
    const auto v = Resolver::classify(sha);
    ASSERT_TRUE(v);
    EXPECT_EQ(v->tag, sha);
    EXPECT_EQ(v->installDirName(), "0123456");
}

TEST(ResolverClassifyTest, RollbackNames) {
    const auto v = Resolver::classify("nightly-abc1234");
    ASSERT_TRUE(v);
    EXPECT_EQ(v->kind, VersionKind::NightlyRollback);
    EXPECT_FALSE(Resolver::classify("nightly-abc123"));
    EXPECT_FALSE(Resolver::classify("nightly-ABC1234"));
}

class ResolverTest : public ::testing::Test {
protected:
    std::shared_ptr<test::FakeHttpClient> http = std::make_shared<test::FakeHttpClient>();
    net::GitHub github{http};
    Resolver resolver{github};
};

TEST_F(ResolverTest, StableIsSecondRelease) {
    http->json(std::string(net::GitHub::API_ROOT) + "/releases?per_page=2",
               R"([{"tag_name":"nightly","published_at":"2024-05-01T00:00:00Z"},
                   {"tag_name":"v0.10.0","published_at":"2024-04-01T00:00:00Z"}])");

    for (const auto* input : {"stable", "latest"}) {
        const auto v = resolver.resolve(input);
        EXPECT_EQ(v.kind, VersionKind::Stable);
        EXPECT_EQ(v.tag, "v0.10.0");
        EXPECT_EQ(v.raw, input);
        EXPECT_EQ(v.semver, (Semver{0, 10, 0}));
    }
}

TEST_F(ResolverTest, HeadResolvesToLatestCommit) {
    const std::string sha = "fedcba9876543210fedcba9876543210fedcba98";
    http->json(std::string(net::GitHub::API_ROOT) + "/commits/master", R"({"sha":")" + sha + R"("})");

    for (const auto* input : {"head", "HEAD", "git"}) {
        const auto v = resolver.resolve(input);
        EXPECT_EQ(v.kind, VersionKind::Hash);
        EXPECT_EQ(v.raw, sha);
        EXPECT_EQ(v.installDirName(), "fedcba9");
    }
}

TEST_F(ResolverTest, InvalidInputListsValidForms) {
    try {
        (void)resolver.resolve("not-a-version");
        FAIL() << "expected VersionError";
    } catch (const VersionError& e) {
        EXPECT_NE(std::string(e.what()).find("stable|latest|nightly"), std::string::npos);
    }
}

TEST_F(ResolverTest, OfflineFormsNeedNoNetwork) {
    (void)resolver.resolve("nightly");
    (void)resolver.resolve("v0.9.5");
    (void)resolver.resolve("abc1234");
    EXPECT_TRUE(http->requested.empty());
}

TEST(TimestampTest, HumanizeDuration) {
    using namespace std::chrono;
    EXPECT_EQ(util::humanizeDuration(hours(24 * 7 * 2 + 24 * 3 + 1)), "2 weeks, 3 days, 1 hour");
    EXPECT_EQ(util::humanizeDuration(hours(5)), "5 hours");
    EXPECT_EQ(util::humanizeDuration(hours(24)), "1 day");
}

TEST(TimestampTest, ParsesIsoUtc) {
    EXPECT_EQ(util::parseTimestampFromString("1970-01-02T00:00:00Z"), 86400);
    EXPECT_EQ(util::timestampToString(86400), "1970-01-02T00:00:00Z");
    EXPECT_THROW(util::parseTimestampFromString("yesterday"), std::runtime_error);
}
