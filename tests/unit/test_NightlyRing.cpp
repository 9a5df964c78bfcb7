#include <gtest/gtest.h>

#include "support/TestContext.hpp"
#include "version/ActiveVersion.hpp"
#include "version/NightlyRing.hpp"
#include "version/Resolver.hpp"
#include "types/errors.hpp"
#include "util/files.hpp"

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using namespace bob;
using namespace bob::version;

class ActiveVersionTest : public ::testing::Test {
protected:
    test::TestContext t;
    config::Config& cfg = t.ctx.config;
};

TEST_F(ActiveVersionTest, UsedIsAbsentUntilWritten) {
    EXPECT_FALSE(readUsed(cfg));
    writeUsed(cfg, "v0.9.5");
    EXPECT_EQ(readUsed(cfg), "v0.9.5");
    EXPECT_TRUE(isUsed(cfg, "v0.9.5"));
    EXPECT_FALSE(isUsed(cfg, "v0.9"));
    EXPECT_FALSE(fs::exists(t.root() / "used.tmp"));
}

TEST_F(ActiveVersionTest, PayloadOfShortHashIsTheFullHash) {
    const std::string full = "abc1234def5678abc1234def5678abc1234def56";
    t.fakeInstall("abc1234");
    util::writeFile(t.root() / "abc1234" / "full-hash.txt", full + "\n");

    EXPECT_EQ(payloadFor(cfg, *Resolver::classify("abc1234")), full);
    EXPECT_EQ(payloadFor(cfg, *Resolver::classify("abc12")), full);
    EXPECT_EQ(installDirFor(cfg, *Resolver::classify("abc12")), "abc1234");
    EXPECT_EQ(installDirFor(cfg, *Resolver::classify("fed12")), "fed12");
    EXPECT_EQ(payloadFor(cfg, *Resolver::classify(full)), full);
    EXPECT_EQ(payloadFor(cfg, *Resolver::classify("0.9.5")), "v0.9.5");
    EXPECT_EQ(installDirForPayload(full), "abc1234");
    EXPECT_EQ(installDirForPayload("v0.9.5"), "v0.9.5");
}

TEST_F(ActiveVersionTest, ShortHashWithoutBuildIsAnError) {
    EXPECT_THROW(payloadFor(cfg, *Resolver::classify("abc1234")), Error);
}

TEST_F(ActiveVersionTest, SyncFileIsCreatedEmpty) {
    EXPECT_FALSE(syncFile(cfg));

    cfg.version_sync_file_location = (t.tmp / "nvim.version").string();
    const auto path = syncFile(cfg);
    ASSERT_TRUE(path);
    EXPECT_TRUE(fs::exists(*path));
    EXPECT_EQ(util::readFileToString(*path), "");

    cfg.version_sync_file_location = (t.tmp / "missing-dir" / "nvim.version").string();
    EXPECT_THROW(syncFile(cfg), Error);
}

class NightlyRingTest : public ::testing::Test {
protected:
    test::TestContext t;
    NightlyRing ring{t.root()};

    void makeSnapshot(const std::string& hex, const std::string& publishedAt) const {
        t.fakeNightly("nightly-" + hex, "nightly-" + hex, hex + "000000000", publishedAt);
    }
};

TEST_F(NightlyRingTest, ListsNewestFirstAndSkipsCorruptEntries) {
    makeSnapshot("aaaaaaa", "2024-01-01T00:00:00Z");
    makeSnapshot("bbbbbbb", "2024-03-01T00:00:00Z");
    makeSnapshot("ccccccc", "2024-02-01T00:00:00Z");
    t.fakeInstall("nightly-ddddddd");
    util::writeFile(t.root() / "nightly-ddddddd" / "bob.json", "{broken");

    const auto entries = ring.list();

    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].name(), "nightly-bbbbbbb");
    EXPECT_EQ(entries[1].name(), "nightly-ccccccc");
    EXPECT_EQ(entries[2].name(), "nightly-aaaaaaa");
}

TEST_F(NightlyRingTest, SnapshotSuffixesTheTag) {
    t.fakeNightly("nightly", "nightly", "1234567890abcdef", "2024-05-01T00:00:00Z");

    const auto snap = ring.snapshot(3);

    ASSERT_TRUE(snap);
    EXPECT_EQ(snap->filename(), "nightly-1234567");
    EXPECT_TRUE(fs::exists(*snap / "bin" / "nvim"));

    const auto release = NightlyRing::readRelease(*snap);
    EXPECT_EQ(release.tag_name, "nightly-1234567");
    const auto raw = nlohmann::json::parse(util::readFileToString(*snap / "bob.json"));
    EXPECT_EQ(raw.at("tag_name"), "nightly-1234567");
    EXPECT_TRUE(raw.contains("assets"));

    // The live nightly keeps its own tag
    EXPECT_EQ(NightlyRing::readRelease(t.root() / "nightly").tag_name, "nightly");
}

TEST_F(NightlyRingTest, ZeroLimitNeverSnapshots) {
    t.fakeNightly("nightly", "nightly", "1234567890abcdef", "2024-05-01T00:00:00Z");
    EXPECT_FALSE(ring.snapshot(0));
    EXPECT_TRUE(ring.list().empty());
}

TEST_F(NightlyRingTest, EvictsOldestAtLimit) {
    makeSnapshot("aaaaaaa", "2024-01-01T00:00:00Z");
    makeSnapshot("bbbbbbb", "2024-02-01T00:00:00Z");
    t.fakeNightly("nightly", "nightly", "ccccccc000", "2024-03-01T00:00:00Z");

    ring.snapshot(2);

    const auto entries = ring.list();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].name(), "nightly-ccccccc");
    EXPECT_EQ(entries[1].name(), "nightly-bbbbbbb");
    EXPECT_FALSE(fs::exists(t.root() / "nightly-aaaaaaa"));
}

TEST_F(NightlyRingTest, ExistingSnapshotIsReused) {
    makeSnapshot("1234567", "2024-01-01T00:00:00Z");
    t.fakeNightly("nightly", "nightly", "1234567890", "2024-05-01T00:00:00Z");

    const auto snap = ring.snapshot(1);

    ASSERT_TRUE(snap);
    EXPECT_EQ(ring.list().size(), 1u);
    EXPECT_EQ(NightlyRing::readRelease(*snap).published_at, "2024-01-01T00:00:00Z");
}
