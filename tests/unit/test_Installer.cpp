#include <gtest/gtest.h>

#include "support/TarWriter.hpp"
#include "support/TestContext.hpp"
#include "install/Installer.hpp"
#include "install/Platform.hpp"
#include "version/ActiveVersion.hpp"
#include "version/NightlyRing.hpp"
#include "version/Resolver.hpp"
#include "types/errors.hpp"
#include "util/hash.hpp"

#include <fmt/core.h>

namespace fs = std::filesystem;
using namespace bob;
using namespace bob::types;

namespace {

constexpr auto NIGHTLY_API = "https://api.github.com/repos/neovim/neovim/releases/tags/nightly";

std::string assetUrl(const std::string& tag, const std::string& asset) {
    return fmt::format("https://github.com/neovim/neovim/releases/download/{}/{}", tag, asset);
}

ResolvedVersion parsed(const std::string& input) {
    return *version::Resolver::classify(input);
}

}

class InstallerTest : public ::testing::Test {
protected:
    test::TestContext t;
    install::Installer installer{t.ctx};

    // Serves a release tarball (and optionally its checksum file) for tag.
    std::string serveRelease(const std::string& tag, const std::optional<Semver>& semver, const std::string& binary,
                             const std::optional<std::string>& checksumFile = std::nullopt) {
        const auto asset = fmt::format("{}.tar.gz", install::platformName(semver));
        const auto tarball = t.tmp / ("served-" + tag + ".tar.gz");
        test::writeReleaseTarball(tarball, install::platformName(semver), binary);
        t.http->fileFrom(assetUrl(tag, asset), tarball);

        if (checksumFile)
            t.http->file(assetUrl(tag, *checksumFile),
                         fmt::format("{}  {}\n", util::sha256File(tarball), asset));
        return asset;
    }

    void serveNightlyApi(const std::string& commit, const std::string& publishedAt) const {
        t.http->json(NIGHTLY_API, test::TestContext::releaseJson("nightly", commit, publishedAt));
    }
};

TEST_F(InstallerTest, InstallsTaggedReleaseWithChecksum) {
    const auto v = parsed("0.9.5");
    const auto asset = install::platformName(v.semver) + ".tar.gz";
    serveRelease("v0.9.5", v.semver, "nvim 0.9.5", asset + ".sha256sum");

    const auto result = installer.install(v);

    EXPECT_EQ(result.status, InstallStatus::Installed);
    EXPECT_EQ(util::readFileToString(t.root() / "v0.9.5" / "bin" / "nvim"), "nvim 0.9.5");
    EXPECT_TRUE(fs::exists(t.root() / "v0.9.5" / "share" / "nvim" / "runtime" / "filetype.lua"));
    EXPECT_TRUE(t.http->wasRequested(assetUrl("v0.9.5", asset + ".sha256sum")));

    // Neither the archive nor the checksum file is left behind
    EXPECT_FALSE(fs::exists(t.root() / "v0.9.5.tar.gz"));
    EXPECT_FALSE(fs::exists(t.root() / (asset + ".sha256sum")));
}

TEST_F(InstallerTest, NewerReleasesUseShasumTxt) {
    const auto v = parsed("0.10.4");
    serveRelease("v0.10.4", v.semver, "nvim 0.10.4", "shasum.txt");

    EXPECT_EQ(installer.install(v).status, InstallStatus::Installed);
    EXPECT_TRUE(t.http->wasRequested(assetUrl("v0.10.4", "shasum.txt")));
    EXPECT_TRUE(fs::exists(t.root() / "v0.10.4" / "bin" / "nvim"));
}

TEST_F(InstallerTest, MissingChecksumFileSkipsVerification) {
    const auto v = parsed("0.9.5");
    serveRelease("v0.9.5", v.semver, "nvim");

    EXPECT_EQ(installer.install(v).status, InstallStatus::Installed);
}

TEST_F(InstallerTest, OldReleasesHaveNoChecksum) {
    const auto v = parsed("0.4.4");
    serveRelease("v0.4.4", v.semver, "nvim");

    EXPECT_EQ(installer.install(v).status, InstallStatus::Installed);
    for (const auto& url : t.http->requested) EXPECT_EQ(url.find("sha256sum"), std::string::npos) << url;
}

TEST_F(InstallerTest, ChecksumMismatchLeavesNothingBehind) {
    const auto v = parsed("0.9.5");
    const auto asset = serveRelease("v0.9.5", v.semver, "nvim");
    t.http->file(assetUrl("v0.9.5", asset + ".sha256sum"),
                 fmt::format("{}  {}\n", std::string(64, '0'), asset));

    EXPECT_THROW(installer.install(v), IntegrityError);

    EXPECT_FALSE(fs::exists(t.root() / "v0.9.5"));
    EXPECT_FALSE(fs::exists(t.root() / "v0.9.5.tar.gz"));
    EXPECT_FALSE(fs::exists(t.root() / (asset + ".sha256sum")));
}

TEST_F(InstallerTest, AlreadyInstalledMakesNoRequests) {
    t.fakeInstall("v0.9.5");

    const auto result = installer.install(parsed("v0.9.5"));

    EXPECT_EQ(result.status, InstallStatus::AlreadyInstalled);
    EXPECT_TRUE(t.http->requested.empty());
}

TEST_F(InstallerTest, RejectsAncientVersions) {
    EXPECT_THROW(installer.install(parsed("0.2.2")), VersionError);
    EXPECT_THROW(installer.install(parsed("0.1.0")), VersionError);
    EXPECT_TRUE(t.http->requested.empty());
}

TEST_F(InstallerTest, OldestSupportedVersionInstalls) {
    const auto v = parsed("0.2.3");
    serveRelease("v0.2.3", v.semver, "nvim 0.2.3");

    EXPECT_EQ(installer.install(v).status, InstallStatus::Installed);
    EXPECT_EQ(util::readFileToString(t.root() / "v0.2.3" / "bin" / "nvim"), "nvim 0.2.3");
}

TEST_F(InstallerTest, UnknownVersionReportsMissingRelease) {
    try {
        installer.install(parsed("0.99.0"));
        FAIL() << "expected NetworkError";
    } catch (const NetworkError& e) {
        EXPECT_NE(std::string(e.what()).find("Please provide an existing neovim version"), std::string::npos);
    }
    EXPECT_FALSE(fs::exists(t.root() / "v0.99.0"));
}

TEST_F(InstallerTest, NightlyInstallWritesUpstreamRelease) {
    t.ctx.config.enable_nightly_info = false;
    serveNightlyApi("1111111aaaa", "2024-05-01T00:00:00Z");
    serveRelease("nightly", std::nullopt, "nvim nightly");

    EXPECT_EQ(installer.install(parsed("nightly")).status, InstallStatus::Installed);

    const auto release = version::NightlyRing::readRelease(t.root() / "nightly");
    EXPECT_EQ(release.tag_name, "nightly");
    EXPECT_EQ(release.published_at, "2024-05-01T00:00:00Z");

    // Same publish time upstream means nothing to do
    EXPECT_EQ(installer.install(parsed("nightly")).status, InstallStatus::NightlyUpToDate);
}

TEST_F(InstallerTest, NightlyUpdateSnapshotsTheUsedBuild) {
    t.ctx.config.enable_nightly_info = false;
    t.fakeNightly("nightly", "nightly", "1111111aaaa", "2024-05-01T00:00:00Z");
    version::writeUsed(t.ctx.config, "nightly");

    serveNightlyApi("2222222bbbb", "2024-05-02T00:00:00Z");
    serveRelease("nightly", std::nullopt, "nvim newer");

    EXPECT_EQ(installer.install(parsed("nightly")).status, InstallStatus::Installed);

    EXPECT_TRUE(fs::exists(t.root() / "nightly-1111111" / "bin" / "nvim"));
    EXPECT_EQ(util::readFileToString(t.root() / "nightly" / "bin" / "nvim"), "nvim newer");
    EXPECT_EQ(version::NightlyRing::readRelease(t.root() / "nightly").published_at, "2024-05-02T00:00:00Z");
}

TEST_F(InstallerTest, NightlyUpdateWithoutUseSkipsSnapshot) {
    t.ctx.config.enable_nightly_info = false;
    t.fakeNightly("nightly", "nightly", "1111111aaaa", "2024-05-01T00:00:00Z");

    serveNightlyApi("2222222bbbb", "2024-05-02T00:00:00Z");
    serveRelease("nightly", std::nullopt, "nvim newer");

    installer.install(parsed("nightly"));

    EXPECT_FALSE(fs::exists(t.root() / "nightly-1111111"));
}

TEST_F(InstallerTest, FailedNightlyUpdateKeepsTheOldBuild) {
    t.ctx.config.enable_nightly_info = false;
    t.fakeNightly("nightly", "nightly", "1111111aaaa", "2024-05-01T00:00:00Z");
    serveNightlyApi("2222222bbbb", "2024-05-02T00:00:00Z");

    EXPECT_THROW(installer.install(parsed("nightly")), NetworkError);
    EXPECT_TRUE(fs::exists(t.root() / "nightly" / "bin" / "nvim"));
}

TEST_F(InstallerTest, RollbacksAreNeverDownloaded) {
    const auto result = installer.install(parsed("nightly-abc1234"));
    EXPECT_EQ(result.status, InstallStatus::AlreadyInstalled);
    EXPECT_TRUE(t.http->requested.empty());
}
