#include "install/Installer.hpp"
#include "install/Checksum.hpp"
#include "install/Platform.hpp"
#include "install/SourceBuilder.hpp"
#include "archive/Extractor.hpp"
#include "version/ActiveVersion.hpp"
#include "version/NightlyRing.hpp"
#include "runtime/Context.hpp"
#include "net/GitHub.hpp"
#include "net/HttpClient.hpp"
#include "concurrency/ThreadPool.hpp"
#include "cli/IO.hpp"
#include "paths/Directories.hpp"
#include "types/errors.hpp"
#include "util/files.hpp"
#include "log/Registry.hpp"

#include <boost/algorithm/string/replace.hpp>
#include <fmt/core.h>
#include <optional>

namespace fs = std::filesystem;
using namespace bob::types;

namespace bob::install {

namespace {

const net::Headers DOWNLOAD_HEADERS{{"User-Agent", "bob"}};

}

InstallResult Installer::install(const ResolvedVersion& version) {
    if (version.kind == VersionKind::NightlyRollback) return {InstallStatus::AlreadyInstalled, {}};

    if (version.semver && *version.semver <= Semver{0, 2, 2})
        throw VersionError("Versions below 0.2.2 are not supported");

    const auto root = paths::downloadsDir(ctx_.config);
    const auto dirName = version::installDirFor(ctx_.config, version);
    const bool installed = version::isInstalled(ctx_.config, dirName);

    if (installed && version.kind != VersionKind::Nightly) return {InstallStatus::AlreadyInstalled, root / dirName};

    std::optional<UpstreamRelease> upstream;
    if (version.kind == VersionKind::Nightly) upstream = ctx_.github->nightly();

    if (installed && upstream) {
        log::Registry::install()->info("Looking for nightly updates");

        const auto local = version::NightlyRing::readRelease(root / "nightly");
        if (local.publishedAt() == upstream->publishedAt()) return {InstallStatus::NightlyUpToDate, root / dirName};

        snapshotActiveNightly(root);
        if (ctx_.config.nightlyInfo()) printCommits(local, *upstream);
    }

    try {
        acquire(version, root);
    } catch (const std::exception&) {
        if (!installed) {
            std::error_code ec;
            fs::remove_all(root / dirName, ec);
        }
        throw;
    }

    if (upstream) version::NightlyRing::writeRelease(root / "nightly", *upstream);

    log::Registry::install()->debug("[Installer] {} installed into {}", version.tag, (root / dirName).string());
    return {InstallStatus::Installed, root};
}

void Installer::acquire(const ResolvedVersion& version, const fs::path& root) {
    const SourceBuilder builder(*ctx_.runner, ctx_.config);

    switch (version.kind) {
        case VersionKind::Tagged:
        case VersionKind::Stable:
            downloadRelease(version, root);
            return;
        case VersionKind::Nightly:
            if (ctx_.config.releaseBuild()) {
                builder.build("HEAD", version.installDirName());
                return;
            }
            downloadRelease(version, root);
            return;
        case VersionKind::Hash:
            builder.build(version.raw);
            return;
        case VersionKind::NightlyRollback:
            return;
    }
}

void Installer::downloadRelease(const ResolvedVersion& version, const fs::path& root) {
    const auto assetName = fmt::format("{}.{}", platformName(version.semver), archiveExtension());
    const auto archive = root / fmt::format("{}.{}", version.tag, archiveExtension());
    const auto url = releaseAssetUrl(ctx_.config.githubMirror(), version.tag, assetName);

    log::Registry::install()->info("Downloading version: {}", version.tag);
    const auto res = ctx_.http->download(url, archive, DOWNLOAD_HEADERS);

    if (!res.ok()) {
        if (res.status == 404 && tryAppImage(version, root)) return;
        throw NetworkError(fmt::format("Please provide an existing neovim version, {}", res.body), res.status);
    }

    log::Registry::install()->info("Downloaded version {} to {}", version.tag, archive.string());
    verifyChecksum(version, root, archive, assetName);

    const archive::Extractor extractor(*ctx_.runner, *ctx_.pool);
    extractor.extract(archive, root, version.tag);
}

bool Installer::tryAppImage(const ResolvedVersion& version, const fs::path& root) {
#if defined(__linux__)
    const auto assetName = appImageName(version.semver) + ".appimage";
    const auto appImage = root / fmt::format("{}.appimage", version.tag);
    const auto url = releaseAssetUrl(ctx_.config.githubMirror(), version.tag, assetName);

    log::Registry::install()->info("No tarball for {}, trying {}", version.tag, assetName);
    if (!ctx_.http->download(url, appImage, DOWNLOAD_HEADERS).ok()) return false;

    verifyChecksum(version, root, appImage, assetName);

    const archive::Extractor extractor(*ctx_.runner, *ctx_.pool);
    extractor.extractAppImage(appImage, root, version.tag, version.semver);
    return true;
#else
    (void)version;
    (void)root;
    return false;
#endif
}

void Installer::verifyChecksum(const ResolvedVersion& version, const fs::path& root, const fs::path& archive,
                               const std::string& assetName) {
    if (!hasChecksum(version)) return;

    const auto checksumName = checksumAssetName(version, assetName);
    const auto checksumFile = root / checksumName;
    const auto url = releaseAssetUrl(ctx_.config.githubMirror(), version.tag, checksumName);

    if (const auto res = ctx_.http->download(url, checksumFile, DOWNLOAD_HEADERS); !res.ok()) {
        log::Registry::install()->warn("Checksum file not found for {} (HTTP {}), skipping verification",
                                       version.tag, res.status);
        return;
    }

    const bool ok = ctx_.pool->run([&] { return matches(archive, checksumFile, assetName); }).get();

    std::error_code ec;
    fs::remove(checksumFile, ec);

    if (!ok) {
        fs::remove(archive, ec);
        throw IntegrityError(fmt::format("Checksum mismatch for {}", assetName));
    }

    log::Registry::install()->info("Checksum verified for {}", assetName);
}

void Installer::snapshotActiveNightly(const fs::path& root) {
    if (!version::isUsed(ctx_.config, "nightly")) return;

    const auto limit = ctx_.config.rollbackLimit();
    if (limit == 0) return;

    const version::NightlyRing ring(root);
    ring.snapshot(limit);
}

void Installer::printCommits(const UpstreamRelease& local, const UpstreamRelease& upstream) {
    const auto commits = ctx_.github->commitsBetween(local.publishedAt(), upstream.publishedAt());
    for (const auto& commit : commits)
        ctx_.io->print(fmt::format("| {} {}\n", commit.author,
                                   boost::algorithm::replace_all_copy(commit.message, "\n", "\n| ")));
}

}
