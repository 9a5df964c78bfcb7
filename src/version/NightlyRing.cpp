#include "version/NightlyRing.hpp"
#include "version/Resolver.hpp"
#include "util/files.hpp"
#include "types/errors.hpp"
#include "log/Registry.hpp"

#include <algorithm>
#include <fmt/core.h>

namespace fs = std::filesystem;
using namespace bob::types;

namespace bob::version {

NightlyRing::NightlyRing(fs::path downloadsRoot) : root_(std::move(downloadsRoot)) {}

UpstreamRelease NightlyRing::readRelease(const fs::path& installDir) {
    const auto file = installDir / "bob.json";
    if (!fs::exists(file)) throw Error(fmt::format("{} is missing bob.json", installDir.string()));
    try {
        return UpstreamRelease::fromJson(nlohmann::json::parse(util::readFileToString(file)));
    } catch (const nlohmann::json::exception& e) {
        throw Error(fmt::format("Corrupt {}: {}", file.string(), e.what()));
    }
}

void NightlyRing::writeRelease(const fs::path& installDir, const UpstreamRelease& release) {
    util::writeFileAtomic(installDir / "bob.json", release.raw.dump());
}

std::vector<RollbackEntry> NightlyRing::list() const {
    std::vector<RollbackEntry> entries;
    if (!fs::exists(root_)) return entries;

    for (const auto& dir : fs::directory_iterator(root_)) {
        if (!dir.is_directory()) continue;
        if (!Resolver::isRollbackName(dir.path().filename().string())) continue;

        try {
            entries.push_back({dir.path(), readRelease(dir.path())});
        } catch (const Error& e) {
            log::Registry::fs()->warn("Skipping rollback {}: {}", dir.path().filename().string(), e.what());
        }
    }

    std::ranges::sort(entries, [](const RollbackEntry& a, const RollbackEntry& b) {
        return a.release.publishedAt() > b.release.publishedAt();
    });
    return entries;
}

std::optional<fs::path> NightlyRing::snapshot(const uint8_t limit) const {
    if (limit == 0) return std::nullopt;

    const auto nightly = root_ / "nightly";
    auto release = readRelease(nightly);
    const auto shortCommit = release.shortCommit();
    const auto target = root_ / fmt::format("nightly-{}", shortCommit);

    if (fs::exists(target)) {
        log::Registry::fs()->debug("[NightlyRing] {} already snapshotted", target.filename().string());
        return target;
    }

    auto entries = list();
    while (!entries.empty() && entries.size() >= limit) {
        const auto& oldest = entries.back();
        log::Registry::fs()->info("Removing oldest rollback {}", oldest.name());
        fs::remove_all(oldest.path);
        entries.pop_back();
    }

    log::Registry::fs()->info("Creating rollback: nightly-{}", shortCommit);
    util::copyDirectory(nightly, target);

    release.tag_name += "-" + shortCommit;
    release.raw["tag_name"] = release.tag_name;
    writeRelease(target, release);

    return target;
}

}
