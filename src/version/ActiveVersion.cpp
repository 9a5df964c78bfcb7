#include "version/ActiveVersion.hpp"
#include "version/Resolver.hpp"
#include "paths/Directories.hpp"
#include "util/files.hpp"
#include "types/errors.hpp"
#include "log/Registry.hpp"

#include <boost/algorithm/string/trim.hpp>
#include <fmt/core.h>

namespace fs = std::filesystem;
using namespace bob::types;

namespace bob::version {

std::optional<std::string> readUsed(const config::Config& cfg) {
    const auto path = paths::usedFile(cfg);
    if (!fs::exists(path)) return std::nullopt;
    auto content = boost::algorithm::trim_copy(util::readFileToString(path));
    if (content.empty()) return std::nullopt;
    return content;
}

void writeUsed(const config::Config& cfg, const std::string& payload) {
    util::writeFileAtomic(paths::usedFile(cfg), payload);
    log::Registry::fs()->debug("[ActiveVersion] used -> {}", payload);
}

std::string payloadFor(const config::Config& cfg, const ResolvedVersion& v) {
    switch (v.kind) {
        case VersionKind::Hash: {
            if (v.raw.size() > 7) return v.raw;
            const auto dirName = installDirFor(cfg, v);
            const auto hashFile = paths::downloadsDir(cfg) / dirName / "full-hash.txt";
            if (!fs::exists(hashFile))
                throw Error(fmt::format("{} is missing full-hash.txt, reinstall it with `bob install {}`",
                                        dirName, v.raw));
            return boost::algorithm::trim_copy(util::readFileToString(hashFile));
        }
        case VersionKind::Tagged:
        case VersionKind::Stable:
        case VersionKind::Nightly:
        case VersionKind::NightlyRollback:
            return v.tag;
    }
    return v.tag;
}

bool isUsed(const config::Config& cfg, const std::string& payload) {
    const auto used = readUsed(cfg);
    return used && *used == payload;
}

bool isInstalled(const config::Config& cfg, const std::string& dirName) {
    return fs::is_directory(paths::downloadsDir(cfg) / dirName);
}

std::string installDirFor(const config::Config& cfg, const ResolvedVersion& v) {
    if (v.kind != VersionKind::Hash || v.raw.size() >= 7) return v.installDirName();

    const auto root = paths::downloadsDir(cfg);
    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(root, ec)) {
        if (!entry.is_directory()) continue;
        const auto name = entry.path().filename().string();
        if (name.size() == 7 && Resolver::isHash(name) && name.starts_with(v.raw)) return name;
    }
    return v.installDirName();
}

std::string installDirForPayload(const std::string& payload) {
    if (payload.size() > 7 && Resolver::isHash(payload)) return payload.substr(0, 7);
    return payload;
}

std::optional<fs::path> syncFile(const config::Config& cfg) {
    if (!cfg.version_sync_file_location) return std::nullopt;

    const fs::path path = *cfg.version_sync_file_location;
    if (!fs::exists(path)) {
        if (path.has_parent_path() && !fs::exists(path.parent_path()))
            throw Error(fmt::format("The path provided, \"{}\", does not exist. Please check the path and try again.",
                                    path.parent_path().string()));
        util::writeFile(path, "");
    }
    return path;
}

}
