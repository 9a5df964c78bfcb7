#include "archive/Extractor.hpp"
#include "archive/TarGz.hpp"
#include "concurrency/ThreadPool.hpp"
#include "install/Platform.hpp"
#include "paths/Directories.hpp"
#include "process/Runner.hpp"
#include "types/errors.hpp"
#include "util/files.hpp"
#include "log/Registry.hpp"

#include <fmt/core.h>

namespace fs = std::filesystem;

namespace bob::archive {

fs::path Extractor::extract(const fs::path& archive, const fs::path& root, const std::string& tag) const {
    if (!fs::exists(archive))
        throw Error(fmt::format("Failed to open file {}, file doesn't exist", archive.string()));

    const auto target = root / tag;
    util::removeIfExists(target);

    log::Registry::install()->info("Expanding archive {}", archive.filename().string());

    const auto name = archive.filename().string();
    if (name.ends_with(".tar.gz") || name.ends_with(".tgz")) {
        pool_.run([archive, target] { return extractTarGz(archive, target, 1); }).get();
    } else {
        fs::create_directories(target);
        runner_.check({"tar", {"-xf", archive.string(), "-C", target.string(), "--strip-components=1"}, std::nullopt});
    }

    normalizeLayout(target);
    finalize(target, archive);

    log::Registry::install()->info("Finished expanding to {}", target.string());
    return target;
}

fs::path Extractor::extractAppImage(const fs::path& appImage, const fs::path& root, const std::string& tag,
                                    const std::optional<types::Semver>& semver) const {
    fs::permissions(appImage, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                                  fs::perms::others_read | fs::perms::others_exec, fs::perm_options::replace);

    const auto squashfs = root / "squashfs-root";
    util::removeIfExists(squashfs);

    log::Registry::install()->info("Extracting AppImage {}", appImage.filename().string());
    runner_.check({fs::absolute(appImage).string(), {"--appimage-extract"}, root});

    if (!fs::exists(squashfs)) throw Error("AppImage extraction did not produce squashfs-root");

    const auto target = root / tag;
    util::removeIfExists(target);
    fs::rename(squashfs, target);

    if (const auto usr = target / "usr"; fs::exists(usr)) fs::rename(usr, target / install::platformName(semver));

    normalizeLayout(target);
    finalize(target, appImage);
    return target;
}

void Extractor::normalizeLayout(const fs::path& installDir) {
    const auto editor = paths::editorExecutable();
    if (fs::exists(installDir / "bin" / editor)) return;

    for (const auto& entry : fs::directory_iterator(installDir)) {
        if (!entry.is_directory() || !fs::exists(entry.path() / "bin" / editor)) continue;

        log::Registry::install()->debug("[Extractor] Hoisting {} into {}", entry.path().filename().string(),
                                        installDir.string());

        const auto staging = installDir / ".bob-hoist";
        fs::rename(entry.path(), staging);
        for (const auto& child : fs::directory_iterator(staging)) {
            const auto dest = installDir / child.path().filename();
            if (fs::exists(dest))
                throw Error(fmt::format("Cannot normalize {}: {} already exists", installDir.string(), dest.string()));
            fs::rename(child.path(), dest);
        }
        fs::remove(staging);
        return;
    }

    throw Error(fmt::format("Extracted archive does not contain bin/{} in {}", editor, installDir.string()));
}

void Extractor::finalize(const fs::path& installDir, const fs::path& asset) {
#ifndef _WIN32
    const auto binary = installDir / "bin" / paths::editorExecutable();
    fs::permissions(binary, static_cast<fs::perms>(0551), fs::perm_options::replace);
#endif
    fs::remove(asset);
}

}
