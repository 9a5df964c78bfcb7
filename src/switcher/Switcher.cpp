#include "switcher/Switcher.hpp"
#include "integration/PathIntegration.hpp"
#include "runtime/BuildInfo.hpp"
#include "runtime/Context.hpp"
#include "version/ActiveVersion.hpp"
#include "paths/Directories.hpp"
#include "process/Runner.hpp"
#include "types/errors.hpp"
#include "util/files.hpp"
#include "log/Registry.hpp"

#include <boost/algorithm/string/trim.hpp>
#include <fmt/core.h>

namespace fs = std::filesystem;
using namespace bob::types;

namespace bob::switcher {

std::string Switcher::switchTo(const ResolvedVersion& version) {
    const auto payload = version::payloadFor(ctx_.config, version);
    version::writeUsed(ctx_.config, payload);

    ensureShim();
    updateSyncFile(version.tag);

    integration::PathIntegration(ctx_).ensure(paths::installationDir(ctx_.config));
    return payload;
}

fs::path Switcher::shimPath() const {
    return paths::installationDir(ctx_.config) / paths::editorExecutable();
}

bool Switcher::ensureShim() {
    const auto dir = paths::installationDir(ctx_.config);
    fs::create_directories(dir);
    const auto shim = dir / paths::editorExecutable();

    if (fs::exists(shim)) {
        const auto res = ctx_.runner->capture({shim.string(), {"--&bob"}, std::nullopt});
        const auto reported = boost::algorithm::trim_copy(res.output);
        if (res.ok() && reported == runtime::toolVersion()) return false;
        log::Registry::shim()->info("Shim reports '{}', expected '{}', replacing it", reported, runtime::toolVersion());
    }

    replaceShim(shim);
    log::Registry::shim()->debug("[Switcher] Shim written to {}", shim.string());
    return true;
}

void Switcher::replaceShim(const fs::path& shim) const {
#ifdef _WIN32
    try {
        fs::copy_file(ctx_.selfExe, shim, fs::copy_options::overwrite_existing);
    } catch (const fs::filesystem_error& e) {
        const int code = e.code().value();
        if (code == 26 || code == 32)
            throw FileBusyError(fmt::format(
                "{} is busy. Close every running neovim instance and try again.", shim.string()));
        throw;
    }
#else
    // Copy beside the shim and rename over it, so a running shim keeps its inode.
    const auto tmp = fs::path(shim.string() + ".tmp");
    fs::copy_file(ctx_.selfExe, tmp, fs::copy_options::overwrite_existing);
    fs::permissions(tmp, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                             fs::perms::others_read | fs::perms::others_exec);
    fs::rename(tmp, shim);
#endif
}

void Switcher::updateSyncFile(const std::string& value) const {
    const auto syncFile = version::syncFile(ctx_.config);
    if (!syncFile) return;

    if (boost::algorithm::trim_copy(util::readFileToString(*syncFile)) == value) return;

    util::writeFile(*syncFile, value);
    log::Registry::bob()->info("Written version to {}", syncFile->string());
}

}
