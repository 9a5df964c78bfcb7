#include "cli/commands/helpers.hpp"
#include "cli/types.hpp"
#include "install/Installer.hpp"
#include "switcher/Switcher.hpp"
#include "version/ActiveVersion.hpp"
#include "version/Resolver.hpp"
#include "runtime/Context.hpp"
#include "paths/Directories.hpp"
#include "types/errors.hpp"
#include "log/Registry.hpp"

#include <fmt/core.h>

namespace fs = std::filesystem;
using namespace bob::types;

namespace bob::cli {

ResolvedVersion requireVersion(runtime::Context& ctx, const CommandCall& call) {
    const auto input = call.positional(0);
    if (!input) throw VersionError(fmt::format("`bob {}` needs a version, see `bob help {}`", call.name, call.name));
    return version::Resolver(*ctx.github).resolve(*input);
}

bool isVersionUsed(runtime::Context& ctx, const ResolvedVersion& v) {
    if (v.kind == VersionKind::Hash && v.raw.size() <= 7 && !version::isInstalled(ctx.config, version::installDirFor(ctx.config, v)))
        return false;
    return version::isUsed(ctx.config, version::payloadFor(ctx.config, v));
}

std::string useVersion(runtime::Context& ctx, ResolvedVersion v, const bool install) {
    const bool used = isVersionUsed(ctx, v);
    switcher::Switcher switcher(ctx);

    switcher.ensureShim();
    if (used && v.kind != VersionKind::Nightly) return fmt::format("{} is already installed and used!", v.tag);

    if (install) {
        const auto result = install::Installer(ctx).install(v);
        if (used && result.status == InstallStatus::NightlyUpToDate) return "Nightly is already updated and used!";
    }

    if (!version::isInstalled(ctx.config, version::installDirFor(ctx.config, v)))
        throw Error(fmt::format("{} is not installed. Install it first with: bob install {}", v.tag, v.tag));

    switcher.switchTo(v);

    if (v.kind == VersionKind::Stable) {
        const auto legacy = paths::downloadsDir(ctx.config) / "stable";
        if (fs::exists(legacy)) {
            fs::remove_all(legacy);
            log::Registry::install()->debug("[use] Removed legacy {}", legacy.string());
        }
    }

    return fmt::format("You can now use {}!", v.tag);
}

}
