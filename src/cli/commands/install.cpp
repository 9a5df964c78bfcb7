#include "cli/commands.hpp"
#include "cli/commands/helpers.hpp"
#include "cli/Router.hpp"
#include "cli/Usage.hpp"
#include "cli/IO.hpp"
#include "install/Installer.hpp"
#include "version/ActiveVersion.hpp"
#include "version/Resolver.hpp"
#include "runtime/Context.hpp"
#include "paths/Directories.hpp"
#include "log/Registry.hpp"

#include <fmt/core.h>
#include <algorithm>

namespace fs = std::filesystem;
using namespace bob::types;

namespace bob::cli {

static CommandResult handle_install(runtime::Context& ctx, const CommandCall& call) {
    const auto v = requireVersion(ctx, call);

    switch (const auto result = install::Installer(ctx).install(v); result.status) {
        case InstallStatus::Installed:
            return ok(fmt::format("{} has been successfully installed in {}", v.tag, result.path.string()));
        case InstallStatus::AlreadyInstalled:
            return ok(fmt::format("{} is already installed", v.tag));
        case InstallStatus::NightlyUpToDate:
            return ok("Nightly up to date!");
    }
    return ok();
}

static CommandResult handle_update(runtime::Context& ctx, const CommandCall& call) {
    const version::Resolver resolver(*ctx.github);
    install::Installer installer(ctx);

    if (!call.positional(0) || call.hasFlag("all") || call.hasFlag("a")) {
        bool updated = false;

        if (const auto stable = resolver.resolve("stable"); version::isInstalled(ctx.config, version::installDirFor(ctx.config, stable)))
            updated |= installer.install(stable).status == InstallStatus::Installed;

        if (version::isInstalled(ctx.config, "nightly"))
            updated |= installer.install(resolver.resolve("nightly")).status == InstallStatus::Installed;

        if (!updated) log::Registry::cli()->warn("There was nothing to update.");
        return ok();
    }

    const auto v = resolver.resolve(*call.positional(0));
    if (!version::isInstalled(ctx.config, version::installDirFor(ctx.config, v))) {
        log::Registry::cli()->warn("{} is not installed.", v.raw);
        return ok();
    }

    switch (installer.install(v).status) {
        case InstallStatus::NightlyUpToDate: return ok("Nightly is already updated!");
        case InstallStatus::AlreadyInstalled: return ok("Stable is already updated!");
        case InstallStatus::Installed: return ok(fmt::format("{} has been updated", v.tag));
    }
    return ok();
}

static std::vector<std::string> removableVersions(runtime::Context& ctx) {
    std::vector<std::string> names;
    const auto root = paths::downloadsDir(ctx.config);
    const auto used = version::readUsed(ctx.config);

    for (const auto& entry : fs::directory_iterator(root)) {
        if (!entry.is_directory()) continue;
        const auto name = entry.path().filename().string();
        if (!version::Resolver::classify(name)) continue;
        if (used && version::installDirForPayload(*used) == name) continue;
        names.push_back(name);
    }

    std::ranges::sort(names);
    return names;
}

static CommandResult handle_uninstall(runtime::Context& ctx, const CommandCall& call) {
    const auto root = paths::downloadsDir(ctx.config);

    if (call.positional(0)) {
        const auto v = requireVersion(ctx, call);
        if (isVersionUsed(ctx, v)) {
            log::Registry::cli()->warn("Switch to a different version before proceeding");
            return ok();
        }

        const auto dir = root / version::installDirFor(ctx.config, v);
        if (!fs::exists(dir)) {
            log::Registry::cli()->warn("{} is not installed.", v.tag);
            return ok();
        }

        fs::remove_all(dir);
        return ok(fmt::format("Successfully uninstalled version: {}", v.tag));
    }

    const auto candidates = removableVersions(ctx);
    if (candidates.empty()) return ok("You only have one neovim instance installed");

    const auto picked = ctx.io->multiSelect("Select the versions you wish to uninstall:", candidates);
    if (picked.empty() || !ctx.io->confirm("Do you wish to continue?", true)) return ok("Uninstall aborted...");

    std::string out;
    for (const auto i : picked) {
        fs::remove_all(root / candidates.at(i));
        out += fmt::format("Successfully uninstalled version: {}\n", candidates.at(i));
    }
    return ok(out);
}

void registerInstallCommands(Router& r, runtime::Context& ctx) {
    r.registerCommand(Usage::install(), [&ctx](const CommandCall& c) { return handle_install(ctx, c); });
    r.registerCommand(Usage::update(), [&ctx](const CommandCall& c) { return handle_update(ctx, c); });
    r.registerCommand(Usage::uninstall(), [&ctx](const CommandCall& c) { return handle_uninstall(ctx, c); });
}

}
