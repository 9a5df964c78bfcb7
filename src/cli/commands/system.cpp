#include "cli/commands.hpp"
#include "cli/Router.hpp"
#include "cli/Usage.hpp"
#include "integration/PathIntegration.hpp"
#include "runtime/BuildInfo.hpp"
#include "runtime/Context.hpp"
#include "paths/Directories.hpp"
#include "types/errors.hpp"
#include "log/Registry.hpp"

#include <fmt/core.h>

namespace fs = std::filesystem;

namespace bob::cli {

static CommandResult handle_erase(runtime::Context& ctx, const CommandCall&) {
    const auto root = paths::downloadsLocation(ctx.config);
    const bool customInstall = ctx.config.installation_location.has_value();
    const auto shim = customInstall ? fs::path(*ctx.config.installation_location) / paths::editorExecutable()
                                    : fs::path{};

    if (!fs::exists(root) && !(customInstall && fs::exists(shim))) throw Error("There's nothing to erase");

    if (fs::exists(root)) integration::PathIntegration(ctx).erase(paths::installationDir(ctx.config));

    if (customInstall) {
        if (fs::remove(shim)) log::Registry::cli()->info("Successfully removed neovim executable");
    } else if (fs::exists(root) && fs::remove_all(paths::installationDir(ctx.config)) > 0) {
        log::Registry::cli()->info("Successfully removed neovim's installation folder");
    }

    if (fs::remove_all(root) > 0)
        log::Registry::cli()->info("Successfully removed neovim downloads folder");

    return ok("Everything bob installed has been erased");
}

static CommandResult handle_help(Router& r, const CommandCall& call) {
    if (const auto name = call.positional(0)) {
        if (const auto usage = r.usageFor(*name)) return ok(usage->toText());
        return invalid(fmt::format("Unknown command: {}", *name));
    }
    return ok(Usage::all().toText());
}

static CommandResult handle_version(const CommandCall&) {
    return ok("bob " + runtime::toolVersion());
}

void registerSystemCommands(Router& r, runtime::Context& ctx) {
    r.registerCommand(Usage::erase(), [&ctx](const CommandCall& c) { return handle_erase(ctx, c); });
    r.registerCommand(Usage::help(), [&r](const CommandCall& c) { return handle_help(r, c); });
    r.registerCommand(Usage::version(), handle_version);
}

}
