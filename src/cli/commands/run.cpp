#include "cli/commands.hpp"
#include "cli/commands/helpers.hpp"
#include "cli/Router.hpp"
#include "cli/Usage.hpp"
#include "process/Exec.hpp"
#include "runtime/Context.hpp"
#include "paths/Directories.hpp"
#include "version/ActiveVersion.hpp"
#include "types/errors.hpp"
#include "log/Registry.hpp"

#include <fmt/core.h>

namespace fs = std::filesystem;

namespace bob::cli {

// Editor binary of an installed version, or an error telling how to install it.
static fs::path installedBinary(runtime::Context& ctx, const types::ResolvedVersion& v) {
    const auto dir = paths::downloadsDir(ctx.config) / version::installDirFor(ctx.config, v);
    if (!fs::exists(dir))
        throw Error(fmt::format("Version {} is not installed. Install it first with: bob install {}", v.tag, v.tag));

    const auto binary = dir / "bin" / paths::editorExecutable();
    if (!fs::exists(binary))
        throw Error(fmt::format("Neovim binary not found at expected path: {}", binary.string()));
    return binary;
}

static CommandResult handle_run(runtime::Context& ctx, const CommandCall& call) {
    const auto binary = installedBinary(ctx, requireVersion(ctx, call));
    log::Registry::cli()->debug("[run] {} with {} argument(s)", binary.string(), call.passthrough.size());

    CommandResult result;
    result.exit_code = process::spawnForwardingSignals(binary, call.passthrough);
    return result;
}

void registerRunCommands(Router& r, runtime::Context& ctx) {
    r.registerCommand(Usage::run(), [&ctx](const CommandCall& c) { return handle_run(ctx, c); });
}

}
