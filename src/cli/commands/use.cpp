#include "cli/commands.hpp"
#include "cli/commands/helpers.hpp"
#include "cli/Router.hpp"
#include "cli/Usage.hpp"
#include "version/ActiveVersion.hpp"
#include "version/Resolver.hpp"
#include "runtime/Context.hpp"
#include "types/errors.hpp"
#include "util/files.hpp"
#include "log/Registry.hpp"

#include <boost/algorithm/string/trim.hpp>

namespace bob::cli {

static CommandResult handle_use(runtime::Context& ctx, const CommandCall& call) {
    const bool install = !call.hasFlag("no-install") && !call.hasFlag("n");
    return ok(useVersion(ctx, requireVersion(ctx, call), install));
}

static CommandResult handle_sync(runtime::Context& ctx, const CommandCall&) {
    const auto syncFile = version::syncFile(ctx.config);
    if (!syncFile) throw Error("version_sync_file_location needs to be set to use bob sync");

    const auto content = util::readFileToString(*syncFile);
    if (content.empty()) throw Error("Sync file is empty");

    const auto wanted = boost::algorithm::trim_copy(content);
    if (wanted.find("nightly-") != std::string::npos) throw Error("Cannot sync nightly rollbacks.");

    log::Registry::cli()->info("Using version {} set in {}", wanted, syncFile->string());
    return ok(useVersion(ctx, version::Resolver(*ctx.github).resolve(wanted), true));
}

void registerUseCommands(Router& r, runtime::Context& ctx) {
    r.registerCommand(Usage::use(), [&ctx](const CommandCall& c) { return handle_use(ctx, c); });
    r.registerCommand(Usage::sync(), [&ctx](const CommandCall& c) { return handle_sync(ctx, c); });
}

}
