#include "cli/commands.hpp"
#include "cli/Router.hpp"
#include "cli/Usage.hpp"
#include "cli/IO.hpp"
#include "switcher/Switcher.hpp"
#include "version/ActiveVersion.hpp"
#include "version/NightlyRing.hpp"
#include "runtime/Context.hpp"
#include "paths/Directories.hpp"
#include "util/timestamp.hpp"
#include "types/errors.hpp"

#include <fmt/core.h>
#include <chrono>

using namespace bob::types;

namespace bob::cli {

static CommandResult handle_rollback(runtime::Context& ctx, const CommandCall&) {
    const auto entries = version::NightlyRing(paths::downloadsDir(ctx.config)).list();
    if (entries.empty()) throw Error("There are no nightly rollbacks");

    std::vector<std::string> names;
    names.reserve(entries.size());
    for (const auto& e : entries) names.push_back(e.name());

    const auto choice = ctx.io->select("Choose which rollback to use (Newest to Oldest):", names);
    if (!choice) return ok("Rollback aborted...");

    const auto& entry = entries.at(*choice);
    if (version::isUsed(ctx.config, entry.name())) return ok(fmt::format("{} is already used.", entry.name()));

    const ResolvedVersion v{entry.name(), VersionKind::NightlyRollback, entry.name(), std::nullopt};
    switcher::Switcher(ctx).switchTo(v);

    const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    const auto age = std::chrono::seconds(now - entry.release.publishedAt());
    return ok(fmt::format("Successfully rolled back to version '{}' from {} ago", entry.name(),
                          util::humanizeDuration(age)));
}

void registerRollbackCommands(Router& r, runtime::Context& ctx) {
    r.registerCommand(Usage::rollback(), [&ctx](const CommandCall& c) { return handle_rollback(ctx, c); });
}

}
