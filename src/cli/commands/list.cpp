#include "cli/commands.hpp"
#include "cli/Router.hpp"
#include "cli/Usage.hpp"
#include "cli/Table.hpp"
#include "shim/Shim.hpp"
#include "version/ActiveVersion.hpp"
#include "version/Resolver.hpp"
#include "net/GitHub.hpp"
#include "runtime/Context.hpp"
#include "paths/Directories.hpp"

#include <boost/algorithm/string/predicate.hpp>
#include <fmt/core.h>
#include <algorithm>

namespace fs = std::filesystem;

namespace bob::cli {

static CommandResult handle_list(runtime::Context& ctx, const CommandCall&) {
    Table table({{"Version"}, {"Status"}});

    const auto used = version::readUsed(ctx.config);
    const bool hasSystem = shim::findSystemEditor(ctx.config).has_value();
    const bool systemUsed = used && *used == shim::SYSTEM_PAYLOAD;

    if (hasSystem || systemUsed)
        table.add_row({shim::SYSTEM_PAYLOAD, systemUsed ? (hasSystem ? "Used" : "Missing") : "Available"});

    std::vector<std::string> names;
    for (const auto& entry : fs::directory_iterator(paths::downloadsDir(ctx.config))) {
        if (!entry.is_directory()) continue;
        const auto name = entry.path().filename().string();
        if (version::Resolver::classify(name)) names.push_back(name);
    }
    std::ranges::sort(names);

    for (const auto& name : names) {
        const bool active = used && version::installDirForPayload(*used) == name;
        table.add_row({name, active ? "Used" : "Installed"});
    }

    if (table.empty()) return ok("There are no versions installed");
    return ok(table.render());
}

static CommandResult handle_list_remote(runtime::Context& ctx, const CommandCall&) {
    const auto root = paths::downloadsDir(ctx.config);
    const auto stable = ctx.github->stable().tag_name;
    const auto used = version::readUsed(ctx.config);

    std::string out;
    for (const auto& tag : ctx.github->tags()) {
        if (!boost::algorithm::starts_with(tag, "v")) continue;

        std::string line = tag;
        if (used && *used == tag) line += " (used)";
        else if (fs::is_directory(root / tag)) line += " (installed)";
        if (tag == stable) line += " (stable)";
        out += line + "\n";
    }
    return ok(out);
}

void registerListCommands(Router& r, runtime::Context& ctx) {
    r.registerCommand(Usage::list(), [&ctx](const CommandCall& c) { return handle_list(ctx, c); });
    r.registerCommand(Usage::listRemote(), [&ctx](const CommandCall& c) { return handle_list_remote(ctx, c); });
}

}
