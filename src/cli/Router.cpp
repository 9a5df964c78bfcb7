#include "cli/Router.hpp"
#include "cli/Parser.hpp"
#include "cli/Usage.hpp"
#include "types/errors.hpp"
#include "log/Registry.hpp"

#include <fmt/core.h>

namespace bob::cli {

void Router::registerCommand(const CommandUsage& usage, CommandHandler handler) {
    const std::string key = usage.primary();

    CommandInfo info{usage.description.empty() ? "No description provided." : usage.description,
                     std::move(handler), {}, usage.maxPositionals, usage.needsIdleEditor};

    for (const std::string& alias : usage.aliases) {
        if (aliasMap_.contains(alias) && aliasMap_.at(alias) != key) {
            log::Registry::cli()->warn("Alias '{}' already mapped to '{}'; skipping duplicate for '{}'",
                                       alias, aliasMap_.at(alias), key);
            continue;
        }
        info.aliases.insert(alias);
        aliasMap_[alias] = key;
    }

    commands_[key] = std::move(info);
    usages_[key] = usage;
}

std::string Router::canonicalFor(const std::string& nameOrAlias) const {
    if (commands_.contains(nameOrAlias)) return nameOrAlias;
    if (aliasMap_.contains(nameOrAlias)) return aliasMap_.at(nameOrAlias);
    return nameOrAlias; // unknown; let caller error
}

std::optional<CommandUsage> Router::usageFor(const std::string& nameOrAlias) const {
    const auto canonical = canonicalFor(nameOrAlias);
    if (!usages_.contains(canonical)) return std::nullopt;
    return usages_.at(canonical);
}

CommandResult Router::execute(const std::vector<std::string>& args) const {
    if (args.empty()) return ok(Usage::all().toText());

    const auto canonical = canonicalFor(args.front());
    if (!commands_.contains(canonical))
        return invalid(fmt::format("Unknown command: {}. Run `bob help` for a list of commands.", args.front()));

    const auto& info = commands_.at(canonical);
    auto call = info.maxPositionals ? parseArgs(args, *info.maxPositionals) : parseArgs(args);
    call.name = canonical;

    if (call.hasFlag("help") || call.hasFlag("h")) return ok(usages_.at(canonical).toText());

    if (info.needsIdleEditor && editorRunning_ && editorRunning_())
        throw Error("Neovim is currently running. Please close it before switching versions.");

    log::Registry::cli()->debug("[Router] Executing command: '{}'", canonical);
    return info.handler(call);
}

}
