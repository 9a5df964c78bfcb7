#include "cli/Usage.hpp"

#include <fmt/core.h>

using namespace bob::cli;

CommandBook Usage::all() {
    CommandBook book;
    book.title = "bob, a version manager for neovim";
    book.commands = {
        use(), install(), sync(), uninstall(), rollback(), erase(),
        list(), listRemote(), run(), update(), help(), version()
    };
    return book;
}

CommandUsage Usage::use() {
    CommandUsage cmd;
    cmd.command = "use";
    cmd.description = "Switch to the specified version, installing it first unless --no-install is given.";
    cmd.positionals = {{"<version>", fmt::format("Version to switch to |{}|", VERSION_FORMS)}};
    cmd.optional = {{"--no-install", "Do not install the version when it is missing", {"-n"}}};
    cmd.needsIdleEditor = true;
    cmd.examples = {{"bob use stable", ""}, {"bob use v0.9.5 --no-install", ""}};
    return cmd;
}

CommandUsage Usage::install() {
    CommandUsage cmd;
    cmd.command = "install";
    cmd.description = "Install the specified version, can also be used to update an out-of-date nightly.";
    cmd.positionals = {{"<version>", fmt::format("Version to install |{}|", VERSION_FORMS)}};
    cmd.needsIdleEditor = true;
    cmd.examples = {{"bob install nightly", ""}, {"bob install 0.10.0", ""}};
    return cmd;
}

CommandUsage Usage::sync() {
    CommandUsage cmd;
    cmd.command = "sync";
    cmd.description = "Install and use the version named in version_sync_file_location.";
    cmd.needsIdleEditor = true;
    return cmd;
}

CommandUsage Usage::uninstall() {
    CommandUsage cmd;
    cmd.command = "uninstall";
    cmd.aliases = {"rm", "remove"};
    cmd.description = "Uninstall the specified version, or pick versions to uninstall when none is given.";
    cmd.positionals = {{"[version]", fmt::format("Version to uninstall |{}|", VERSION_FORMS)}};
    cmd.needsIdleEditor = true;
    return cmd;
}

CommandUsage Usage::rollback() {
    CommandUsage cmd;
    cmd.command = "rollback";
    cmd.description = "Switch to one of the kept nightly snapshots.";
    cmd.needsIdleEditor = true;
    return cmd;
}

CommandUsage Usage::erase() {
    CommandUsage cmd;
    cmd.command = "erase";
    cmd.description = "Erase every change bob made: installs, downloads, the shim and PATH changes.";
    return cmd;
}

CommandUsage Usage::list() {
    CommandUsage cmd;
    cmd.command = "list";
    cmd.aliases = {"ls"};
    cmd.description = "List installed and used versions.";
    return cmd;
}

CommandUsage Usage::listRemote() {
    CommandUsage cmd;
    cmd.command = "list-remote";
    cmd.aliases = {"ls-remote"};
    cmd.description = "List recent upstream releases.";
    return cmd;
}

CommandUsage Usage::run() {
    CommandUsage cmd;
    cmd.command = "run";
    cmd.description = "Run an installed version without switching to it. Arguments after the version go to neovim.";
    cmd.synopsis = "bob run <version> [args...]";
    cmd.positionals = {{"<version>", fmt::format("Version to run |{}|", VERSION_FORMS)}};
    cmd.maxPositionals = 1;
    cmd.examples = {{"bob run nightly --clean file.txt", ""}};
    return cmd;
}

CommandUsage Usage::update() {
    CommandUsage cmd;
    cmd.command = "update";
    cmd.description = "Update an installed stable or nightly.";
    cmd.positionals = {{"[version]", "nightly|stable"}};
    cmd.optional = {{"--all", "Update every installed channel", {"-a"}}};
    cmd.needsIdleEditor = true;
    return cmd;
}

CommandUsage Usage::help() {
    CommandUsage cmd;
    cmd.command = "help";
    cmd.aliases = {"--help", "-h"};
    cmd.description = "Show help information about commands.";
    cmd.positionals = {{"[command]", "Command to describe"}};
    return cmd;
}

CommandUsage Usage::version() {
    CommandUsage cmd;
    cmd.command = "version";
    cmd.aliases = {"--version", "-V"};
    cmd.description = "Show the version of bob.";
    return cmd;
}
