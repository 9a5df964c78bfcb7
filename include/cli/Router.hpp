#pragma once

#include "cli/types.hpp"
#include "cli/CommandUsage.hpp"

#include <functional>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace bob::cli {

class Router {
public:
    // Consulted before commands that switch or install versions; true means an editor is open.
    using EditorProbe = std::function<bool()>;

    explicit Router(EditorProbe editorRunning = {}) : editorRunning_(std::move(editorRunning)) {}

    void registerCommand(const CommandUsage& usage, CommandHandler handler);

    // args excludes argv[0]. No args prints the command overview.
    CommandResult execute(const std::vector<std::string>& args) const;

    [[nodiscard]] std::optional<CommandUsage> usageFor(const std::string& nameOrAlias) const;

private:
    std::unordered_map<std::string, CommandInfo> commands_;
    std::unordered_map<std::string, CommandUsage> usages_;
    std::unordered_map<std::string, std::string> aliasMap_; // alias -> canonical
    EditorProbe editorRunning_;

    [[nodiscard]] std::string canonicalFor(const std::string& nameOrAlias) const;
};

}
