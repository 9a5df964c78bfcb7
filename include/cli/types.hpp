#pragma once

#include <functional>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace bob::cli {

struct FlagKV {
    std::string key;
    std::optional<std::string> value;
};

struct CommandCall {
    std::string name;
    std::vector<FlagKV> options;
    std::vector<std::string> positionals;
    std::vector<std::string> passthrough; // everything after `--`, or after the last positional of `run`

    [[nodiscard]] bool hasFlag(const std::string& key) const {
        for (const auto& [k, v] : options) if (k == key) return true;
        return false;
    }

    [[nodiscard]] std::optional<std::string> positional(const size_t i) const {
        if (i < positionals.size()) return positionals[i];
        return std::nullopt;
    }
};

struct CommandResult {
    int exit_code = 0;                 // 0 = success
    std::string stdout_text;
    std::string stderr_text;
};

using CommandHandler = std::function<CommandResult(const CommandCall&)>;

struct CommandInfo {
    std::string description;
    CommandHandler handler;
    std::unordered_set<std::string> aliases;
    std::optional<size_t> maxPositionals; // remaining words become passthrough
    bool needsIdleEditor = false;
};

inline CommandResult ok(std::string out = {}) {
    if (!out.empty() && out.back() != '\n') out += '\n';
    return {0, std::move(out), ""};
}

inline CommandResult invalid(const std::string& err) {
    return {2, "", err + "\n"};
}

}
