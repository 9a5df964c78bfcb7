#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace bob::cli {

// A simple labeled entry (option/flag), with optional aliases.
struct Entry {
    std::string label;                  // primary, e.g. "--no-install"
    std::string desc;
    std::vector<std::string> aliases;   // e.g. {"-n"}
};

// Example: {"bob use nightly", "Switch to the latest nightly build"}
struct Example {
    std::string cmd;
    std::string note;
};

class CommandUsage {
public:
    std::string command;
    std::vector<std::string> aliases;
    std::string description;
    std::optional<std::string> synopsis;         // if empty, synthesized

    std::vector<Entry> positionals;              // ordered; appear in synopsis
    std::vector<Entry> optional;
    std::vector<Example> examples;

    std::optional<std::size_t> maxPositionals;   // words past this are handed to the editor
    bool needsIdleEditor = false;                // refuses to run while nvim is open

    int term_width = 100;
    std::size_t max_key_col = 30;

    [[nodiscard]] const std::string& primary() const { return command; }

    [[nodiscard]] std::string toText() const;

    // One line for the command overview: "  use, u    Switch to ..."
    [[nodiscard]] std::string summaryLine(std::size_t keyWidth) const;
    [[nodiscard]] std::string label() const;

private:
    [[nodiscard]] std::string buildSynopsis_() const;
    [[nodiscard]] static std::string normalizePositional_(const std::string& s);
};

// Every command, in the order `help` lists them.
class CommandBook {
public:
    std::string title;
    std::vector<CommandUsage> commands;

    [[nodiscard]] std::string toText() const;
};

}
