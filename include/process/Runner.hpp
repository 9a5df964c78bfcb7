#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace bob::process {

struct Command {
    std::string program;
    std::vector<std::string> args;
    std::optional<std::filesystem::path> cwd;

    [[nodiscard]] std::string toString() const;
};

struct ExecResult {
    int exitCode = -1;   // -1 when the child died from a signal
    std::string output;  // stdout, only filled by Runner::capture

    [[nodiscard]] bool ok() const { return exitCode == 0; }
};

// Seam for everything that starts a child process, so tests can record commands instead.
class Runner {
public:
    virtual ~Runner() = default;

    // Child inherits stdin/stdout/stderr.
    virtual ExecResult run(const Command& cmd) = 0;

    // Child stdout is collected into ExecResult::output; stderr is discarded.
    virtual ExecResult capture(const Command& cmd) = 0;

    // run() that throws SubprocessError on a non-zero exit.
    void check(const Command& cmd);

    // capture() that throws SubprocessError on a non-zero exit.
    std::string checkOutput(const Command& cmd);

    // True when `program args...` can be started and exits 0.
    bool probe(const std::string& program, const std::vector<std::string>& args = {"--version"});
};

class SystemRunner final : public Runner {
public:
    ExecResult run(const Command& cmd) override;
    ExecResult capture(const Command& cmd) override;
};

}
