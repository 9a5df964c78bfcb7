#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace bob::process {

// Starts binary with args (argv[0] excluded), forwards SIGINT, SIGTERM, SIGHUP and
// SIGUSR1 to it, and returns its exit status (128 + signal when it was killed).
int spawnForwardingSignals(const std::filesystem::path& binary, const std::vector<std::string>& args);

// Replaces the current process with binary. On Windows, where exec does not replace
// the process, spawns it, waits and exits with its status. Throws only if the binary
// cannot be started.
[[noreturn]] void replaceProcess(const std::filesystem::path& binary, const std::vector<std::string>& args);

}
