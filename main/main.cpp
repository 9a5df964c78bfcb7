// Shim
#include "shim/Shim.hpp"

// CLI
#include "cli/Router.hpp"
#include "cli/commands.hpp"

// Runtime
#include "runtime/Context.hpp"
#include "process/Processes.hpp"
#include "paths/Directories.hpp"

// Misc
#include "config/Config.hpp"
#include "log/Registry.hpp"

#include <fmt/core.h>
#include <string>
#include <vector>

using namespace bob;

namespace {

int runCli(const std::vector<std::string>& args, const char* argv0) {
    const auto configPath = paths::configFile();
    auto cfg = config::loadConfig(configPath);

    std::optional<std::filesystem::path> logFile;
    if (cfg.log_file_location) logFile = *cfg.log_file_location;
    log::Registry::configure(cfg.log_level, logFile);

    const auto ctx = runtime::Context::system(std::move(cfg), configPath, paths::currentExecutable(argv0));

    cli::Router router([&ctx] {
        return !ctx->config.ignoreRunningInstances() && process::isEditorRunning(*ctx->runner);
    });
    cli::registerAllCommands(router, *ctx);

    const auto result = router.execute(args);
    if (!result.stdout_text.empty()) fmt::print("{}", result.stdout_text);
    if (!result.stderr_text.empty()) fmt::print(stderr, "{}", result.stderr_text);
    return result.exit_code;
}

}

int main(const int argc, char** argv) {
    const std::vector<std::string> args(argv + 1, argv + argc);

    try {
        log::Registry::init();

        if (shim::isShimInvocation(argv[0], args)) return shim::run(args);
        return runCli(args, argv[0]);
    } catch (const std::exception& e) {
        fmt::print(stderr, "Error: {}\n", e.what());
        return 1;
    }
}
