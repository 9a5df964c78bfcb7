#include "install/SourceBuilder.hpp"
#include "paths/Directories.hpp"
#include "process/Runner.hpp"
#include "types/errors.hpp"
#include "util/files.hpp"
#include "log/Registry.hpp"

#include <boost/algorithm/string/trim.hpp>
#include <fmt/core.h>
#include <cstdlib>

namespace fs = std::filesystem;

namespace bob::install {

void SourceBuilder::checkPrerequisites() const {
#ifdef _WIN32
    if (const char* vs = std::getenv("VisualStudioVersion"); !vs || !*vs)
        throw ToolchainError("Please make sure you are using Developer PowerShell/Command Prompt for VS");
#else
    if (!runner_.probe("gcc") && !runner_.probe("clang"))
        throw ToolchainError("Clang or GCC have to be installed in order to build neovim from source");
#endif
    if (!runner_.probe("cmake"))
        throw ToolchainError("Cmake has to be installed in order to build neovim from source");
    if (!runner_.probe("git"))
        throw ToolchainError("Git has to be installed in order to build neovim from source");
}

void SourceBuilder::prepareWorkspace(const fs::path& workspace, const std::string& ref) const {
    fs::create_directories(workspace);

    if (!fs::exists(workspace / ".git")) runner_.check({"git", {"init"}, workspace});

    if (runner_.capture({"git", {"remote", "get-url", "origin"}, workspace}).ok())
        runner_.check({"git", {"remote", "set-url", "origin", UPSTREAM_REPO}, workspace});
    else
        runner_.check({"git", {"remote", "add", "origin", UPSTREAM_REPO}, workspace});

    log::Registry::install()->info("Fetching {} from origin", ref);
    if (!runner_.run({"git", {"fetch", "--depth", "1", "origin", ref}, workspace}).ok())
        throw Error("fetching remote failed, try providing the full commit hash");

    runner_.check({"git", {"checkout", "FETCH_HEAD"}, workspace});
}

void SourceBuilder::compile(const fs::path& workspace, const fs::path& prefix) const {
    const auto type = buildType();
    const auto buildArg = fmt::format("CMAKE_BUILD_TYPE={}", type);

    util::removeIfExists(workspace / "build");
    fs::create_directories(workspace / "build");

#ifdef _WIN32
    util::removeIfExists(workspace / ".deps");
    fs::create_directories(workspace / ".deps");

    runner_.check({"cmake", {"-S", "cmake.deps", "-B", ".deps", "-D", buildArg}, workspace});
    runner_.check({"cmake", {"--build", ".deps", "--config", type}, workspace});
    runner_.check({"cmake", {"-B", "build", "-D", buildArg}, workspace});
    runner_.check({"cmake", {"--build", "build", "--config", type}, workspace});
    runner_.check({"cmake", {"--install", "build", "--prefix", prefix.string()}, workspace});
#else
    runner_.check({"make", {buildArg, fmt::format("CMAKE_INSTALL_PREFIX={}", prefix.string())}, workspace});
    runner_.check({"make", {"install"}, workspace});
#endif
}

std::string SourceBuilder::build(const std::string& ref, const std::optional<std::string>& installDirName) const {
    checkPrerequisites();

    const auto workspace = paths::buildWorkspace(cfg_);

    prepareWorkspace(workspace, ref);
    const auto fullHash = boost::algorithm::trim_copy(
        runner_.checkOutput({"git", {"rev-parse", "FETCH_HEAD"}, workspace}));

    const auto prefix = paths::downloadsDir(cfg_) / installDirName.value_or(fullHash.substr(0, 7));
    const bool existed = fs::exists(prefix);

    log::Registry::install()->info("Building {} ({})", fullHash.substr(0, 7), buildType());
    try {
        compile(workspace, prefix);
    } catch (const std::exception&) {
        if (!existed) util::removeIfExists(prefix);
        throw;
    }

    fs::create_directories(prefix);
    util::writeFile(prefix / "full-hash.txt", fullHash);
    return fullHash;
}

}
