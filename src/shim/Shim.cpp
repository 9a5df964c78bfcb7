#include "shim/Shim.hpp"
#include "version/ActiveVersion.hpp"
#include "paths/Directories.hpp"
#include "process/Exec.hpp"
#include "runtime/BuildInfo.hpp"
#include "types/errors.hpp"
#include "log/Registry.hpp"

#include <fmt/core.h>
#include <iostream>

namespace fs = std::filesystem;

namespace bob::shim {

bool isShimInvocation(const fs::path& argv0, const std::vector<std::string>& args) {
    if (!args.empty() && args.front() == SHIM_SENTINEL) return true;
    return argv0.stem().string() == fs::path(paths::editorExecutable()).stem().string();
}

std::optional<fs::path> findSystemEditor(const config::Config& cfg) {
    return paths::findOnPath(paths::editorExecutable(),
                             {paths::installationDir(cfg), paths::downloadsDir(cfg)});
}

fs::path resolveBinary(const config::Config& cfg, const std::string& payload) {
    if (payload == SYSTEM_PAYLOAD) {
        if (const auto system = findSystemEditor(cfg)) return *system;
        throw Error("no system neovim found on PATH");
    }

    const auto installDir = paths::downloadsDir(cfg) / version::installDirForPayload(payload);
    const auto editor = paths::editorExecutable();

    if (const auto direct = installDir / "bin" / editor; fs::exists(direct)) return direct;

    std::error_code ec;
    for (const auto& entry : fs::directory_iterator(installDir, ec))
        if (entry.is_directory() && fs::exists(entry.path() / "bin" / editor)) return entry.path() / "bin" / editor;

    throw Error(fmt::format("{} is not installed correctly, no {} under {}", payload, editor, installDir.string()));
}

int run(std::vector<std::string> args) {
    if (!args.empty() && args.front() == SHIM_SENTINEL) args.erase(args.begin());

    if (!args.empty() && args.front() == VERSION_PROBE) {
        std::cout << runtime::toolVersion() << std::endl;
        return 0;
    }

    const auto cfg = config::loadConfig(paths::configFile());
    const auto used = version::readUsed(cfg);
    if (!used) throw Error("no active version; install one with `install`");

    const auto binary = resolveBinary(cfg, *used);
    log::Registry::shim()->debug("[Shim] {} -> {}", *used, binary.string());
    process::replaceProcess(binary, args);
}

}
