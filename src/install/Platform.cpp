#include "install/Platform.hpp"

#include <fmt/core.h>

using namespace bob::types;

namespace bob::install {

std::string platformName(const std::optional<Semver>& semver) {
#ifdef _WIN32
    (void)semver;
    return "nvim-win64";
#elif defined(__APPLE__)
    if (semver && *semver <= Semver{0, 9, 5}) return "nvim-macos";
#if defined(__aarch64__) || defined(__arm64__)
    return "nvim-macos-arm64";
#else
    return "nvim-macos-x86_64";
#endif
#else
    if (semver && *semver <= Semver{0, 10, 3}) return "nvim-linux64";
#if defined(__aarch64__)
    return "nvim-linux-arm64";
#else
    return "nvim-linux-x86_64";
#endif
#endif
}

std::string appImageName(const std::optional<Semver>& semver) {
    if (semver && *semver <= Semver{0, 10, 3}) return "nvim";
    return platformName(semver);
}

std::string archiveExtension() {
#ifdef _WIN32
    return "zip";
#else
    return "tar.gz";
#endif
}

std::string releaseAssetUrl(const std::string& mirror, const std::string& tag, const std::string& asset) {
    auto base = mirror;
    while (!base.empty() && base.back() == '/') base.pop_back();
    return fmt::format("{}/neovim/neovim/releases/download/{}/{}", base, tag, asset);
}

}
