#pragma once

#include "types/Version.hpp"

#include <optional>
#include <string>

namespace bob::install {

// Asset base name for this OS/arch, e.g. nvim-linux-x86_64. Releases up to 0.9.5 (macOS)
// and 0.10.3 (Linux) used the older names. No semver means the newest naming.
std::string platformName(const std::optional<types::Semver>& semver);

// Base name of the Linux AppImage asset: plain "nvim" up to 0.10.3.
std::string appImageName(const std::optional<types::Semver>& semver);

// "zip" on Windows, "tar.gz" elsewhere.
std::string archiveExtension();

std::string releaseAssetUrl(const std::string& mirror, const std::string& tag, const std::string& asset);

}
