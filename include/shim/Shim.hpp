#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace bob::shim {

static constexpr auto SHIM_SENTINEL = "--&shim";
static constexpr auto VERSION_PROBE = "--&bob";
static constexpr auto SYSTEM_PAYLOAD = "system";

// Invoked through the shim when our file stem is the editor's name or the sentinel leads argv.
bool isShimInvocation(const std::filesystem::path& argv0, const std::vector<std::string>& args);

// Editor binary for an active payload: <root>/<dir>/bin/<editor>, falling back to an older
// <root>/<dir>/<platform>/bin/<editor> layout. "system" means the editor found on PATH.
std::filesystem::path resolveBinary(const config::Config& cfg, const std::string& payload);

// First editor on PATH that is not one of bob's own.
std::optional<std::filesystem::path> findSystemEditor(const config::Config& cfg);

// Entry point of shim mode. Only returns for the version probe; otherwise the process is
// replaced by the editor.
int run(std::vector<std::string> args);

}
