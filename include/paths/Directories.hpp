#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace bob::paths {

// Directories are derived from config + environment on every call and never cached.

std::filesystem::path homeDir();
std::filesystem::path configHome();
std::filesystem::path localDataDir();

// $BOB_CONFIG, else <config-home>/bob/config.toml when present, else config.json.
std::filesystem::path configFile();

// A custom downloads_location must already exist; the default one is created on demand.
std::filesystem::path downloadsDir(const config::Config& cfg);

// Where the downloads root lives, without creating or validating it.
std::filesystem::path downloadsLocation(const config::Config& cfg);
std::filesystem::path installationDir(const config::Config& cfg);

std::filesystem::path usedFile(const config::Config& cfg);
std::filesystem::path envDir(const config::Config& cfg);
std::filesystem::path buildWorkspace(const config::Config& cfg);

// Absolute path of the running binary, copied into place as the shim.
std::filesystem::path currentExecutable(const char* argv0);

// "nvim" or "nvim.exe"
std::string editorExecutable();

// First executable named `name` on $PATH whose directory is not one of `excluded`.
std::optional<std::filesystem::path> findOnPath(const std::string& name,
                                                const std::vector<std::filesystem::path>& excluded = {});

// True when `dir` is one of the $PATH entries.
bool isOnPath(const std::filesystem::path& dir);

}
