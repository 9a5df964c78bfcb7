#pragma once

#include "config/Config.hpp"
#include "types/Version.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace bob::version {

// Contents of the `used` file, trimmed. nullopt when no version is active.
std::optional<std::string> readUsed(const config::Config& cfg);

// Writes `used.tmp` and renames it over `used`.
void writeUsed(const config::Config& cfg, const std::string& payload);

// The string a switch to `v` writes into `used`: the full commit hash for Hash
// installs, the tag for everything else.
std::string payloadFor(const config::Config& cfg, const types::ResolvedVersion& v);

// Exact comparison of `payload` against the `used` file.
bool isUsed(const config::Config& cfg, const std::string& payload);

bool isInstalled(const config::Config& cfg, const std::string& dirName);

// Directory name under the downloads root holding `v`. Source builds live under the first
// seven characters of their full hash, so a shorter hash is matched by prefix against the
// installed builds. Falls back to `v.installDirName()` when nothing matches.
std::string installDirFor(const config::Config& cfg, const types::ResolvedVersion& v);

// Install directory an active payload refers to: hashes map to their first seven characters.
std::string installDirForPayload(const std::string& payload);

// The configured sync file, created empty when missing. nullopt when not configured.
std::optional<std::filesystem::path> syncFile(const config::Config& cfg);

}
