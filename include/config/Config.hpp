#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace bob::config {

constexpr static uint8_t DEFAULT_ROLLBACK_LIMIT = 3;
constexpr static auto DEFAULT_GITHUB_MIRROR = "https://github.com";

enum class Format { Json, Toml, Yaml };

struct Config {
    std::optional<bool> enable_nightly_info;
    std::optional<bool> enable_release_build;
    std::optional<std::string> downloads_location;
    std::optional<std::string> installation_location;
    std::optional<std::string> version_sync_file_location;
    std::optional<std::string> github_mirror;
    std::optional<uint8_t> rollback_limit;
    std::optional<bool> add_neovim_binary_to_path;
    std::optional<bool> ignore_running_instances;
    std::optional<std::string> log_level;
    std::optional<std::string> log_file_location;

    [[nodiscard]] uint8_t rollbackLimit() const { return rollback_limit.value_or(DEFAULT_ROLLBACK_LIMIT); }
    [[nodiscard]] std::string githubMirror() const { return github_mirror.value_or(DEFAULT_GITHUB_MIRROR); }
    [[nodiscard]] bool releaseBuild() const { return enable_release_build.value_or(false); }
    [[nodiscard]] bool nightlyInfo() const { return enable_nightly_info.value_or(true); }
    [[nodiscard]] bool ignoreRunningInstances() const { return ignore_running_instances.value_or(true); }
};

Format formatFor(const std::filesystem::path& path);

// A missing file yields a default Config. String values have $VARS expanded.
Config loadConfig(const std::filesystem::path& path);
Config parseConfig(const std::string& content, Format format);

// Rewrites a single boolean key in place, keeping the file's format.
void persistFlag(const std::filesystem::path& path, const std::string& key, bool value);

void to_json(nlohmann::json& j, const Config& c);
void from_json(const nlohmann::json& j, Config& c);

}
