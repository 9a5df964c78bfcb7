#pragma once

#include "config/Config.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace bob::process { class Runner; }

namespace bob::install {

// Builds the editor from a git ref inside the shared <root>/neovim-git workspace.
class SourceBuilder {
public:
    static constexpr auto UPSTREAM_REPO = "https://github.com/neovim/neovim.git";

    SourceBuilder(process::Runner& runner, const config::Config& cfg) : runner_(runner), cfg_(cfg) {}

    // Throws ToolchainError naming the first missing tool.
    void checkPrerequisites() const;

    // Fetches ref at depth 1, builds it and installs into <root>/<installDirName>, or into
    // <root>/<first seven characters of the fetched commit> when no name is given.
    // Writes full-hash.txt there and returns the full commit hash.
    std::string build(const std::string& ref, const std::optional<std::string>& installDirName = std::nullopt) const;

    [[nodiscard]] std::string buildType() const { return cfg_.releaseBuild() ? "Release" : "RelWithDebInfo"; }

private:
    process::Runner& runner_;
    const config::Config& cfg_;

    void prepareWorkspace(const std::filesystem::path& workspace, const std::string& ref) const;
    void compile(const std::filesystem::path& workspace, const std::filesystem::path& prefix) const;
};

}
