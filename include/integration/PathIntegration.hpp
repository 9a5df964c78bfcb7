#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace bob::runtime { struct Context; }

namespace bob::integration {

// The parts of the environment that decide where shell setup goes.
struct ShellEnv {
    std::filesystem::path home;
    std::string shell;                                   // basename of $SHELL
    std::optional<std::filesystem::path> zdotdir;        // $ZDOTDIR
    std::optional<std::filesystem::path> xdgConfigHome;  // $XDG_CONFIG_HOME

    static ShellEnv fromProcess();

    [[nodiscard]] bool isFish() const { return shell == "fish"; }
    [[nodiscard]] std::filesystem::path fishConfDir() const;

    // rc files for the detected shell, in the order they are tried.
    [[nodiscard]] std::vector<std::filesystem::path> rcFiles() const;

    // Every rc file bob may have touched, for erase.
    [[nodiscard]] std::vector<std::filesystem::path> allRcFiles() const;
};

// Puts the shim directory on the user's PATH exactly once.
class PathIntegration {
public:
    static constexpr auto CONFIG_KEY = "add_neovim_binary_to_path";
    static constexpr auto PROMPT_TIMEOUT = std::chrono::seconds(120);

    PathIntegration(runtime::Context& ctx, ShellEnv shellEnv) : ctx_(ctx), env_(std::move(shellEnv)) {}
    explicit PathIntegration(runtime::Context& ctx) : PathIntegration(ctx, ShellEnv::fromProcess()) {}

    // Honors add_neovim_binary_to_path, prompting when it is unset. Returns true when
    // the environment was changed.
    bool ensure(const std::filesystem::path& installDir);

    // Removes what apply() added.
    void erase(const std::filesystem::path& installDir);

    // Writes the env scripts and shell hooks (or the registry entry) unconditionally.
    void apply(const std::filesystem::path& installDir);

    static std::string envShScript(const std::filesystem::path& installDir);
    static std::string envFishScript(const std::filesystem::path& installDir);
    [[nodiscard]] std::string sourceLine() const;

private:
    runtime::Context& ctx_;
    ShellEnv env_;

    std::optional<bool> decide(const std::filesystem::path& installDir);
    void applyPosix(const std::filesystem::path& installDir);
    void erasePosix();
#ifdef _WIN32
    static void applyRegistry(const std::filesystem::path& installDir);
    static void eraseRegistry(const std::filesystem::path& installDir);
#endif
};

}
