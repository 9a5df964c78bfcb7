#include "integration/PathIntegration.hpp"
#include "runtime/Context.hpp"
#include "config/Config.hpp"
#include "paths/Directories.hpp"
#include "cli/IO.hpp"
#include "util/files.hpp"
#include "log/Registry.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/join.hpp>
#include <boost/algorithm/string/replace.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <fmt/core.h>
#include <cstdlib>
#include <sstream>

#ifdef _WIN32
#include <windows.h>
#endif

namespace fs = std::filesystem;

namespace bob::integration {

namespace {

std::optional<std::string> env(const char* name) {
    if (const char* v = std::getenv(name); v && *v) return std::string(v);
    return std::nullopt;
}

bool containsLine(const std::string& content, const std::string& line) {
    std::istringstream in(content);
    std::string current;
    while (std::getline(in, current))
        if (boost::algorithm::trim_copy(current) == line) return true;
    return false;
}

std::string withoutLine(const std::string& content, const std::string& line) {
    std::istringstream in(content);
    std::ostringstream out;
    std::string current;
    while (std::getline(in, current))
        if (boost::algorithm::trim_copy(current) != line) out << current << '\n';
    return out.str();
}

}

ShellEnv ShellEnv::fromProcess() {
    ShellEnv e;
    e.home = paths::homeDir();
    if (const auto shell = env("SHELL")) e.shell = fs::path(*shell).filename().string();
    if (const auto z = env("ZDOTDIR")) e.zdotdir = fs::path(*z);
    if (const auto x = env("XDG_CONFIG_HOME")) e.xdgConfigHome = fs::path(*x);
    return e;
}

fs::path ShellEnv::fishConfDir() const {
    return xdgConfigHome.value_or(home / ".config") / "fish" / "conf.d";
}

std::vector<fs::path> ShellEnv::rcFiles() const {
    if (shell == "bash") return {home / ".bashrc", home / ".bash_profile"};
    if (shell == "zsh") return {zdotdir.value_or(home) / ".zshenv"};
    return {home / ".profile"};
}

std::vector<fs::path> ShellEnv::allRcFiles() const {
    return {home / ".bashrc", home / ".bash_profile", zdotdir.value_or(home) / ".zshenv", home / ".profile"};
}

std::string PathIntegration::envShScript(const fs::path& installDir) {
    return fmt::format(R"(#!/bin/sh
# bob shell setup, sourced from your shell's rc file
case ":${{PATH}}:" in
    *:"{0}":*)
        ;;
    *)
        export PATH="{0}:$PATH"
        ;;
esac
)", installDir.string());
}

std::string PathIntegration::envFishScript(const fs::path& installDir) {
    return fmt::format(R"(# bob shell setup for fish
if not contains "{0}" $PATH
    set -x PATH "{0}" $PATH
end
)", installDir.string());
}

std::string PathIntegration::sourceLine() const {
    return fmt::format(". \"{}\"", (paths::envDir(ctx_.config) / "env.sh").string());
}

std::optional<bool> PathIntegration::decide(const fs::path& installDir) {
    if (const auto flag = ctx_.config.add_neovim_binary_to_path) return *flag;

    if (!ctx_.io->interactive()) {
        log::Registry::path()->info("Non-interactive session, adding {} to PATH", installDir.string());
        config::persistFlag(ctx_.configPath, CONFIG_KEY, true);
        ctx_.config.add_neovim_binary_to_path = true;
        return true;
    }

    const auto answer = ctx_.io->confirmWithin(
        fmt::format("Add {} to your PATH so `nvim` resolves to bob's shim?", installDir.string()), PROMPT_TIMEOUT);

    if (!answer) {
        log::Registry::path()->warn("No answer, skipping PATH integration");
        return std::nullopt;
    }

    config::persistFlag(ctx_.configPath, CONFIG_KEY, *answer);
    ctx_.config.add_neovim_binary_to_path = *answer;
    return *answer;
}

bool PathIntegration::ensure(const fs::path& installDir) {
    if (paths::isOnPath(installDir)) {
        log::Registry::path()->debug("[PathIntegration] {} already on PATH", installDir.string());
        return false;
    }

    const auto decision = decide(installDir);
    if (!decision) return false;

    if (!*decision) {
        log::Registry::path()->info("Make sure to have {} in PATH", installDir.string());
        return false;
    }

    apply(installDir);
    return true;
}

void PathIntegration::apply(const fs::path& installDir) {
#ifdef _WIN32
    applyRegistry(installDir);
#else
    applyPosix(installDir);
#endif
}

void PathIntegration::erase(const fs::path& installDir) {
#ifdef _WIN32
    eraseRegistry(installDir);
#else
    (void)installDir;
    erasePosix();
#endif
}

void PathIntegration::applyPosix(const fs::path& installDir) {
    const auto envDir = paths::envDir(ctx_.config);
    fs::create_directories(envDir);
    util::writeFileAtomic(envDir / "env.sh", envShScript(installDir));
    util::writeFileAtomic(envDir / "env.fish", envFishScript(installDir));

    if (env_.isFish()) {
        const auto hook = env_.fishConfDir() / "bob.fish";
        if (fs::exists(hook)) return;
        fs::create_directories(hook.parent_path());
        util::writeFile(hook, fmt::format("source \"{}\"\n", (envDir / "env.fish").string()));
        log::Registry::path()->info("Added {} to PATH via {}", installDir.string(), hook.string());
        return;
    }

    const auto line = sourceLine();
    const auto rcFiles = env_.rcFiles();

    bool touched = false;
    for (const auto& rc : rcFiles) {
        if (!fs::exists(rc)) continue;
        auto content = util::readFileToString(rc);
        touched = true;
        if (containsLine(content, line)) continue;
        if (!content.empty() && content.back() != '\n') content += '\n';
        content += line + "\n";
        util::writeFile(rc, content);
        log::Registry::path()->info("Added {} to PATH via {}", installDir.string(), rc.string());
    }

    if (!touched) {
        const auto& rc = rcFiles.front();
        if (rc.has_parent_path()) fs::create_directories(rc.parent_path());
        util::writeFile(rc, line + "\n");
        log::Registry::path()->info("Added {} to PATH via {}", installDir.string(), rc.string());
    }

    log::Registry::path()->info("Restart your shell or run `{}` to update PATH", line);
}

void PathIntegration::erasePosix() {
    if (const auto hook = env_.fishConfDir() / "bob.fish"; fs::exists(hook)) {
        fs::remove(hook);
        log::Registry::path()->info("Removed {}", hook.string());
    }

    const auto line = sourceLine();
    for (const auto& rc : env_.allRcFiles()) {
        if (!fs::exists(rc)) continue;
        const auto content = util::readFileToString(rc);
        if (!containsLine(content, line)) continue;
        util::writeFile(rc, withoutLine(content, line));
        log::Registry::path()->info("Removed bob from {}", rc.string());
    }
}

#ifdef _WIN32

namespace {

std::string normalizeEntry(std::string s) {
    boost::algorithm::replace_all(s, "/", "\\");
    boost::algorithm::trim(s);
    while (s.size() > 1 && s.back() == '\\') s.pop_back();
    return boost::algorithm::to_lower_copy(s);
}

struct RegKey {
    HKEY h = nullptr;
    RegKey() {
        if (RegOpenKeyExA(HKEY_CURRENT_USER, "Environment", 0, KEY_READ | KEY_WRITE, &h) != ERROR_SUCCESS)
            throw std::runtime_error("Failed to open HKCU\\Environment");
    }
    ~RegKey() { RegCloseKey(h); }
    RegKey(const RegKey&) = delete;
    RegKey& operator=(const RegKey&) = delete;

    std::string readPath() const {
        DWORD type = 0, size = 0;
        if (RegQueryValueExA(h, "Path", nullptr, &type, nullptr, &size) != ERROR_SUCCESS) return {};
        std::string value(size, '\0');
        if (RegQueryValueExA(h, "Path", nullptr, &type, reinterpret_cast<LPBYTE>(value.data()), &size) != ERROR_SUCCESS)
            throw std::runtime_error("Failed to read the user Path");
        while (!value.empty() && value.back() == '\0') value.pop_back();
        return value;
    }

    void writePath(const std::string& value) const {
        if (RegSetValueExA(h, "Path", 0, REG_EXPAND_SZ, reinterpret_cast<const BYTE*>(value.c_str()),
                           static_cast<DWORD>(value.size() + 1)) != ERROR_SUCCESS)
            throw std::runtime_error("Failed to write the user Path");
        SendMessageTimeoutA(HWND_BROADCAST, WM_SETTINGCHANGE, 0, reinterpret_cast<LPARAM>("Environment"),
                            SMTO_ABORTIFHUNG, 5000, nullptr);
    }
};

std::vector<std::string> splitPath(const std::string& value) {
    std::vector<std::string> parts;
    boost::algorithm::split(parts, value, [](const char c) { return c == ';'; });
    std::erase_if(parts, [](const std::string& p) { return boost::algorithm::trim_copy(p).empty(); });
    return parts;
}

}

void PathIntegration::applyRegistry(const fs::path& installDir) {
    const RegKey key;
    auto parts = splitPath(key.readPath());
    const auto wanted = normalizeEntry(installDir.string());

    for (const auto& p : parts)
        if (normalizeEntry(p) == wanted) return;

    parts.push_back(installDir.string());
    key.writePath(boost::algorithm::join(parts, ";"));
    log::Registry::path()->info("Added {} to the user Path, open a new terminal to pick it up", installDir.string());
}

void PathIntegration::eraseRegistry(const fs::path& installDir) {
    const RegKey key;
    auto parts = splitPath(key.readPath());
    const auto wanted = normalizeEntry(installDir.string());
    const auto before = parts.size();
    std::erase_if(parts, [&](const std::string& p) { return normalizeEntry(p) == wanted; });
    if (parts.size() == before) return;

    key.writePath(boost::algorithm::join(parts, ";"));
    log::Registry::path()->info("Successfully removed neovim's installation PATH from registry");
}

#endif

}
