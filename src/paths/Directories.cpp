#include "paths/Directories.hpp"
#include "log/Registry.hpp"

#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <algorithm>
#include <cstdlib>
#include <fmt/core.h>
#include <stdexcept>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif
#ifdef __APPLE__
#include <mach-o/dyld.h>
#endif

namespace fs = std::filesystem;

namespace bob::paths {

static std::optional<std::string> env(const char* name) {
    if (const char* v = std::getenv(name); v && *v) return std::string(v);
    return std::nullopt;
}

#ifdef _WIN32
static constexpr char PATH_SEPARATOR = ';';
#else
static constexpr char PATH_SEPARATOR = ':';
#endif

static fs::path normalized(const fs::path& p) {
    std::error_code ec;
    auto canonical = fs::weakly_canonical(p, ec);
    if (ec) canonical = p.lexically_normal();
    auto s = canonical.string();
    while (s.size() > 1 && (s.back() == '/' || s.back() == '\\')) s.pop_back();
    return {s};
}

fs::path homeDir() {
#ifdef _WIN32
    if (const auto profile = env("USERPROFILE")) return *profile;
    throw std::runtime_error("USERPROFILE is not set, cannot locate the home directory");
#else
#ifdef __APPLE__
    const fs::path usersRoot = "/Users";
#else
    const fs::path usersRoot = "/home";
#endif
    if (const auto sudoUser = env("SUDO_USER")) {
        const auto candidate = usersRoot / *sudoUser;
        if (fs::exists(candidate)) return candidate;
    }
    if (const auto home = env("HOME")) return *home;
    if (const auto user = env("USER")) return usersRoot / *user;
    throw std::runtime_error("Could not determine the home directory (HOME is not set)");
#endif
}

fs::path configHome() {
#ifdef _WIN32
    return homeDir() / "AppData" / "Roaming";
#elif defined(__APPLE__)
    return homeDir() / "Library" / "Application Support";
#else
    return homeDir() / ".config";
#endif
}

fs::path localDataDir() {
#ifdef _WIN32
    return homeDir() / "AppData" / "Local";
#else
    return homeDir() / ".local" / "share";
#endif
}

fs::path configFile() {
    if (const auto custom = env("BOB_CONFIG")) return *custom;

    const auto dir = configHome() / "bob";
    if (const auto toml = dir / "config.toml"; fs::exists(toml)) return toml;
    return dir / "config.json";
}

fs::path downloadsDir(const config::Config& cfg) {
    if (cfg.downloads_location) {
        const fs::path custom = *cfg.downloads_location;
        if (!fs::exists(custom)) throw std::runtime_error(fmt::format("Custom directory {} doesn't exist!", custom.string()));
        return custom;
    }

    const auto dir = localDataDir() / "bob";
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) throw std::runtime_error(fmt::format("Couldn't create downloads directory {}: {}", dir.string(), ec.message()));
    return dir;
}

fs::path downloadsLocation(const config::Config& cfg) {
    if (cfg.downloads_location) return *cfg.downloads_location;
    return localDataDir() / "bob";
}

fs::path installationDir(const config::Config& cfg) {
    if (cfg.installation_location) return *cfg.installation_location;
    return downloadsDir(cfg) / "nvim-bin";
}

fs::path usedFile(const config::Config& cfg) { return downloadsDir(cfg) / "used"; }

fs::path envDir(const config::Config& cfg) { return downloadsDir(cfg) / "env"; }

fs::path buildWorkspace(const config::Config& cfg) { return downloadsDir(cfg) / "neovim-git"; }

fs::path currentExecutable(const char* argv0) {
#if defined(_WIN32)
    std::string buf(MAX_PATH, '\0');
    const DWORD n = GetModuleFileNameA(nullptr, buf.data(), static_cast<DWORD>(buf.size()));
    if (n > 0 && n < buf.size()) return fs::path(buf.substr(0, n));
#elif defined(__APPLE__)
    uint32_t size = 0;
    _NSGetExecutablePath(nullptr, &size);
    std::string buf(size, '\0');
    if (_NSGetExecutablePath(buf.data(), &size) == 0) return fs::weakly_canonical(fs::path(buf.c_str()));
#else
    std::error_code ec;
    if (auto self = fs::read_symlink("/proc/self/exe", ec); !ec) return self;
#endif
    if (!argv0) throw std::runtime_error("Could not determine the path of the running executable");
    if (const fs::path p(argv0); p.has_parent_path()) return fs::absolute(p);
    if (const auto found = findOnPath(argv0)) return *found;
    throw std::runtime_error(fmt::format("Could not locate {} on PATH", argv0));
}

std::string editorExecutable() {
#ifdef _WIN32
    return "nvim.exe";
#else
    return "nvim";
#endif
}

static std::vector<std::string> pathEntries() {
    std::vector<std::string> entries;
    const auto path = env("PATH");
    if (!path) return entries;
    boost::algorithm::split(entries, *path, [](const char c) { return c == PATH_SEPARATOR; });
    std::erase_if(entries, [](const std::string& e) { return e.empty(); });
    return entries;
}

static bool isExecutableFile(const fs::path& p) {
    std::error_code ec;
    if (!fs::is_regular_file(p, ec)) return false;
#ifdef _WIN32
    return true;
#else
    return ::access(p.c_str(), X_OK) == 0;
#endif
}

std::optional<fs::path> findOnPath(const std::string& name, const std::vector<fs::path>& excluded) {
    std::vector<fs::path> skip;
    skip.reserve(excluded.size());
    for (const auto& e : excluded) skip.push_back(normalized(e));

    for (const auto& entry : pathEntries()) {
        const auto dir = normalized(entry);
        if (std::ranges::find(skip, dir) != skip.end()) continue;
        if (const auto candidate = dir / name; isExecutableFile(candidate)) return candidate;
    }
    return std::nullopt;
}

bool isOnPath(const fs::path& dir) {
    const auto target = normalized(dir);
    return std::ranges::any_of(pathEntries(), [&](const std::string& e) { return normalized(e) == target; });
}

}
