#include "util/files.hpp"

#include <fstream>
#include <random>
#include <array>
#include <cmath>
#include <fmt/format.h>
#include <stdexcept>

namespace fs = std::filesystem;

std::string bob::util::readFileToString(const fs::path& path) {
    std::ifstream in(path, std::ios::binary | std::ios::ate);
    if (!in) throw std::runtime_error("Failed to open file: " + path.string());

    const std::streamsize size = in.tellg();
    in.seekg(0, std::ios::beg);

    std::string buffer(size, '\0');
    if (!in.read(buffer.data(), size))
        throw std::runtime_error("Failed to read file: " + path.string());

    return buffer;
}

void bob::util::writeFile(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("Failed to open file for writing: " + path.string());
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.close();
    if (!out) throw std::runtime_error("Failed to write file: " + path.string());
}

void bob::util::writeFileAtomic(const fs::path& path, const std::string& content) {
    auto tmp = path;
    tmp += ".tmp";
    writeFile(tmp, content);

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        fs::remove(tmp);
        throw std::runtime_error(fmt::format("Failed to replace {}: {}", path.string(), ec.message()));
    }
}

void bob::util::copyDirectory(const fs::path& src, const fs::path& dst) {
    if (fs::exists(dst)) throw std::runtime_error("Copy destination already exists: " + dst.string());

    fs::create_directories(dst);
    fs::permissions(dst, fs::status(src).permissions());

    for (const auto& entry : fs::directory_iterator(src)) {
        const auto target = dst / entry.path().filename();

        if (entry.is_symlink()) fs::copy_symlink(entry.path(), target);
        else if (entry.is_directory()) copyDirectory(entry.path(), target);
        else fs::copy_file(entry.path(), target, fs::copy_options::overwrite_existing);
    }
}

bool bob::util::removeIfExists(const fs::path& path) {
    if (!fs::exists(fs::symlink_status(path))) return false;
    fs::remove_all(path);
    return true;
}

std::string bob::util::generate_random_suffix(const size_t length) {
    static constexpr char charset[] =
        "0123456789"
        "ABCDEFGHIJKLMNOPQRSTUVWXYZ"
        "abcdefghijklmnopqrstuvwxyz";
    thread_local std::mt19937 rng{std::random_device{}()};
    thread_local std::uniform_int_distribution<> dist(0, sizeof(charset) - 2);

    std::string result;
    result.reserve(length);
    for (size_t i = 0; i < length; ++i) result += charset[dist(rng)];
    return result;
}

std::string bob::util::bytesToSize(uintmax_t bytes) {
    static constexpr std::array<const char*, 5> suffix = {"B", "KB", "MB", "GB", "TB"};

    if (bytes < 1024) return std::to_string(bytes) + "B";

    auto value = static_cast<double>(bytes);
    std::size_t unit = 0;

    while (value >= 1024.0 && unit + 1 < suffix.size()) {
        value /= 1024.0;
        ++unit;
    }

    if (value >= 100.0 || std::fabs(value - std::round(value)) < 0.05)
        return fmt::format("{:.0f}{}", value, suffix[unit]);
    return fmt::format("{:.1f}{}", value, suffix[unit]);
}
