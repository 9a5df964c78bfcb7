#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace bob::util {

std::string readFileToString(const std::filesystem::path& path);

void writeFile(const std::filesystem::path& path, const std::string& content);

// Writes to <path>.tmp and renames over path, so readers never see a partial file.
void writeFileAtomic(const std::filesystem::path& path, const std::string& content);

// Recursive copy that preserves symlinks and permissions. dst must not exist.
void copyDirectory(const std::filesystem::path& src, const std::filesystem::path& dst);

// Removes path if present. Returns false when nothing was there.
bool removeIfExists(const std::filesystem::path& path);

std::string generate_random_suffix(size_t length = 8);

std::string bytesToSize(uintmax_t bytes);

}
