#pragma once

#include <filesystem>
#include <string>

namespace bob::util {

// Lowercase hex SHA-256 of a file, streamed in chunks.
std::string sha256File(const std::filesystem::path& path);

std::string sha256Hex(const std::string& data);

}
