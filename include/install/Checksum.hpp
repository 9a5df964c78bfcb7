#pragma once

#include "types/Version.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace bob::install {

// Releases after 0.4.4 and nightly publish checksums.
bool hasChecksum(const types::ResolvedVersion& v);

// shasum.txt for nightly and 0.10.4+, <archive>.sha256sum before that.
std::string checksumAssetName(const types::ResolvedVersion& v, const std::string& archiveName);

// First token of the first line mentioning filename.
std::optional<std::string> expectedHash(const std::string& checksumContent, const std::string& filename);

// Compares the archive's SHA-256 against the entry for filename. A checksum file
// without such an entry counts as a mismatch.
bool matches(const std::filesystem::path& archive, const std::filesystem::path& checksumFile,
             const std::string& filename);

}
