#pragma once

#include <cstddef>
#include <filesystem>

namespace bob::archive {

// Extracts a gzip-compressed ustar/GNU/pax tarball into destination, dropping the first
// `stripComponents` path components of every entry. Regular files, directories,
// symlinks and hardlinks are supported; entries escaping destination are rejected.
// Returns the number of entries written.
size_t extractTarGz(const std::filesystem::path& archive,
                    const std::filesystem::path& destination,
                    unsigned int stripComponents = 0);

}
