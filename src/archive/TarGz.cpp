#include "archive/TarGz.hpp"
#include "log/Registry.hpp"

#include <zlib.h>
#include <fmt/core.h>
#include <algorithm>
#include <array>
#include <cstring>
#include <fstream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace bob::archive {

namespace {

constexpr size_t TAR_BLOCK_SIZE = 512;
constexpr size_t TAR_NAME_SIZE = 100;
constexpr size_t TAR_PREFIX_SIZE = 155;

constexpr char TAR_REGTYPE = '0';
constexpr char TAR_AREGTYPE = '\0';
constexpr char TAR_LNKTYPE = '1';
constexpr char TAR_SYMTYPE = '2';
constexpr char TAR_DIRTYPE = '5';
constexpr char TAR_CONTTYPE = '7';
constexpr char GNU_LONGNAME = 'L';
constexpr char GNU_LONGLINK = 'K';
constexpr char PAX_HEADER = 'x';
constexpr char PAX_GLOBAL = 'g';

#pragma pack(push, 1)
struct TarHeader {
    char name[TAR_NAME_SIZE];       // 0
    char mode[8];                   // 100
    char uid[8];                    // 108
    char gid[8];                    // 116
    char size[12];                  // 124
    char mtime[12];                 // 136
    char chksum[8];                 // 148
    char typeflag;                  // 156
    char linkname[TAR_NAME_SIZE];   // 157
    char magic[6];                  // 257
    char version[2];                // 263
    char uname[32];                 // 265
    char gname[32];                 // 297
    char devmajor[8];               // 329
    char devminor[8];               // 337
    char prefix[TAR_PREFIX_SIZE];   // 345
    char padding[12];               // 500
};
#pragma pack(pop)

static_assert(sizeof(TarHeader) == TAR_BLOCK_SIZE, "TarHeader must be 512 bytes");

struct GzCloser {
    void operator()(gzFile f) const { gzclose(f); }
};
using GzHandle = std::unique_ptr<std::remove_pointer_t<gzFile>, GzCloser>;

std::string field(const char* data, const size_t size) {
    return {data, strnlen(data, size)};
}

uint64_t parseOctal(const char* data, const size_t size) {
    // GNU base-256 encoding for large values
    if (static_cast<unsigned char>(data[0]) & 0x80) {
        uint64_t value = static_cast<unsigned char>(data[0]) & 0x7f;
        for (size_t i = 1; i < size; ++i) value = (value << 8) | static_cast<unsigned char>(data[i]);
        return value;
    }

    uint64_t value = 0;
    size_t i = 0;
    while (i < size && (data[i] == ' ' || data[i] == '\0')) ++i;
    for (; i < size && data[i] >= '0' && data[i] <= '7'; ++i) value = value * 8 + static_cast<uint64_t>(data[i] - '0');
    return value;
}

class GzReader {
public:
    explicit GzReader(const fs::path& path) : gz_(gzopen(path.string().c_str(), "rb")) {
        if (!gz_) throw std::runtime_error("Failed to open archive: " + path.string());
        gzbuffer(gz_.get(), 128 * 1024);
    }

    // Reads exactly n bytes; false on clean EOF before any byte.
    bool read(void* out, const size_t n) {
        auto* dst = static_cast<char*>(out);
        size_t done = 0;
        while (done < n) {
            const int got = gzread(gz_.get(), dst + done, static_cast<unsigned>(n - done));
            if (got < 0) {
                int err = 0;
                const char* msg = gzerror(gz_.get(), &err);
                throw std::runtime_error(fmt::format("Failed to decompress archive: {}", msg ? msg : "unknown error"));
            }
            if (got == 0) {
                if (done == 0) return false;
                throw std::runtime_error("Truncated archive");
            }
            done += static_cast<size_t>(got);
        }
        return true;
    }

    std::string readPayload(const uint64_t size) {
        std::string out(size, '\0');
        if (size && !read(out.data(), size)) throw std::runtime_error("Truncated archive");
        skipPadding(size);
        return out;
    }

    void skip(const uint64_t size) {
        std::array<char, 64 * 1024> buf{};
        uint64_t left = size;
        while (left > 0) {
            const auto n = static_cast<size_t>(std::min<uint64_t>(left, buf.size()));
            if (!read(buf.data(), n)) throw std::runtime_error("Truncated archive");
            left -= n;
        }
        skipPadding(size);
    }

    void copyTo(std::ofstream& out, const uint64_t size) {
        std::array<char, 64 * 1024> buf{};
        uint64_t left = size;
        while (left > 0) {
            const auto n = static_cast<size_t>(std::min<uint64_t>(left, buf.size()));
            if (!read(buf.data(), n)) throw std::runtime_error("Truncated archive");
            out.write(buf.data(), static_cast<std::streamsize>(n));
            left -= n;
        }
        skipPadding(size);
    }

private:
    GzHandle gz_;

    void skipPadding(const uint64_t size) {
        const auto rem = size % TAR_BLOCK_SIZE;
        if (rem == 0) return;
        std::array<char, TAR_BLOCK_SIZE> pad{};
        if (!read(pad.data(), TAR_BLOCK_SIZE - rem)) throw std::runtime_error("Truncated archive");
    }
};

// Parses "<len> key=value\n" records.
void applyPax(const std::string& data, std::optional<std::string>& path, std::optional<std::string>& linkpath) {
    size_t pos = 0;
    while (pos < data.size()) {
        const auto space = data.find(' ', pos);
        if (space == std::string::npos) break;
        const auto len = std::stoul(data.substr(pos, space - pos));
        if (len == 0 || pos + len > data.size()) break;

        const auto record = data.substr(space + 1, pos + len - space - 2); // drop trailing '\n'
        if (const auto eq = record.find('='); eq != std::string::npos) {
            const auto key = record.substr(0, eq);
            if (key == "path") path = record.substr(eq + 1);
            else if (key == "linkpath") linkpath = record.substr(eq + 1);
        }
        pos += len;
    }
}

std::optional<fs::path> strip(const std::string& entry, const unsigned int components) {
    fs::path out;
    unsigned int skipped = 0;
    for (const auto& part : fs::path(entry)) {
        const auto s = part.string();
        if (s.empty() || s == "." || s == "/") continue;
        if (skipped < components) { ++skipped; continue; }
        out /= part;
    }
    if (out.empty()) return std::nullopt;
    return out;
}

fs::path safeJoin(const fs::path& root, const fs::path& rel) {
    const auto normalized = rel.lexically_normal();
    if (normalized.is_absolute() || normalized.has_root_path())
        throw std::runtime_error("Archive entry has an absolute path: " + rel.string());
    for (const auto& part : normalized)
        if (part == "..") throw std::runtime_error("Archive entry escapes the destination: " + rel.string());
    return root / normalized;
}

bool isWithin(const fs::path& root, const fs::path& path) {
    const auto [rootEnd, pathEnd] = std::mismatch(root.begin(), root.end(), path.begin(), path.end());
    return rootEnd == root.end();
}

// Symlinks already extracted must not carry later entries outside root.
void requireInside(const fs::path& canonicalRoot, const fs::path& target, const std::string& name) {
    if (!isWithin(canonicalRoot, fs::weakly_canonical(target.parent_path())))
        throw std::runtime_error("Archive entry escapes the destination through a symlink: " + name);
}

// A symlink target must stay inside the destination once resolved against the link's directory.
void requireSafeLink(const fs::path& rel, const std::string& linkTarget, const std::string& name) {
    const fs::path link(linkTarget);
    if (link.empty() || link.is_absolute() || link.has_root_path())
        throw std::runtime_error("Archive symlink has an absolute target: " + name + " -> " + linkTarget);

    const auto resolved = (rel.parent_path() / link).lexically_normal();
    if (!resolved.empty() && *resolved.begin() == "..")
        throw std::runtime_error("Archive symlink points outside the destination: " + name + " -> " + linkTarget);
}

}

size_t extractTarGz(const fs::path& archive, const fs::path& destination, const unsigned int stripComponents) {
    GzReader reader(archive);
    fs::create_directories(destination);
    const auto root = fs::canonical(destination);

    std::optional<std::string> longName, longLink;
    size_t written = 0;
    std::array<char, TAR_BLOCK_SIZE> block{};

    while (reader.read(block.data(), TAR_BLOCK_SIZE)) {
        if (std::all_of(block.begin(), block.end(), [](const char c) { return c == 0; })) break;

        TarHeader header;
        std::memcpy(&header, block.data(), TAR_BLOCK_SIZE);

        const auto size = parseOctal(header.size, sizeof(header.size));
        const auto mode = parseOctal(header.mode, sizeof(header.mode));
        const char type = header.typeflag;

        if (type == GNU_LONGNAME) { longName = field(reader.readPayload(size).c_str(), size); continue; }
        if (type == GNU_LONGLINK) { longLink = field(reader.readPayload(size).c_str(), size); continue; }
        if (type == PAX_HEADER) { applyPax(reader.readPayload(size), longName, longLink); continue; }
        if (type == PAX_GLOBAL) { reader.skip(size); continue; }

        std::string name;
        if (longName) name = *longName;
        else {
            if (header.prefix[0] != '\0' && std::memcmp(header.magic, "ustar", 5) == 0)
                name = field(header.prefix, TAR_PREFIX_SIZE) + "/";
            name += field(header.name, TAR_NAME_SIZE);
        }
        const std::string linkTarget = longLink ? *longLink : field(header.linkname, TAR_NAME_SIZE);
        longName.reset();
        longLink.reset();

        const auto rel = strip(name, stripComponents);
        if (!rel) {
            if (type != TAR_DIRTYPE) reader.skip(size);
            continue;
        }
        const auto target = safeJoin(destination, *rel);
        requireInside(root, target, name);

        switch (type) {
            case TAR_DIRTYPE:
                fs::create_directories(target);
                break;
            case TAR_REGTYPE:
            case TAR_AREGTYPE:
            case TAR_CONTTYPE: {
                fs::create_directories(target.parent_path());
                std::error_code ec;
                fs::remove(target, ec);
                std::ofstream out(target, std::ios::binary | std::ios::trunc);
                if (!out) throw std::runtime_error("Failed to create " + target.string());
                reader.copyTo(out, size);
                out.close();
                if (!out) throw std::runtime_error("Failed to write " + target.string());
                fs::permissions(target, static_cast<fs::perms>(mode & 07777), fs::perm_options::replace);
                break;
            }
            case TAR_SYMTYPE: {
                requireSafeLink(*rel, linkTarget, name);
                fs::create_directories(target.parent_path());
                std::error_code ec;
                fs::remove(target, ec);
                fs::create_symlink(linkTarget, target);
                reader.skip(size);
                break;
            }
            case TAR_LNKTYPE: {
                const auto linkRel = strip(linkTarget, stripComponents);
                if (!linkRel) throw std::runtime_error("Hardlink with empty target: " + name);
                fs::create_directories(target.parent_path());
                const auto source = safeJoin(destination, *linkRel);
                requireInside(root, source, linkTarget);
                fs::copy_file(source, target, fs::copy_options::overwrite_existing);
                reader.skip(size);
                break;
            }
            default:
                log::Registry::install()->debug("[TarGz] Skipping {} (type '{}')", name, type);
                reader.skip(size);
                continue;
        }
        ++written;
    }

    log::Registry::install()->debug("[TarGz] Extracted {} entries from {}", written, archive.filename().string());
    return written;
}

}
