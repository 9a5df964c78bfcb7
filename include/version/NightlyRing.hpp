#pragma once

#include "types/UpstreamRelease.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <vector>

namespace bob::version {

struct RollbackEntry {
    std::filesystem::path path;
    types::UpstreamRelease release;

    [[nodiscard]] std::string name() const { return path.filename().string(); }
};

// Bounded history of previous nightly installs, stored as nightly-<7hex> directories
// beside nightly/ in the downloads root.
class NightlyRing {
public:
    explicit NightlyRing(std::filesystem::path downloadsRoot);

    // Snapshots sorted by published_at, newest first.
    [[nodiscard]] std::vector<RollbackEntry> list() const;

    // Copies nightly/ to nightly-<7hex>/ after evicting the oldest entries so the ring
    // never exceeds `limit`. A limit of zero disables snapshots.
    std::optional<std::filesystem::path> snapshot(uint8_t limit) const;

    static types::UpstreamRelease readRelease(const std::filesystem::path& installDir);
    static void writeRelease(const std::filesystem::path& installDir, const types::UpstreamRelease& release);

private:
    std::filesystem::path root_;
};

}
