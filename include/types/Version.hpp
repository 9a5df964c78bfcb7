#pragma once

#include <compare>
#include <optional>
#include <string>

namespace bob::types {

struct Semver {
    unsigned int major = 0;
    unsigned int minor = 0;
    unsigned int patch = 0;

    auto operator<=>(const Semver&) const = default;

    // Accepts "1", "1.2", "1.2.3" with an optional leading 'v'. Missing parts are zero.
    static std::optional<Semver> parse(const std::string& str);

    [[nodiscard]] std::string toString() const;
};

enum class VersionKind {
    Tagged,
    Stable,
    Nightly,
    Hash,
    NightlyRollback
};

std::string to_string(VersionKind kind);

struct ResolvedVersion {
    std::string tag;
    VersionKind kind = VersionKind::Tagged;
    std::string raw;
    std::optional<Semver> semver;

    // Name of the LocalInstall directory under the downloads root. Hash builds are
    // installed under the first seven characters of the hash.
    [[nodiscard]] std::string installDirName() const;
};

}
