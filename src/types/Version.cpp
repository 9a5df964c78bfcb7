#include "types/Version.hpp"

#include <charconv>
#include <fmt/format.h>

using namespace bob::types;

std::optional<Semver> Semver::parse(const std::string& str) {
    std::string_view s = str;
    if (!s.empty() && s.front() == 'v') s.remove_prefix(1);
    if (s.empty()) return std::nullopt;

    unsigned int parts[3] = {0, 0, 0};
    size_t idx = 0;

    while (true) {
        if (idx >= 3) return std::nullopt;
        unsigned int value = 0;
        const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
        if (ec != std::errc() || ptr == s.data()) return std::nullopt;
        parts[idx++] = value;
        s.remove_prefix(static_cast<size_t>(ptr - s.data()));
        if (s.empty()) break;
        if (s.front() != '.') return std::nullopt;
        s.remove_prefix(1);
        if (s.empty()) return std::nullopt;
    }

    return Semver{parts[0], parts[1], parts[2]};
}

std::string Semver::toString() const {
    return fmt::format("{}.{}.{}", major, minor, patch);
}

std::string bob::types::to_string(const VersionKind kind) {
    switch (kind) {
        case VersionKind::Tagged: return "tagged";
        case VersionKind::Stable: return "stable";
        case VersionKind::Nightly: return "nightly";
        case VersionKind::Hash: return "hash";
        case VersionKind::NightlyRollback: return "nightly-rollback";
    }
    return "unknown";
}

std::string ResolvedVersion::installDirName() const {
    switch (kind) {
        case VersionKind::Hash: return raw.substr(0, 7);
        case VersionKind::Tagged:
        case VersionKind::Stable:
        case VersionKind::Nightly:
        case VersionKind::NightlyRollback:
            return tag;
    }
    return tag;
}
