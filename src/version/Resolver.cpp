#include "version/Resolver.hpp"
#include "net/GitHub.hpp"
#include "types/errors.hpp"
#include "log/Registry.hpp"

#include <regex>

using namespace bob::types;

namespace bob::version {

static constexpr auto INVALID_VERSION_MESSAGE =
    "Please provide a proper version string. Valid options are:\n"
    "  * stable|latest|nightly - Latest stable, most recent, or nightly build\n"
    "  * [v]x.x.x              - Specific version (e.g., 0.6.0 or v0.6.0)\n"
    "  * <commit-hash>         - Specific commit hash";

bool Resolver::isHash(const std::string& input) {
    static const std::regex re("^[0-9a-f]{5,40}$");
    return std::regex_match(input, re);
}

bool Resolver::isRollbackName(const std::string& input) {
    static const std::regex re("^nightly-[0-9a-f]{7}$");
    return std::regex_match(input, re);
}

std::optional<ResolvedVersion> Resolver::classify(const std::string& input) {
    static const std::regex semverPrefix(R"(^v?[0-9]+(\.[0-9]+){0,2})");

    if (input == "nightly") return ResolvedVersion{"nightly", VersionKind::Nightly, input, std::nullopt};

    if (std::regex_search(input, semverPrefix)) {
        if (const auto semver = Semver::parse(input)) {
            const auto tag = input.front() == 'v' ? input : "v" + input;
            return ResolvedVersion{tag, VersionKind::Tagged, input, semver};
        }
    }

    if (isHash(input)) return ResolvedVersion{input, VersionKind::Hash, input, std::nullopt};

    if (isRollbackName(input)) return ResolvedVersion{input, VersionKind::NightlyRollback, input, std::nullopt};

    return std::nullopt;
}

ResolvedVersion Resolver::resolve(const std::string& input) const {
    if (input == "stable" || input == "latest") {
        log::Registry::bob()->info("Fetching latest version");
        const auto release = github_.stable();
        const auto semver = Semver::parse(release.tag_name);
        if (!semver) throw VersionError("Upstream stable tag is not a version: " + release.tag_name);
        return {release.tag_name, VersionKind::Stable, input, semver};
    }

    if (input == "head" || input == "HEAD" || input == "git") {
        log::Registry::bob()->info("Fetching latest commit");
        const auto sha = github_.latestCommit();
        return {sha, VersionKind::Hash, sha, std::nullopt};
    }

    if (auto resolved = classify(input)) {
        log::Registry::bob()->debug("[Resolver] '{}' -> {} ({})", input, resolved->tag, to_string(resolved->kind));
        return *resolved;
    }

    throw VersionError(INVALID_VERSION_MESSAGE);
}

}
