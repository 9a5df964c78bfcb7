#pragma once

#include "types/Version.hpp"

#include <optional>
#include <string>

namespace bob::net { class GitHub; }

namespace bob::version {

class Resolver {
public:
    explicit Resolver(const net::GitHub& github) : github_(github) {}

    // Turns user input into a ResolvedVersion. `stable`, `latest` and `head` query upstream.
    [[nodiscard]] types::ResolvedVersion resolve(const std::string& input) const;

    // The rules that need no network: nightly, semver, hashes and rollback names.
    static std::optional<types::ResolvedVersion> classify(const std::string& input);

    static bool isHash(const std::string& input);
    static bool isRollbackName(const std::string& input);

private:
    const net::GitHub& github_;
};

}
