#pragma once

#include "types/Version.hpp"

#include <filesystem>
#include <string>

namespace bob::runtime { struct Context; }

namespace bob::switcher {

// Makes an installed version the active one: `used`, the shim, the sync file and PATH.
class Switcher {
public:
    explicit Switcher(runtime::Context& ctx) : ctx_(ctx) {}

    // Returns the payload written to `used`.
    std::string switchTo(const types::ResolvedVersion& version);

    // Installs or refreshes the shim when it is missing or reports another tool version.
    // Returns true when the shim was (re)written.
    bool ensureShim();

    [[nodiscard]] std::filesystem::path shimPath() const;

private:
    runtime::Context& ctx_;

    void updateSyncFile(const std::string& value) const;
    void replaceShim(const std::filesystem::path& shim) const;
};

}
