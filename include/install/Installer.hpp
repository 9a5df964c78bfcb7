#pragma once

#include "types/InstallResult.hpp"
#include "types/UpstreamRelease.hpp"
#include "types/Version.hpp"

#include <filesystem>
#include <string>

namespace bob::runtime { struct Context; }

namespace bob::install {

// Download + verify + extract, or build from source, for one resolved version.
class Installer {
public:
    explicit Installer(runtime::Context& ctx) : ctx_(ctx) {}

    types::InstallResult install(const types::ResolvedVersion& version);

private:
    runtime::Context& ctx_;

    void acquire(const types::ResolvedVersion& version, const std::filesystem::path& root);
    void downloadRelease(const types::ResolvedVersion& version, const std::filesystem::path& root);
    bool tryAppImage(const types::ResolvedVersion& version, const std::filesystem::path& root);
    void verifyChecksum(const types::ResolvedVersion& version, const std::filesystem::path& root,
                        const std::filesystem::path& archive, const std::string& assetName);
    void snapshotActiveNightly(const std::filesystem::path& root);
    void printCommits(const types::UpstreamRelease& local, const types::UpstreamRelease& upstream);
};

}
