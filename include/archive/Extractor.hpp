#pragma once

#include "types/Version.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace bob::process { class Runner; }
namespace bob::concurrency { class ThreadPool; }

namespace bob::archive {

// Unpacks downloaded release assets into <root>/<tag>/ so that <root>/<tag>/bin/<editor>
// exists afterwards, then removes the asset.
class Extractor {
public:
    Extractor(process::Runner& runner, concurrency::ThreadPool& pool) : runner_(runner), pool_(pool) {}

    std::filesystem::path extract(const std::filesystem::path& archive,
                                  const std::filesystem::path& root,
                                  const std::string& tag) const;

    // Runs `<appimage> --appimage-extract` in root and arranges squashfs-root into <root>/<tag>.
    std::filesystem::path extractAppImage(const std::filesystem::path& appImage,
                                          const std::filesystem::path& root,
                                          const std::string& tag,
                                          const std::optional<types::Semver>& semver) const;

    // Hoists a nested <sub>/bin/<editor> up to installDir when installDir/bin/<editor> is missing.
    static void normalizeLayout(const std::filesystem::path& installDir);

private:
    process::Runner& runner_;
    concurrency::ThreadPool& pool_;

    static void finalize(const std::filesystem::path& installDir, const std::filesystem::path& asset);
};

}
