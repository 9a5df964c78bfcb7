#pragma once

#include <ctime>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace bob::types {

struct UpstreamRelease {
    std::string tag_name;
    std::optional<std::string> target_commitish;
    std::string published_at;

    // The release object exactly as the registry returned it; written to bob.json.
    nlohmann::json raw;

    [[nodiscard]] std::time_t publishedAt() const;
    [[nodiscard]] std::string shortCommit() const;

    static UpstreamRelease fromJson(const nlohmann::json& j);
};

struct RepoCommit {
    std::string sha;
    std::string author;
    std::string message;
};

void from_json(const nlohmann::json& j, RepoCommit& c);

}
