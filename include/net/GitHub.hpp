#pragma once

#include "net/HttpClient.hpp"
#include "types/UpstreamRelease.hpp"

#include <ctime>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace bob::net {

// Thin wrapper over the upstream REST API (v3) for the neovim/neovim repository.
class GitHub {
public:
    static constexpr auto API_ROOT = "https://api.github.com/repos/neovim/neovim";
    static constexpr auto RATE_LIMIT_MESSAGE =
        "Github API rate limit has been reach, either wait an hour or checkout "
        "https://github.com/MordechaiHadad/bob#increasing-github-rate-limit";

    explicit GitHub(std::shared_ptr<HttpClient> http);

    types::UpstreamRelease nightly() const;

    // Second entry of the two most recent releases; index 0 may be a nightly still being published.
    types::UpstreamRelease stable() const;

    std::string latestCommit() const;

    std::vector<types::RepoCommit> commitsBetween(std::time_t since, std::time_t until) const;

    std::vector<std::string> tags() const;

    // Request headers for API calls: user agent, API version and optional $GITHUB_TOKEN.
    static Headers apiHeaders();

    // Parses a response body, turning upstream error objects into NetworkError.
    static nlohmann::json deserialize(const HttpResponse& response);

private:
    std::shared_ptr<HttpClient> http_;

    nlohmann::json request(const std::string& url) const;
};

}
