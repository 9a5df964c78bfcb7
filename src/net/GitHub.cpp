#include "net/GitHub.hpp"
#include "types/errors.hpp"
#include "util/timestamp.hpp"
#include "log/Registry.hpp"

#include <cstdlib>
#include <fmt/core.h>

namespace bob::net {

GitHub::GitHub(std::shared_ptr<HttpClient> http) : http_(std::move(http)) {
    if (!http_) throw std::invalid_argument("GitHub requires an HttpClient");
}

Headers GitHub::apiHeaders() {
    Headers headers{
        {"User-Agent", "bob"},
        {"Accept", "application/vnd.github.v3+json"},
    };
    if (const char* token = std::getenv("GITHUB_TOKEN"); token && *token)
        headers.emplace_back("Authorization", fmt::format("Bearer {}", token));
    return headers;
}

nlohmann::json GitHub::deserialize(const HttpResponse& response) {
    nlohmann::json value;
    try {
        value = nlohmann::json::parse(response.body);
    } catch (const nlohmann::json::parse_error& e) {
        throw NetworkError(fmt::format("Unexpected response from upstream (HTTP {}): {}", response.status, e.what()),
                           response.status);
    }

    if (value.is_object() && value.contains("message")) {
        const auto docs = value.value("documentation_url", "");
        if (docs.find("rate-limiting") != std::string::npos) throw NetworkError(RATE_LIMIT_MESSAGE, response.status);
        throw NetworkError(value.at("message").get<std::string>(), response.status);
    }

    if (!response.ok())
        throw NetworkError(fmt::format("Upstream request failed with HTTP {}", response.status), response.status);

    return value;
}

nlohmann::json GitHub::request(const std::string& url) const {
    log::Registry::net()->debug("[GitHub] {}", url);
    return deserialize(http_->get(url, apiHeaders()));
}

types::UpstreamRelease GitHub::nightly() const {
    return types::UpstreamRelease::fromJson(request(fmt::format("{}/releases/tags/nightly", API_ROOT)));
}

types::UpstreamRelease GitHub::stable() const {
    const auto releases = request(fmt::format("{}/releases?per_page=2", API_ROOT));
    if (!releases.is_array() || releases.size() < 2)
        throw NetworkError("Upstream returned fewer than two releases, cannot determine stable");
    return types::UpstreamRelease::fromJson(releases.at(1));
}

std::string GitHub::latestCommit() const {
    return request(fmt::format("{}/commits/master", API_ROOT)).at("sha").get<std::string>();
}

std::vector<types::RepoCommit> GitHub::commitsBetween(const std::time_t since, const std::time_t until) const {
    const auto json = request(fmt::format("{}/commits?since={}&until={}&per_page=100", API_ROOT,
                                          util::timestampToString(since), util::timestampToString(until)));
    return json.get<std::vector<types::RepoCommit>>();
}

std::vector<std::string> GitHub::tags() const {
    const auto json = request(fmt::format("{}/tags?per_page=50", API_ROOT));
    std::vector<std::string> out;
    for (const auto& tag : json) out.push_back(tag.at("name").get<std::string>());
    return out;
}

}
