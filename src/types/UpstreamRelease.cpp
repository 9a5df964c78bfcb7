#include "types/UpstreamRelease.hpp"
#include "util/timestamp.hpp"

using namespace bob::types;

std::time_t UpstreamRelease::publishedAt() const {
    return util::parseTimestampFromString(published_at);
}

std::string UpstreamRelease::shortCommit() const {
    if (!target_commitish || target_commitish->empty())
        throw std::runtime_error("Release " + tag_name + " has no target_commitish");
    return target_commitish->substr(0, 7);
}

UpstreamRelease UpstreamRelease::fromJson(const nlohmann::json& j) {
    UpstreamRelease r;
    r.tag_name = j.at("tag_name").get<std::string>();
    if (j.contains("target_commitish") && j.at("target_commitish").is_string())
        r.target_commitish = j.at("target_commitish").get<std::string>();
    r.published_at = j.at("published_at").get<std::string>();
    r.raw = j;
    return r;
}

void bob::types::from_json(const nlohmann::json& j, RepoCommit& c) {
    c.sha = j.value("sha", "");
    const auto& commit = j.at("commit");
    c.message = commit.value("message", "");
    if (commit.contains("author") && commit.at("author").is_object())
        c.author = commit.at("author").value("name", "");
}
