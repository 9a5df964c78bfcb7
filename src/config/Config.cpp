#include "config/Config.hpp"
#include "config/config_yaml.hpp"
#include "config/toml.hpp"
#include "config/util.hpp"
#include "log/Registry.hpp"
#include "util/files.hpp"

#include <yaml-cpp/yaml.h>
#include <nlohmann/json.hpp>
#include <boost/algorithm/string/case_conv.hpp>
#include <fmt/core.h>
#include <stdexcept>

namespace fs = std::filesystem;

namespace bob::config {

template <typename T>
static void readOpt(const nlohmann::json& j, const char* key, std::optional<T>& out) {
    if (j.contains(key) && !j.at(key).is_null()) out = j.at(key).get<T>();
}

template <typename T>
static void writeOpt(nlohmann::json& j, const char* key, const std::optional<T>& value) {
    if (value) j[key] = *value;
}

static void expandStrings(Config& cfg) {
    const auto warnMissing = [](const std::string& name) {
        log::Registry::bob()->warn("Environment variable ${} is not set, expanding to an empty string", name);
    };

    for (auto* field : {&cfg.downloads_location, &cfg.installation_location,
                        &cfg.version_sync_file_location, &cfg.log_file_location,
                        &cfg.github_mirror, &cfg.log_level})
        if (*field) *field = expandEnvironmentVariables(**field, processEnv, warnMissing);
}

Format formatFor(const fs::path& path) {
    const auto ext = boost::algorithm::to_lower_copy(path.extension().string());
    if (ext == ".toml") return Format::Toml;
    if (ext == ".yaml" || ext == ".yml") return Format::Yaml;
    return Format::Json;
}

Config parseConfig(const std::string& content, const Format format) {
    Config cfg;

    switch (format) {
        case Format::Json: {
            if (content.find_first_not_of(" \t\r\n") == std::string::npos) break;
            nlohmann::json::parse(content).get_to(cfg);
            break;
        }
        case Format::Toml:
            toml::parse(content).get_to(cfg);
            break;
        case Format::Yaml: {
            const YAML::Node root = YAML::Load(content);
            if (root.IsNull()) break;
            if (!YAML::convert<Config>::decode(root, cfg))
                throw std::runtime_error("YAML config must be a mapping");
            break;
        }
    }

    expandStrings(cfg);
    return cfg;
}

Config loadConfig(const fs::path& path) {
    if (!fs::exists(path)) {
        log::Registry::bob()->debug("[Config] No config file at {}, using defaults", path.string());
        return {};
    }

    try {
        return parseConfig(util::readFileToString(path), formatFor(path));
    } catch (const std::exception& e) {
        throw std::runtime_error(fmt::format("Failed to parse config file {}: {}", path.string(), e.what()));
    }
}

void persistFlag(const fs::path& path, const std::string& key, const bool value) {
    const std::string existing = fs::exists(path) ? util::readFileToString(path) : std::string{};
    std::string updated;

    switch (formatFor(path)) {
        case Format::Json: {
            nlohmann::json j = existing.find_first_not_of(" \t\r\n") == std::string::npos
                                   ? nlohmann::json::object()
                                   : nlohmann::json::parse(existing);
            j[key] = value;
            updated = j.dump(2) + "\n";
            break;
        }
        case Format::Toml:
            updated = toml::setBool(existing, key, value);
            break;
        case Format::Yaml: {
            YAML::Node root = existing.empty() ? YAML::Node(YAML::NodeType::Map) : YAML::Load(existing);
            root[key] = value;
            YAML::Emitter out;
            out << root;
            updated = std::string(out.c_str()) + "\n";
            break;
        }
    }

    if (path.has_parent_path()) fs::create_directories(path.parent_path());
    util::writeFileAtomic(path, updated);
    log::Registry::bob()->debug("[Config] Persisted {} = {} to {}", key, value, path.string());
}

void to_json(nlohmann::json& j, const Config& c) {
    j = nlohmann::json::object();
    writeOpt(j, "enable_nightly_info", c.enable_nightly_info);
    writeOpt(j, "enable_release_build", c.enable_release_build);
    writeOpt(j, "downloads_location", c.downloads_location);
    writeOpt(j, "installation_location", c.installation_location);
    writeOpt(j, "version_sync_file_location", c.version_sync_file_location);
    writeOpt(j, "github_mirror", c.github_mirror);
    if (c.rollback_limit) j["rollback_limit"] = static_cast<unsigned int>(*c.rollback_limit);
    writeOpt(j, "add_neovim_binary_to_path", c.add_neovim_binary_to_path);
    writeOpt(j, "ignore_running_instances", c.ignore_running_instances);
    writeOpt(j, "log_level", c.log_level);
    writeOpt(j, "log_file_location", c.log_file_location);
}

void from_json(const nlohmann::json& j, Config& c) {
    if (!j.is_object()) throw std::runtime_error("config root must be an object");

    readOpt(j, "enable_nightly_info", c.enable_nightly_info);
    readOpt(j, "enable_release_build", c.enable_release_build);
    readOpt(j, "downloads_location", c.downloads_location);
    readOpt(j, "installation_location", c.installation_location);
    readOpt(j, "version_sync_file_location", c.version_sync_file_location);
    readOpt(j, "github_mirror", c.github_mirror);

    if (j.contains("rollback_limit") && !j.at("rollback_limit").is_null()) {
        const auto limit = j.at("rollback_limit").get<long long>();
        if (limit < 0 || limit > 255) throw std::runtime_error("rollback_limit must fit in 0..255");
        c.rollback_limit = static_cast<uint8_t>(limit);
    }

    readOpt(j, "add_neovim_binary_to_path", c.add_neovim_binary_to_path);
    readOpt(j, "ignore_running_instances", c.ignore_running_instances);
    readOpt(j, "log_level", c.log_level);
    readOpt(j, "log_file_location", c.log_file_location);
}

}
