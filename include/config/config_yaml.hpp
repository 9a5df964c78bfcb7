#pragma once

#include "config/Config.hpp"
#include <yaml-cpp/yaml.h>

namespace YAML {

using namespace bob::config;

template<typename T>
static void encodeOpt(Node& node, const char* key, const std::optional<T>& value) {
    if (value) node[key] = *value;
}

template<typename T>
static void decodeOpt(const Node& node, const char* key, std::optional<T>& out) {
    if (node[key] && !node[key].IsNull()) out = node[key].as<T>();
}

template<>
struct convert<Config> {
    static Node encode(const Config& rhs) {
        Node node;
        encodeOpt(node, "enable_nightly_info", rhs.enable_nightly_info);
        encodeOpt(node, "enable_release_build", rhs.enable_release_build);
        encodeOpt(node, "downloads_location", rhs.downloads_location);
        encodeOpt(node, "installation_location", rhs.installation_location);
        encodeOpt(node, "version_sync_file_location", rhs.version_sync_file_location);
        encodeOpt(node, "github_mirror", rhs.github_mirror);
        if (rhs.rollback_limit) node["rollback_limit"] = static_cast<unsigned int>(*rhs.rollback_limit);
        encodeOpt(node, "add_neovim_binary_to_path", rhs.add_neovim_binary_to_path);
        encodeOpt(node, "ignore_running_instances", rhs.ignore_running_instances);
        encodeOpt(node, "log_level", rhs.log_level);
        encodeOpt(node, "log_file_location", rhs.log_file_location);
        return node;
    }

    static bool decode(const Node& node, Config& rhs) {
        if (!node.IsMap()) return false;
        decodeOpt(node, "enable_nightly_info", rhs.enable_nightly_info);
        decodeOpt(node, "enable_release_build", rhs.enable_release_build);
        decodeOpt(node, "downloads_location", rhs.downloads_location);
        decodeOpt(node, "installation_location", rhs.installation_location);
        decodeOpt(node, "version_sync_file_location", rhs.version_sync_file_location);
        decodeOpt(node, "github_mirror", rhs.github_mirror);
        if (node["rollback_limit"]) {
            const auto limit = node["rollback_limit"].as<unsigned int>();
            if (limit > 255) throw std::runtime_error("rollback_limit must fit in 0..255");
            rhs.rollback_limit = static_cast<uint8_t>(limit);
        }
        decodeOpt(node, "add_neovim_binary_to_path", rhs.add_neovim_binary_to_path);
        decodeOpt(node, "ignore_running_instances", rhs.ignore_running_instances);
        decodeOpt(node, "log_level", rhs.log_level);
        decodeOpt(node, "log_file_location", rhs.log_file_location);
        return true;
    }
};

}
