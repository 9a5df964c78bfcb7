#pragma once

#include <string>
#include <nlohmann/json_fwd.hpp>

namespace bob::config::toml {

// Reads the flat subset of TOML used by the config file: top-level `key = value` pairs with
// basic/literal strings, booleans and integers, plus comments. Tables are rejected.
nlohmann::json parse(const std::string& content);

// Sets `key = true|false`, replacing an existing assignment or appending a new line.
std::string setBool(const std::string& content, const std::string& key, bool value);

}
