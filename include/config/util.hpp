#pragma once

#include <cstdlib>
#include <functional>
#include <optional>
#include <regex>
#include <string>

namespace bob::config {

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

inline std::optional<std::string> processEnv(const std::string& name) {
    if (const char* v = std::getenv(name.c_str())) return std::string(v);
    return std::nullopt;
}

// Replaces every $NAME (uppercase letters and underscores) with its value.
// Unknown variables expand to the empty string and are reported through onMissing.
inline std::string expandEnvironmentVariables(const std::string& input,
                                              const EnvLookup& lookup = processEnv,
                                              const std::function<void(const std::string&)>& onMissing = {}) {
    static const std::regex re(R"(\$([A-Z_]+))");

    std::string out;
    auto begin = std::sregex_iterator(input.begin(), input.end(), re);
    size_t last = 0;
    for (auto it = begin; it != std::sregex_iterator(); ++it) {
        const auto& m = *it;
        out.append(input, last, static_cast<size_t>(m.position()) - last);
        const auto name = m[1].str();
        if (const auto value = lookup(name)) out += *value;
        else if (onMissing) onMissing(name);
        last = static_cast<size_t>(m.position() + m.length());
    }
    out.append(input, last, std::string::npos);
    return out;
}

}
