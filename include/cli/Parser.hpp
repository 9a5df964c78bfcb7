#pragma once

#include "cli/types.hpp"

#include <limits>
#include <string>
#include <vector>

namespace bob::cli {

// Upsert a flag (last wins)
inline void setOpt(CommandCall& c, const std::string& key, const std::optional<std::string>& val) {
    for (auto& [k, v] : c.options) if (k == key) { v = val; return; }
    c.options.push_back(FlagKV{key, val});
}

inline std::string stripDashes(const std::string& s) {
    size_t i = 0;
    while (i < s.size() && i < 2 && s[i] == '-') ++i;
    return s.substr(i);
}

// First word is the command. `--key=value` and `--key` become options, bare words positionals.
// Once `maxPositionals` words were seen, or after `--`, every remaining word is passed through untouched.
inline CommandCall parseArgs(const std::vector<std::string>& args,
                             const size_t maxPositionals = std::numeric_limits<size_t>::max()) {
    CommandCall call;
    if (args.empty()) return call;

    call.name = args.front();

    for (size_t i = 1; i < args.size(); ++i) {
        const auto& a = args[i];

        if (a == "--") {
            call.passthrough.insert(call.passthrough.end(), args.begin() + static_cast<long>(i) + 1, args.end());
            break;
        }

        if (call.positionals.size() >= maxPositionals) {
            call.passthrough.insert(call.passthrough.end(), args.begin() + static_cast<long>(i), args.end());
            break;
        }

        if (a.size() > 1 && a[0] == '-') {
            const auto body = stripDashes(a);
            const auto eq = body.find('=');
            if (eq == std::string::npos) setOpt(call, body, std::nullopt);
            else setOpt(call, body.substr(0, eq), body.substr(eq + 1));
            continue;
        }

        call.positionals.push_back(a);
    }

    return call;
}

}
