#include "config/toml.hpp"

#include <boost/algorithm/string/trim.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace bob::config::toml {

namespace {

bool isBareKeyChar(const char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-';
}

std::string stripComment(const std::string& line) {
    bool inBasic = false, inLiteral = false;
    for (size_t i = 0; i < line.size(); ++i) {
        const char c = line[i];
        if (inBasic) {
            if (c == '\\') { ++i; continue; }
            if (c == '"') inBasic = false;
        } else if (inLiteral) {
            if (c == '\'') inLiteral = false;
        } else if (c == '"') inBasic = true;
        else if (c == '\'') inLiteral = true;
        else if (c == '#') return line.substr(0, i);
    }
    return line;
}

std::string unescapeBasic(const std::string& s, const size_t lineNo) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] != '\\') { out.push_back(s[i]); continue; }
        if (++i >= s.size()) throw std::runtime_error(fmt::format("TOML line {}: dangling escape", lineNo));
        switch (s[i]) {
            case 'n': out.push_back('\n'); break;
            case 't': out.push_back('\t'); break;
            case 'r': out.push_back('\r'); break;
            case '"': out.push_back('"'); break;
            case '\\': out.push_back('\\'); break;
            default: throw std::runtime_error(fmt::format("TOML line {}: unsupported escape \\{}", lineNo, s[i]));
        }
    }
    return out;
}

nlohmann::json parseValue(const std::string& raw, const size_t lineNo) {
    if (raw.size() >= 2 && raw.front() == '"' && raw.back() == '"')
        return unescapeBasic(raw.substr(1, raw.size() - 2), lineNo);
    if (raw.size() >= 2 && raw.front() == '\'' && raw.back() == '\'')
        return raw.substr(1, raw.size() - 2);
    if (raw == "true") return true;
    if (raw == "false") return false;

    std::string digits = raw;
    std::erase(digits, '_');
    if (!digits.empty() && (std::isdigit(static_cast<unsigned char>(digits.front())) || digits.front() == '-' || digits.front() == '+')) {
        size_t consumed = 0;
        const long long v = std::stoll(digits, &consumed);
        if (consumed == digits.size()) return v;
    }

    throw std::runtime_error(fmt::format("TOML line {}: unsupported value '{}'", lineNo, raw));
}

}

nlohmann::json parse(const std::string& content) {
    nlohmann::json out = nlohmann::json::object();
    std::istringstream in(content);
    std::string line;
    size_t lineNo = 0;

    while (std::getline(in, line)) {
        ++lineNo;
        std::string text = stripComment(line);
        boost::algorithm::trim(text);
        if (text.empty()) continue;

        if (text.front() == '[')
            throw std::runtime_error(fmt::format("TOML line {}: tables are not supported in the config file", lineNo));

        const auto eq = text.find('=');
        if (eq == std::string::npos)
            throw std::runtime_error(fmt::format("TOML line {}: expected key = value", lineNo));

        std::string key = text.substr(0, eq);
        std::string value = text.substr(eq + 1);
        boost::algorithm::trim(key);
        boost::algorithm::trim(value);

        if (key.size() >= 2 && key.front() == '"' && key.back() == '"') key = key.substr(1, key.size() - 2);
        else if (key.empty() || !std::all_of(key.begin(), key.end(), isBareKeyChar))
            throw std::runtime_error(fmt::format("TOML line {}: invalid key '{}'", lineNo, key));

        if (out.contains(key))
            throw std::runtime_error(fmt::format("TOML line {}: duplicate key '{}'", lineNo, key));

        out[key] = parseValue(value, lineNo);
    }

    return out;
}

std::string setBool(const std::string& content, const std::string& key, const bool value) {
    const std::string assignment = fmt::format("{} = {}", key, value ? "true" : "false");

    std::istringstream in(content);
    std::ostringstream out;
    std::string line;
    bool replaced = false;

    while (std::getline(in, line)) {
        std::string text = stripComment(line);
        boost::algorithm::trim(text);
        if (!replaced && boost::algorithm::starts_with(text, key)) {
            std::string rest = text.substr(key.size());
            boost::algorithm::trim_left(rest);
            if (!rest.empty() && rest.front() == '=') {
                out << assignment << '\n';
                replaced = true;
                continue;
            }
        }
        out << line << '\n';
    }

    if (!replaced) out << assignment << '\n';
    return out.str();
}

}
