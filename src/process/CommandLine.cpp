#include "process/CommandLine.hpp"

namespace bob::process {

std::string quoteArg(const std::string& arg) {
    if (!arg.empty() && arg.find_first_of(" \t\"") == std::string::npos) return arg;
    std::string out = "\"";
    for (const char c : arg) {
        if (c == '"') out += '\\';
        out += c;
    }
    return out + "\"";
}

std::string commandLine(const std::string& program, const std::vector<std::string>& args) {
    std::string line = quoteArg(program);
    for (const auto& a : args) line += " " + quoteArg(a);
    return line;
}

}
