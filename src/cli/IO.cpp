#include "cli/IO.hpp"

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <fmt/core.h>
#include <cerrno>
#include <charconv>
#include <cstdio>
#include <iostream>
#include <set>

#ifdef _WIN32
#include <io.h>
#include <windows.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <poll.h>
#include <unistd.h>
#endif

namespace bob::cli {

namespace {

std::optional<bool> parseYesNo(std::string v) {
    boost::algorithm::trim(v);
    boost::algorithm::to_lower(v);
    if (v == "y" || v == "yes") return true;
    if (v == "n" || v == "no") return false;
    return std::nullopt;
}

std::optional<size_t> parseIndex(const std::string& token, const size_t count) {
    size_t value = 0;
    const auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
    if (ec != std::errc() || ptr != token.data() + token.size()) return std::nullopt;
    if (value == 0 || value > count) return std::nullopt;
    return value - 1;
}

}

void TerminalIO::print(const std::string_view msg) {
    std::cout << msg;
    if (msg.empty() || msg.back() != '\n') std::cout << '\n';
    std::cout.flush();
}

bool TerminalIO::interactive() const {
    return isatty(fileno(stdin)) && isatty(fileno(stderr));
}

std::optional<std::string> TerminalIO::readLine(const std::optional<std::chrono::seconds> timeout) {
    if (timeout) {
#ifdef _WIN32
        const HANDLE in = GetStdHandle(STD_INPUT_HANDLE);
        const auto ms = static_cast<DWORD>(std::chrono::duration_cast<std::chrono::milliseconds>(*timeout).count());
        if (WaitForSingleObject(in, ms) != WAIT_OBJECT_0) return std::nullopt;
#else
        pollfd pfd{STDIN_FILENO, POLLIN, 0};
        const auto ms = static_cast<int>(std::chrono::duration_cast<std::chrono::milliseconds>(*timeout).count());
        int rc;
        while ((rc = poll(&pfd, 1, ms)) < 0 && errno == EINTR) {}
        if (rc <= 0) return std::nullopt;
#endif
    }

    std::string line;
    if (!std::getline(std::cin, line)) return std::nullopt;
    return line;
}

bool TerminalIO::confirm(const std::string_view promptIn, const bool def_no) {
    while (true) {
        std::cerr << promptIn << (def_no ? " [y/N] " : " [Y/n] ") << std::flush;
        const auto line = readLine(std::nullopt);
        if (!line) return !def_no;
        if (boost::algorithm::trim_copy(*line).empty()) return !def_no;
        if (const auto answer = parseYesNo(*line)) return *answer;
    }
}

std::optional<bool> TerminalIO::confirmWithin(const std::string_view promptIn, const std::chrono::seconds timeout) {
    std::cerr << promptIn << " [y/n] " << std::flush;
    const auto line = readLine(timeout);
    if (!line) {
        std::cerr << '\n';
        return std::nullopt;
    }
    return parseYesNo(*line);
}

void TerminalIO::listItems(const std::string_view promptIn, const std::vector<std::string>& items) {
    std::cerr << promptIn << '\n';
    for (size_t i = 0; i < items.size(); ++i) std::cerr << fmt::format("  {:>2}) {}\n", i + 1, items[i]);
}

std::optional<size_t> TerminalIO::select(const std::string_view promptIn, const std::vector<std::string>& items) {
    if (items.empty()) return std::nullopt;
    listItems(promptIn, items);

    while (true) {
        std::cerr << fmt::format("Select [1-{}, empty to abort]: ", items.size()) << std::flush;
        const auto line = readLine(std::nullopt);
        if (!line) return std::nullopt;
        const auto token = boost::algorithm::trim_copy(*line);
        if (token.empty()) return std::nullopt;
        if (const auto idx = parseIndex(token, items.size())) return idx;
    }
}

std::vector<size_t> TerminalIO::multiSelect(const std::string_view promptIn, const std::vector<std::string>& items) {
    if (items.empty()) return {};
    listItems(promptIn, items);

    while (true) {
        std::cerr << "Select one or more (e.g. 1 3), empty to abort: " << std::flush;
        const auto line = readLine(std::nullopt);
        if (!line) return {};

        std::vector<std::string> tokens;
        const auto trimmed = boost::algorithm::trim_copy(*line);
        if (trimmed.empty()) return {};
        boost::algorithm::split(tokens, trimmed, boost::algorithm::is_any_of(" ,"), boost::algorithm::token_compress_on);

        std::set<size_t> chosen;
        bool valid = true;
        for (const auto& t : tokens) {
            const auto idx = parseIndex(t, items.size());
            if (!idx) { valid = false; break; }
            chosen.insert(*idx);
        }
        if (valid) return {chosen.begin(), chosen.end()};
    }
}

}
