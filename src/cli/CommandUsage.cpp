#include "cli/CommandUsage.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace bob::cli {

namespace {

std::string trimRight(std::string s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) s.pop_back();
    return s;
}

std::vector<std::string> wrap(const std::string& s, const int width) {
    const int W = std::max(20, width);
    std::vector<std::string> out;
    std::size_t i = 0;
    const std::size_t n = s.size();
    while (i < n) {
        while (i < n && std::isspace(static_cast<unsigned char>(s[i])) && s[i] != '\n') ++i;

        if (i < n && s[i] == '\n') {
            out.emplace_back("");
            ++i;
            continue;
        }

        if (i >= n) break;

        const std::size_t end = std::min<std::size_t>(i + W, n);
        std::size_t break_pos = end;

        // prefer last space before end
        if (end < n && s[end] != ' ') {
            const auto sp = s.rfind(' ', end);
            if (sp != std::string::npos && sp >= i) break_pos = sp;
        }

        if (break_pos == i) break_pos = end;

        out.push_back(trimRight(s.substr(i, break_pos - i)));

        if (break_pos < n && s[break_pos] == ' ') i = break_pos + 1;
        else i = break_pos;
    }
    if (out.empty()) out.emplace_back("");
    return out;
}

std::string keyOf(const Entry& e) {
    return e.aliases.empty() ? e.label : fmt::format("{} | {}", e.label, fmt::join(e.aliases, " | "));
}

std::string padRight(const std::string& s, const std::size_t width) {
    if (s.size() >= width) return s;
    return s + std::string(width - s.size(), ' ');
}

void emitTwoColSection(std::ostringstream& out, const std::string& title, const std::vector<Entry>& items,
                       const int width, const std::size_t maxKeyCol) {
    if (items.empty()) return;
    out << title << "\n";

    std::size_t keyw = 0;
    for (const auto& it : items) keyw = std::max(keyw, keyOf(it).size());
    keyw = std::min(keyw, maxKeyCol);

    constexpr std::size_t indent = 2, gap = 2;
    const int rightw = width - static_cast<int>(indent + keyw + gap);

    for (const auto& it : items) {
        const auto lines = wrap(it.desc, rightw);
        out << std::string(indent, ' ') << padRight(keyOf(it), keyw) << std::string(gap, ' ') << lines[0] << "\n";
        for (std::size_t i = 1; i < lines.size(); ++i)
            out << std::string(indent + keyw + gap, ' ') << lines[i] << "\n";
    }
    out << "\n";
}

}

std::string CommandUsage::normalizePositional_(const std::string& s) {
    // Already bracketed by the caller
    if (s.find('<') != std::string::npos || s.find('[') != std::string::npos) return s;
    return fmt::format("<{}>", s);
}

std::string CommandUsage::buildSynopsis_() const {
    std::string out = fmt::format("bob {}", command);
    for (const auto& p : positionals) out += " " + normalizePositional_(p.label);
    if (!optional.empty()) out += " [options]";
    return out;
}

std::string CommandUsage::label() const {
    return aliases.empty() ? command : fmt::format("{}, {}", command, fmt::join(aliases, ", "));
}

std::string CommandUsage::summaryLine(const std::size_t keyWidth) const {
    return fmt::format("  {}  {}\n", padRight(label(), keyWidth), description);
}

std::string CommandUsage::toText() const {
    std::ostringstream out;

    out << "Usage: " << synopsis.value_or(buildSynopsis_()) << "\n\n";
    for (const auto& line : wrap(description, term_width)) out << line << "\n";
    out << "\n";

    if (!aliases.empty()) out << "Aliases: " << fmt::format("{}", fmt::join(aliases, ", ")) << "\n\n";

    emitTwoColSection(out, "Arguments:", positionals, term_width, max_key_col);
    emitTwoColSection(out, "Options:", optional, term_width, max_key_col);

    if (!examples.empty()) {
        out << "Examples:\n";
        for (const auto& [cmd, note] : examples) {
            out << "  " << cmd << "\n";
            if (!note.empty()) out << "      " << note << "\n";
        }
    }

    return trimRight(out.str()) + "\n";
}

std::string CommandBook::toText() const {
    std::size_t keyw = 0;
    for (const auto& c : commands) keyw = std::max(keyw, c.label().size());

    std::ostringstream out;
    out << title << "\n\nUsage: bob <command> [args]\n\nCommands:\n";
    for (const auto& c : commands) out << c.summaryLine(keyw);
    out << "\nRun `bob help <command>` for details on a single command.\n";
    return out.str();
}

}
