#pragma once

#include <algorithm>
#include <cstddef>
#include <iterator>
#include <string>
#include <vector>
#include <fmt/format.h>

namespace bob::cli {

enum class Align { Left, Right };

struct Column {
    std::string header;
    Align align = Align::Left;
    std::size_t min = 1;
};

class Table {
public:
    explicit Table(std::vector<Column> cols) : cols_(std::move(cols)) {}

    void add_row(std::vector<std::string> cells) { rows_.push_back(std::move(cells)); }

    [[nodiscard]] bool empty() const { return rows_.empty(); }

    [[nodiscard]] std::string render() const {
        if (cols_.empty()) return {};

        const std::size_t ncol = cols_.size();
        std::vector<std::size_t> width(ncol, 0);
        for (std::size_t i = 0; i < ncol; ++i) width[i] = std::max(cols_[i].min, cols_[i].header.size());
        for (auto const& r : rows_)
            for (std::size_t i = 0; i < ncol && i < r.size(); ++i) width[i] = std::max(width[i], r[i].size());

        constexpr std::size_t gap = 2;
        std::string out;
        out.reserve(64 + rows_.size() * 48);

        const auto emitRow = [&](const auto& cellAt) {
            out += "  ";
            for (std::size_t i = 0; i < ncol; ++i) {
                if (i) out += std::string(gap, ' ');
                if (cols_[i].align == Align::Left)
                    fmt::format_to(std::back_inserter(out), "{:{}}", cellAt(i), width[i]);
                else fmt::format_to(std::back_inserter(out), "{:>{}}", cellAt(i), width[i]);
            }
            while (!out.empty() && out.back() == ' ') out.pop_back();
            out += '\n';
        };

        emitRow([&](const std::size_t i) -> const std::string& { return cols_[i].header; });

        out += "  ";
        for (std::size_t i = 0; i < ncol; ++i) {
            if (i) out += std::string(gap, ' ');
            out += std::string(width[i], '-');
        }
        out += '\n';

        static const std::string blank;
        for (auto const& r : rows_)
            emitRow([&](const std::size_t i) -> const std::string& { return i < r.size() ? r[i] : blank; });

        return out;
    }

private:
    std::vector<Column> cols_;
    std::vector<std::vector<std::string>> rows_;
};

}
