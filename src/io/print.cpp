#include <sieve/io/print.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <type_traits>
#include <vector>

namespace sieve::io {

namespace {

auto format_double(double v) -> std::string {
    if (std::isnan(v))
        return "nan";
    if (std::isinf(v))
        return v > 0 ? "inf" : "-inf";
    return fmt::format("{:g}", v);
}

}  // namespace

auto format_cell(const ColumnEntry& entry, std::size_t row) -> std::string {
    if (is_null(entry, row)) {
        return "null";
    }
    return std::visit(
        [row](const auto& c) -> std::string {
            using T = typename std::decay_t<decltype(c)>::value_type;
            if constexpr (std::is_same_v<T, std::string>) {
                return c[row];
            } else if constexpr (std::is_same_v<T, double>) {
                return format_double(c[row]);
            } else {
                return fmt::format("{}", c[row]);
            }
        },
        entry.column);
}

void print(const Table& table, std::ostream& out) {
    if (table.columns.empty()) {
        out << "(empty table)\n";
        return;
    }

    const std::size_t rows = table.rows();
    const std::size_t cols = table.columns.size() + 1;

    // Column 0 holds the row labels; the rest mirror the table.
    std::vector<std::vector<std::string>> cells(cols);
    std::vector<std::size_t> widths(cols, 0);
    cells[0].reserve(rows);
    for (std::size_t r = 0; r < rows; ++r) {
        auto s = fmt::format("{}", table.label(r));
        widths[0] = std::max(widths[0], s.size());
        cells[0].push_back(std::move(s));
    }
    for (std::size_t c = 1; c < cols; ++c) {
        const auto& entry = table.columns[c - 1];
        widths[c] = entry.name.size();
        cells[c].reserve(rows);
        for (std::size_t r = 0; r < rows; ++r) {
            auto s = format_cell(entry, r);
            widths[c] = std::max(widths[c], s.size());
            cells[c].push_back(std::move(s));
        }
    }

    // Header row.
    out << std::string(widths[0], ' ');
    for (std::size_t c = 1; c < cols; ++c) {
        out << "  " << fmt::format("{:<{}}", table.columns[c - 1].name, widths[c]);
    }
    out << "\n";

    // Separator.
    for (std::size_t c = 0; c < cols; ++c) {
        if (c > 0)
            out << "  ";
        out << std::string(widths[c], '-');
    }
    out << "\n";

    // Data rows.
    for (std::size_t r = 0; r < rows; ++r) {
        out << fmt::format("{:>{}}", cells[0][r], widths[0]);
        for (std::size_t c = 1; c < cols; ++c) {
            out << "  " << fmt::format("{:<{}}", cells[c][r], widths[c]);
        }
        out << "\n";
    }
}

void print(const stats::NdArray& array, std::ostream& out) {
    for (double v : array) {
        out << format_double(v) << "\n";
    }
}

}  // namespace sieve::io
