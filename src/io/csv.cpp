#include <sieve/io/csv.hpp>

#include <rapidcsv.h>
#include <spdlog/spdlog.h>

#include <charconv>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <vector>

namespace sieve::io {

namespace {

auto trim_token(std::string_view text) -> std::string_view {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

auto try_parse_int(const std::string& text, std::int64_t& out) -> bool {
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto result = std::from_chars(begin, end, out);
    return result.ec == std::errc() && result.ptr == end;
}

auto try_parse_double(const std::string& text, double& out) -> bool {
    char* end = nullptr;
    out = std::strtod(text.c_str(), &end);
    return end != text.c_str() && *end == '\0';
}

auto is_null_cell(const CsvReadOptions& options, const std::string& cell) -> bool {
    return (options.null_if_empty && cell.empty()) || options.null_tokens.contains(cell);
}

// Every present cell satisfies `parse`, and at least one cell is present.
template <typename T, typename Parse>
auto all_present_parse(const std::vector<std::string>& cells, const std::vector<bool>& validity,
                       Parse parse) -> bool {
    bool any_valid = false;
    for (std::size_t i = 0; i < cells.size(); ++i) {
        if (!validity[i]) {
            continue;
        }
        T value{};
        if (!parse(cells[i], value)) {
            return false;
        }
        any_valid = true;
    }
    return any_valid;
}

template <typename T, typename Parse>
auto build_numeric(const std::vector<std::string>& cells, const std::vector<bool>& validity,
                   Parse parse) -> Column<T> {
    Column<T> col;
    col.reserve(cells.size());
    for (std::size_t i = 0; i < cells.size(); ++i) {
        T value{};
        if (validity[i]) {
            parse(cells[i], value);
        }
        col.push_back(value);
    }
    return col;
}

}  // namespace

auto parse_null_spec(std::string_view spec) -> CsvReadOptions {
    CsvReadOptions options;
    std::size_t pos = 0;
    while (pos <= spec.size()) {
        std::size_t comma = spec.find(',', pos);
        if (comma == std::string_view::npos) {
            comma = spec.size();
        }
        auto token = trim_token(spec.substr(pos, comma - pos));
        if (!token.empty()) {
            if (token == "<empty>") {
                options.null_if_empty = true;
            } else {
                options.null_tokens.emplace(token);
            }
        }
        if (comma == spec.size()) {
            break;
        }
        pos = comma + 1;
    }
    return options;
}

auto read_csv(std::string_view path, const CsvReadOptions& options)
    -> std::expected<Table, std::string> {
    try {
        rapidcsv::Document doc(std::string(path),
                               rapidcsv::LabelParams(0, -1),   // row 0 = header, no row-index column
                               rapidcsv::SeparatorParams(',')  // handles RFC 4180 quoting
        );

        Table table;
        for (const auto& name : doc.GetColumnNames()) {
            auto cells = doc.GetColumn<std::string>(name);
            std::vector<bool> validity(cells.size(), true);
            bool has_nulls = false;
            for (std::size_t i = 0; i < cells.size(); ++i) {
                validity[i] = !is_null_cell(options, cells[i]);
                has_nulls = has_nulls || !validity[i];
            }

            ColumnValue column;
            if (all_present_parse<std::int64_t>(cells, validity, try_parse_int)) {
                column = build_numeric<std::int64_t>(cells, validity, try_parse_int);
            } else if (all_present_parse<double>(cells, validity, try_parse_double)) {
                column = build_numeric<double>(cells, validity, try_parse_double);
            } else {
                for (std::size_t i = 0; i < cells.size(); ++i) {
                    if (!validity[i]) {
                        cells[i].clear();
                    }
                }
                column = Column<std::string>(std::move(cells));
            }

            if (has_nulls) {
                table.add_column(name, std::move(column), std::move(validity));
            } else {
                table.add_column(name, std::move(column));
            }
        }
        spdlog::debug("read_csv: {} rows x {} columns from {}", table.rows(),
                      table.columns.size(), path);
        return table;
    } catch (const std::exception& e) {
        return std::unexpected("failed to read csv " + std::string(path) + ": " + e.what());
    }
}

}  // namespace sieve::io
