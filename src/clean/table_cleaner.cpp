#include <sieve/clean/table_cleaner.hpp>
#include <sieve/stats/reduce.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <cmath>
#include <cstdint>
#include <limits>
#include <optional>
#include <string_view>
#include <type_traits>
#include <utility>

namespace sieve::clean {

namespace {

constexpr std::string_view kWhitespace = " \t\n\v\f\r";

auto kind_name(ColumnKind kind) -> std::string_view {
    switch (kind) {
        case ColumnKind::Int:
            return "int";
        case ColumnKind::Double:
            return "double";
        case ColumnKind::String:
            return "string";
    }
    return "unknown";
}

auto trim(std::string_view text) -> std::string {
    auto begin = text.find_first_not_of(kWhitespace);
    if (begin == std::string_view::npos) {
        return {};
    }
    auto end = text.find_last_not_of(kWhitespace);
    return std::string(text.substr(begin, end - begin + 1));
}

auto lookup(std::string_view op, const Table& table, const std::string& name)
    -> Result<const ColumnEntry*> {
    const auto* entry = table.find_entry(name);
    if (entry == nullptr) {
        return std::unexpected(column_not_found(op, name));
    }
    return entry;
}

// Present values of a numeric column, widened to double.
auto present_values(const ColumnEntry& entry) -> std::vector<double> {
    std::vector<double> values;
    std::visit(
        [&](const auto& col) {
            using T = typename std::decay_t<decltype(col)>::value_type;
            if constexpr (std::is_arithmetic_v<T>) {
                values.reserve(col.size());
                for (std::size_t i = 0; i < col.size(); ++i) {
                    if (!is_null(entry, i)) {
                        values.push_back(static_cast<double>(col[i]));
                    }
                }
            }
        },
        entry.column);
    return values;
}

// The integers in [lower, upper], or nullopt when there are none. Integer
// cells are tested against these so values beyond 2^53 are not rounded.
auto integer_bounds(double lower, double upper)
    -> std::optional<std::pair<std::int64_t, std::int64_t>> {
    constexpr double kTwo63 = 9223372036854775808.0;
    const double lo = std::ceil(lower);
    const double hi = std::floor(upper);
    if (std::isnan(lo) || std::isnan(hi) || lo > hi || lo >= kTwo63 || hi < -kTwo63) {
        return std::nullopt;
    }
    return std::pair{
        lo <= -kTwo63 ? std::numeric_limits<std::int64_t>::min() : static_cast<std::int64_t>(lo),
        hi >= kTwo63 ? std::numeric_limits<std::int64_t>::max() : static_cast<std::int64_t>(hi)};
}

}  // namespace

auto trim_strings(const Table& table, const std::vector<std::string>& columns) -> Result<Table> {
    for (const auto& name : columns) {
        auto entry = lookup("trim_strings", table, name);
        if (!entry) {
            return std::unexpected(std::move(entry.error()));
        }
        const auto kind = kind_of((*entry)->column);
        if (kind != ColumnKind::String) {
            return std::unexpected(type_mismatch(
                "trim_strings",
                fmt::format("column '{}' holds {} values, expected string", name,
                            kind_name(kind))));
        }
    }

    Table output = table;
    for (const auto& name : columns) {
        auto& entry = output.columns[output.index.at(name)];
        auto& strings = std::get<Column<std::string>>(entry.column);
        for (std::size_t i = 0; i < strings.size(); ++i) {
            if (!is_null(entry, i)) {
                strings[i] = trim(strings[i]);
            }
        }
    }
    spdlog::debug("trim_strings: {} column(s) over {} rows", columns.size(), output.rows());
    return output;
}

auto drop_invalid_rows(const Table& table, const std::vector<std::string>& columns)
    -> Result<Table> {
    std::vector<const ColumnEntry*> required;
    required.reserve(columns.size());
    for (const auto& name : columns) {
        auto entry = lookup("drop_invalid_rows", table, name);
        if (!entry) {
            return std::unexpected(std::move(entry.error()));
        }
        required.push_back(*entry);
    }

    const std::size_t n = table.rows();
    std::vector<std::size_t> selected;
    selected.reserve(n);
    for (std::size_t row = 0; row < n; ++row) {
        bool valid = true;
        for (const auto* entry : required) {
            if (is_null(*entry, row)) {
                valid = false;
                break;
            }
        }
        if (valid) {
            selected.push_back(row);
        }
    }
    spdlog::debug("drop_invalid_rows: kept {} of {} rows", selected.size(), n);
    return table.take(selected);
}

auto remove_outliers_iqr(const Table& table, const std::string& column, double factor)
    -> Result<Table> {
    auto lookup_result = lookup("remove_outliers_iqr", table, column);
    if (!lookup_result) {
        return std::unexpected(std::move(lookup_result.error()));
    }
    const ColumnEntry& entry = **lookup_result;
    const auto kind = kind_of(entry.column);
    if (!is_numeric(kind)) {
        return std::unexpected(type_mismatch(
            "remove_outliers_iqr",
            fmt::format("column '{}' holds {} values, expected a numeric column", column,
                        kind_name(kind))));
    }
    if (!std::isfinite(factor) || factor <= 0.0) {
        return std::unexpected(invalid_parameter(
            "remove_outliers_iqr", fmt::format("factor must be finite and positive, got {}",
                                               factor)));
    }

    const auto values = present_values(entry);
    const double q1 = stats::quantile(values, 0.25);
    const double q3 = stats::quantile(values, 0.75);
    const double iqr = q3 - q1;
    const double lower = q1 - factor * iqr;
    const double upper = q3 + factor * iqr;

    // With no present values the bounds are NaN and every comparison fails.
    const std::size_t n = table.rows();
    std::vector<std::size_t> selected;
    selected.reserve(n);
    std::visit(
        [&](const auto& col) {
            using T = typename std::decay_t<decltype(col)>::value_type;
            if constexpr (std::is_same_v<T, std::int64_t>) {
                const auto bounds = integer_bounds(lower, upper);
                if (!bounds) {
                    return;
                }
                for (std::size_t row = 0; row < n; ++row) {
                    if (!is_null(entry, row) && col[row] >= bounds->first &&
                        col[row] <= bounds->second) {
                        selected.push_back(row);
                    }
                }
            } else if constexpr (std::is_same_v<T, double>) {
                for (std::size_t row = 0; row < n; ++row) {
                    if (!is_null(entry, row) && col[row] >= lower && col[row] <= upper) {
                        selected.push_back(row);
                    }
                }
            }
        },
        entry.column);
    spdlog::debug("remove_outliers_iqr: '{}' bounds [{}, {}], kept {} of {} rows", column, lower,
                  upper, selected.size(), n);
    return table.take(selected);
}

}  // namespace sieve::clean
