#include <sieve/core/table.hpp>

#include <fmt/format.h>

#include <cmath>
#include <stdexcept>
#include <type_traits>

namespace sieve {

namespace {

auto is_valid_at(const std::optional<std::vector<bool>>& validity, std::size_t row) -> bool {
    return !validity.has_value() || (*validity)[row];
}

void check_length(const Table& table, std::size_t length, const std::string& name) {
    if (!table.columns.empty() && length != table.rows()) {
        throw std::invalid_argument(fmt::format("column '{}' has {} rows, table has {}", name,
                                                length, table.rows()));
    }
    if (table.labels.has_value() && length != table.labels->size()) {
        throw std::invalid_argument(fmt::format("column '{}' has {} rows, table has {} labels",
                                                name, length, table.labels->size()));
    }
}

}  // namespace

auto column_size(const ColumnValue& column) noexcept -> std::size_t {
    return std::visit([](const auto& col) { return col.size(); }, column);
}

auto kind_of(const ColumnValue& column) noexcept -> ColumnKind {
    return std::visit(
        [](const auto& col) -> ColumnKind {
            using T = typename std::decay_t<decltype(col)>::value_type;
            if constexpr (std::is_same_v<T, std::int64_t>) {
                return ColumnKind::Int;
            } else if constexpr (std::is_same_v<T, double>) {
                return ColumnKind::Double;
            } else {
                return ColumnKind::String;
            }
        },
        column);
}

auto is_numeric(ColumnKind kind) noexcept -> bool {
    return kind == ColumnKind::Int || kind == ColumnKind::Double;
}

auto is_null(const ColumnEntry& entry, std::size_t row) -> bool {
    if (!is_valid_at(entry.validity, row)) {
        return true;
    }
    if (const auto* doubles = std::get_if<Column<double>>(&entry.column)) {
        return std::isnan((*doubles)[row]);
    }
    return false;
}

auto operator==(const ColumnEntry& lhs, const ColumnEntry& rhs) -> bool {
    if (lhs.name != rhs.name || lhs.column.index() != rhs.column.index()) {
        return false;
    }
    const std::size_t n = column_size(lhs.column);
    if (n != column_size(rhs.column)) {
        return false;
    }
    return std::visit(
        [&](const auto& left) {
            using ColT = std::decay_t<decltype(left)>;
            const auto& right = std::get<ColT>(rhs.column);
            for (std::size_t i = 0; i < n; ++i) {
                const bool lnull = is_null(lhs, i);
                if (lnull != is_null(rhs, i)) {
                    return false;
                }
                if (!lnull && left[i] != right[i]) {
                    return false;
                }
            }
            return true;
        },
        lhs.column);
}

void Table::add_column(std::string name, ColumnValue column) {
    const std::size_t length = column_size(column);
    if (auto it = index.find(name); it != index.end()) {
        if (columns.size() > 1 || labels.has_value()) {
            check_length(*this, length, name);
        }
        columns[it->second].column = std::move(column);
        columns[it->second].validity.reset();
        return;
    }
    check_length(*this, length, name);
    std::size_t pos = columns.size();
    columns.push_back(ColumnEntry{.name = std::move(name), .column = std::move(column)});
    index[columns.back().name] = pos;
}

void Table::add_column(std::string name, ColumnValue column, std::vector<bool> validity) {
    if (validity.size() != column_size(column)) {
        throw std::invalid_argument(fmt::format("validity bitmap for '{}' has {} entries, column has {}",
                                                name, validity.size(), column_size(column)));
    }
    std::string key = name;
    add_column(std::move(name), std::move(column));
    columns[index.at(key)].validity = std::move(validity);
}

void Table::set_labels(std::vector<std::size_t> row_labels) {
    if (!columns.empty() && row_labels.size() != rows()) {
        throw std::invalid_argument(
            fmt::format("{} labels given for a table of {} rows", row_labels.size(), rows()));
    }
    labels = std::move(row_labels);
}

auto Table::find(const std::string& name) -> ColumnValue* {
    if (auto it = index.find(name); it != index.end()) {
        return &columns[it->second].column;
    }
    return nullptr;
}

auto Table::find(const std::string& name) const -> const ColumnValue* {
    if (auto it = index.find(name); it != index.end()) {
        return &columns[it->second].column;
    }
    return nullptr;
}

auto Table::find_entry(const std::string& name) const -> const ColumnEntry* {
    if (auto it = index.find(name); it != index.end()) {
        return &columns[it->second];
    }
    return nullptr;
}

auto Table::rows() const noexcept -> std::size_t {
    if (columns.empty()) {
        return labels.has_value() ? labels->size() : 0;
    }
    return column_size(columns.front().column);
}

auto Table::label(std::size_t row) const -> std::size_t {
    if (labels.has_value()) {
        return labels->at(row);
    }
    return row;
}

auto Table::take(std::span<const std::size_t> positions) const -> Table {
    Table output;
    output.columns.reserve(columns.size());
    for (const auto& entry : columns) {
        ColumnEntry gathered{
            .name = entry.name,
            .column = std::visit([&](const auto& col) -> ColumnValue { return col.take(positions); },
                                 entry.column),
        };
        if (entry.validity.has_value()) {
            std::vector<bool> validity;
            validity.reserve(positions.size());
            for (auto row : positions) {
                validity.push_back((*entry.validity)[row]);
            }
            gathered.validity = std::move(validity);
        }
        output.index[entry.name] = output.columns.size();
        output.columns.push_back(std::move(gathered));
    }
    std::vector<std::size_t> kept_labels;
    kept_labels.reserve(positions.size());
    for (auto row : positions) {
        kept_labels.push_back(label(row));
    }
    output.labels = std::move(kept_labels);
    return output;
}

auto operator==(const Table& lhs, const Table& rhs) -> bool {
    if (lhs.columns.size() != rhs.columns.size() || lhs.rows() != rhs.rows()) {
        return false;
    }
    for (std::size_t c = 0; c < lhs.columns.size(); ++c) {
        if (!(lhs.columns[c] == rhs.columns[c])) {
            return false;
        }
    }
    for (std::size_t r = 0; r < lhs.rows(); ++r) {
        if (lhs.label(r) != rhs.label(r)) {
            return false;
        }
    }
    return true;
}

}  // namespace sieve
