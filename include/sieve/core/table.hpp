#pragma once

#include <sieve/core/column.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace sieve {

enum class ColumnKind : std::uint8_t {
    Int,
    Double,
    String,
};

using ColumnValue = std::variant<Column<std::int64_t>, Column<double>, Column<std::string>>;

struct ColumnEntry {
    std::string name;
    ColumnValue column;
    // Validity bitmap: true = valid (not null), false = null.
    // nullopt means every row is valid, the common case.
    std::optional<std::vector<bool>> validity;
};

[[nodiscard]] auto column_size(const ColumnValue& column) noexcept -> std::size_t;
[[nodiscard]] auto kind_of(const ColumnValue& column) noexcept -> ColumnKind;
[[nodiscard]] auto is_numeric(ColumnKind kind) noexcept -> bool;

/// Returns true if row `row` of `entry` is missing: either flagged in the
/// validity bitmap or a NaN in a double column.
[[nodiscard]] auto is_null(const ColumnEntry& entry, std::size_t row) -> bool;

/// Cell-wise equality: same name, type and length, same missing markers,
/// and equal values wherever both cells are present.
[[nodiscard]] auto operator==(const ColumnEntry& lhs, const ColumnEntry& rhs) -> bool;

/// An ordered set of equal-length named columns with per-row labels.
///
/// Tables are values: copying a table copies its columns. Row labels default
/// to the row position; a table produced by take() keeps the labels of the
/// rows it selected so callers can trace survivors back to their source.
struct Table {
    std::vector<ColumnEntry> columns;
    std::unordered_map<std::string, std::size_t> index;
    // nullopt means label(i) == i.
    std::optional<std::vector<std::size_t>> labels;

    /// Add or replace a column. Throws std::invalid_argument on a length mismatch.
    void add_column(std::string name, ColumnValue column);
    /// Add a column with an explicit validity bitmap (true = valid, false = null).
    void add_column(std::string name, ColumnValue column, std::vector<bool> validity);
    /// Replace the row labels. Throws std::invalid_argument on a length mismatch.
    void set_labels(std::vector<std::size_t> row_labels);

    [[nodiscard]] auto find(const std::string& name) -> ColumnValue*;
    [[nodiscard]] auto find(const std::string& name) const -> const ColumnValue*;
    [[nodiscard]] auto find_entry(const std::string& name) const -> const ColumnEntry*;
    [[nodiscard]] auto rows() const noexcept -> std::size_t;
    [[nodiscard]] auto label(std::size_t row) const -> std::size_t;

    /// Gather `positions` (not labels) from every column into a new table.
    [[nodiscard]] auto take(std::span<const std::size_t> positions) const -> Table;
};

[[nodiscard]] auto operator==(const Table& lhs, const Table& rhs) -> bool;

}  // namespace sieve
