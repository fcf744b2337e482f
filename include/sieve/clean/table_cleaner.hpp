#pragma once

#include <sieve/core/error.hpp>
#include <sieve/core/table.hpp>

#include <string>
#include <vector>

namespace sieve::clean {

/// Default interquartile-range multiplier for remove_outliers_iqr().
inline constexpr double kDefaultIqrFactor = 1.5;

/// Strip leading and trailing whitespace from every present cell of the
/// named text columns. Missing cells, other columns and row labels are
/// carried over unchanged.
///
/// Errors: ColumnNotFound for an unknown name, TypeMismatch for a numeric
/// column. Every name is checked before any work is done.
[[nodiscard]] auto trim_strings(const Table& table, const std::vector<std::string>& columns)
    -> Result<Table>;

/// Keep only the rows where none of the named columns is missing. Row order
/// and labels of the surviving rows are preserved.
///
/// Errors: ColumnNotFound for an unknown name.
[[nodiscard]] auto drop_invalid_rows(const Table& table, const std::vector<std::string>& columns)
    -> Result<Table>;

/// Keep only the rows whose value in `column` lies in the closed interval
/// [Q1 - factor * IQR, Q3 + factor * IQR]. Quartiles are linear-interpolation
/// estimates over the present values; rows with a missing value are dropped.
/// Quartiles are computed in double precision; integer cells are compared
/// against the bounds exactly.
///
/// Errors: ColumnNotFound, TypeMismatch for a text column, InvalidParameter
/// unless factor is finite and greater than zero.
[[nodiscard]] auto remove_outliers_iqr(const Table& table, const std::string& column,
                                       double factor = kDefaultIqrFactor) -> Result<Table>;

}  // namespace sieve::clean
