#pragma once

#include <sieve/core/error.hpp>
#include <sieve/core/table.hpp>
#include <sieve/stats/array.hpp>

#include <cstdint>

namespace sieve::stats {

// ─── Sequence statistics ──────────────────────────────────────────────────────
//  Each function requires a one-dimensional input (TypeMismatch otherwise),
//  leaves the input untouched and returns a freshly allocated array.

/// Means of every `window`-sized slice, in order: length - window + 1 values.
/// InvalidParameter unless 1 <= window <= length.
[[nodiscard]] auto moving_average(const NdArray& sequence, std::int64_t window)
    -> Result<NdArray>;

/// (x - mean) / stddev with the population convention (divisor N).
/// InvalidParameter unless the standard deviation is positive and finite.
[[nodiscard]] auto zscore(const NdArray& sequence) -> Result<NdArray>;

/// (x - min) / (max - min). InvalidParameter unless max > min and the
/// range is representable.
[[nodiscard]] auto min_max_scale(const NdArray& sequence) -> Result<NdArray>;

/// Widen a numeric table column to a sequence, one value per row. Missing
/// cells become NaN. TypeMismatch for a text column.
[[nodiscard]] auto to_sequence(const ColumnEntry& column) -> Result<NdArray>;

// Column overloads. A missing cell reaches the statistic as NaN: it poisons
// every window that covers it and makes zscore and min_max_scale fail.
[[nodiscard]] auto moving_average(const ColumnEntry& column, std::int64_t window)
    -> Result<NdArray>;
[[nodiscard]] auto zscore(const ColumnEntry& column) -> Result<NdArray>;
[[nodiscard]] auto min_max_scale(const ColumnEntry& column) -> Result<NdArray>;

}  // namespace sieve::stats
