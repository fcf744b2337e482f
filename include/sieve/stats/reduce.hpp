#pragma once

#include <cstddef>
#include <span>

namespace sieve::stats {

// ─── Reductions ───────────────────────────────────────────────────────────────
//  Plain numeric kernels over a flat span. NaN propagates, and an empty span
//  yields NaN (there is no value to report).

[[nodiscard]] auto sum(std::span<const double> values) -> double;
[[nodiscard]] auto mean(std::span<const double> values) -> double;

/// Standard deviation with divisor N - ddof (ddof = 0 is the population convention).
[[nodiscard]] auto stddev(std::span<const double> values, std::size_t ddof = 0) -> double;

/// Quantile `q` in [0, 1] with linear interpolation between the two closest
/// order statistics (position q * (n - 1)). Returns NaN for q outside [0, 1].
[[nodiscard]] auto quantile(std::span<const double> values, double q) -> double;

[[nodiscard]] auto min(std::span<const double> values) -> double;
[[nodiscard]] auto max(std::span<const double> values) -> double;

}  // namespace sieve::stats
