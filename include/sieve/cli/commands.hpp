#pragma once

#include <sieve/clean/table_cleaner.hpp>
#include <sieve/core/error.hpp>
#include <sieve/core/table.hpp>
#include <sieve/stats/array.hpp>

#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

namespace sieve::cli {

/// Options of `sieve clean`.
struct CleanConfig {
    std::string input;
    /// Null spec handed to io::parse_null_spec(), e.g. "<empty>,NA".
    std::string nulls;
    std::vector<std::string> trim;
    std::vector<std::string> require;
    /// Column filtered by remove_outliers_iqr(); empty skips the step.
    std::string outliers;
    double factor = clean::kDefaultIqrFactor;
};

enum class Statistic : std::uint8_t {
    MovingAverage,
    ZScore,
    MinMax,
};

/// Options of `sieve stats`.
struct StatsConfig {
    std::string input;
    std::string nulls;
    std::string column;
    Statistic statistic = Statistic::MovingAverage;
    std::int64_t window = 0;
};

/// Trim, then drop incomplete rows, then remove outliers. Steps whose
/// option is empty are skipped.
[[nodiscard]] auto clean_table(const Table& table, const CleanConfig& config) -> Result<Table>;

/// Apply the configured statistic to one numeric column. Missing cells are
/// passed on as NaN.
[[nodiscard]] auto derive_sequence(const Table& table, const StatsConfig& config)
    -> Result<stats::NdArray>;

/// Load config.input, clean it and print the table to `out`.
/// Returns the process exit status: 0 on success, 1 on any error.
[[nodiscard]] auto run_clean(const CleanConfig& config, std::ostream& out) -> int;

/// Load config.input, derive the sequence and print it to `out`, one value
/// per line. Returns the process exit status.
[[nodiscard]] auto run_stats(const StatsConfig& config, std::ostream& out) -> int;

}  // namespace sieve::cli
