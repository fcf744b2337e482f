#include <sieve/cli/commands.hpp>
#include <sieve/io/csv.hpp>
#include <sieve/io/print.hpp>
#include <sieve/stats/sequence.hpp>

#include <spdlog/spdlog.h>

#include <optional>
#include <utility>

namespace sieve::cli {

namespace {

auto load(const std::string& path, const std::string& nulls) -> std::optional<Table> {
    auto table = io::read_csv(path, io::parse_null_spec(nulls));
    if (!table) {
        spdlog::error("{}", table.error());
        return std::nullopt;
    }
    spdlog::info("loaded {} rows from {}", table->rows(), path);
    return std::move(*table);
}

}  // namespace

auto clean_table(const Table& table, const CleanConfig& config) -> Result<Table> {
    Result<Table> result = table;
    if (!config.trim.empty()) {
        result = result.and_then(
            [&](const Table& t) { return clean::trim_strings(t, config.trim); });
    }
    if (!config.require.empty()) {
        result = result.and_then(
            [&](const Table& t) { return clean::drop_invalid_rows(t, config.require); });
    }
    if (!config.outliers.empty()) {
        result = result.and_then([&](const Table& t) {
            return clean::remove_outliers_iqr(t, config.outliers, config.factor);
        });
    }
    return result;
}

auto derive_sequence(const Table& table, const StatsConfig& config) -> Result<stats::NdArray> {
    const auto* entry = table.find_entry(config.column);
    if (entry == nullptr) {
        return std::unexpected(column_not_found("stats", config.column));
    }
    switch (config.statistic) {
        case Statistic::ZScore:
            return stats::zscore(*entry);
        case Statistic::MinMax:
            return stats::min_max_scale(*entry);
        case Statistic::MovingAverage:
            break;
    }
    return stats::moving_average(*entry, config.window);
}

auto run_clean(const CleanConfig& config, std::ostream& out) -> int {
    auto table = load(config.input, config.nulls);
    if (!table) {
        return 1;
    }
    auto result = clean_table(*table, config);
    if (!result) {
        spdlog::error("{}", result.error().format());
        return 1;
    }
    spdlog::info("{} rows after cleaning", result->rows());
    io::print(*result, out);
    return 0;
}

auto run_stats(const StatsConfig& config, std::ostream& out) -> int {
    auto table = load(config.input, config.nulls);
    if (!table) {
        return 1;
    }
    auto result = derive_sequence(*table, config);
    if (!result) {
        spdlog::error("{}", result.error().format());
        return 1;
    }
    io::print(*result, out);
    return 0;
}

}  // namespace sieve::cli
