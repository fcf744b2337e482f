#include <sieve/stats/reduce.hpp>
#include <sieve/stats/sequence.hpp>

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <cmath>
#include <limits>
#include <optional>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace sieve::stats {

namespace {

auto require_1d(std::string_view op, const NdArray& sequence) -> std::optional<Error> {
    if (sequence.ndim() != 1) {
        return type_mismatch(op, fmt::format("expected a one-dimensional sequence, got shape ({})",
                                             fmt::join(sequence.shape(), ", ")));
    }
    return std::nullopt;
}

}  // namespace

auto moving_average(const NdArray& sequence, std::int64_t window) -> Result<NdArray> {
    if (auto err = require_1d("moving_average", sequence)) {
        return std::unexpected(std::move(*err));
    }
    const auto n = static_cast<std::int64_t>(sequence.size());
    if (window <= 0 || window > n) {
        return std::unexpected(invalid_parameter(
            "moving_average", fmt::format("window must be in [1, {}], got {}", n, window)));
    }

    const auto w = static_cast<std::size_t>(window);
    const auto values = sequence.span();
    std::vector<double> out;
    out.reserve(values.size() - w + 1);
    for (std::size_t i = 0; i + w <= values.size(); ++i) {
        out.push_back(stats::mean(values.subspan(i, w)));
    }
    spdlog::debug("moving_average: {} values, window {} -> {} values", values.size(), w,
                  out.size());
    return NdArray{std::move(out)};
}

auto zscore(const NdArray& sequence) -> Result<NdArray> {
    if (auto err = require_1d("zscore", sequence)) {
        return std::unexpected(std::move(*err));
    }
    const auto values = sequence.span();
    const double mu = stats::mean(values);
    const double sigma = stats::stddev(values, 0);
    // Also rejects the NaN produced by empty or NaN-bearing input, and the
    // infinity produced when the squared deviations overflow.
    if (!(sigma > 0.0) || !std::isfinite(sigma)) {
        return std::unexpected(invalid_parameter(
            "zscore", fmt::format("standard deviation must be positive and finite, got {}",
                                  sigma)));
    }

    std::vector<double> out;
    out.reserve(values.size());
    for (double x : values) {
        out.push_back((x - mu) / sigma);
    }
    spdlog::debug("zscore: {} values, mean {}, stddev {}", values.size(), mu, sigma);
    return NdArray{std::move(out)};
}

auto min_max_scale(const NdArray& sequence) -> Result<NdArray> {
    if (auto err = require_1d("min_max_scale", sequence)) {
        return std::unexpected(std::move(*err));
    }
    const auto values = sequence.span();
    const double lo = stats::min(values);
    const double hi = stats::max(values);
    if (!(hi > lo)) {
        return std::unexpected(invalid_parameter(
            "min_max_scale", fmt::format("range must be positive, got min {} and max {}", lo, hi)));
    }

    const double range = hi - lo;
    if (!std::isfinite(range)) {
        return std::unexpected(invalid_parameter(
            "min_max_scale",
            fmt::format("range between min {} and max {} is not representable", lo, hi)));
    }
    std::vector<double> out;
    out.reserve(values.size());
    for (double x : values) {
        out.push_back((x - lo) / range);
    }
    spdlog::debug("min_max_scale: {} values, min {}, max {}", values.size(), lo, hi);
    return NdArray{std::move(out)};
}

auto to_sequence(const ColumnEntry& column) -> Result<NdArray> {
    if (!is_numeric(kind_of(column.column))) {
        return std::unexpected(type_mismatch(
            "to_sequence", fmt::format("column '{}' is not numeric", column.name)));
    }
    std::vector<double> values;
    values.reserve(column_size(column.column));
    std::visit(
        [&](const auto& col) {
            using T = typename std::decay_t<decltype(col)>::value_type;
            if constexpr (std::is_arithmetic_v<T>) {
                for (std::size_t i = 0; i < col.size(); ++i) {
                    values.push_back(is_null(column, i) ? std::numeric_limits<double>::quiet_NaN()
                                                        : static_cast<double>(col[i]));
                }
            }
        },
        column.column);
    return NdArray{std::move(values)};
}

auto moving_average(const ColumnEntry& column, std::int64_t window) -> Result<NdArray> {
    return to_sequence(column).and_then(
        [window](const NdArray& sequence) { return moving_average(sequence, window); });
}

auto zscore(const ColumnEntry& column) -> Result<NdArray> {
    return to_sequence(column).and_then([](const NdArray& sequence) { return zscore(sequence); });
}

auto min_max_scale(const ColumnEntry& column) -> Result<NdArray> {
    return to_sequence(column).and_then(
        [](const NdArray& sequence) { return min_max_scale(sequence); });
}

}  // namespace sieve::stats
