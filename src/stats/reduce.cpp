#include <sieve/stats/reduce.hpp>

#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <vector>

namespace sieve::stats {

namespace {

constexpr double kNaN = std::numeric_limits<double>::quiet_NaN();

auto has_nan(std::span<const double> values) -> bool {
    return std::ranges::any_of(values, [](double v) { return std::isnan(v); });
}

}  // namespace

auto sum(std::span<const double> values) -> double {
    return std::accumulate(values.begin(), values.end(), 0.0);
}

auto mean(std::span<const double> values) -> double {
    if (values.empty()) {
        return kNaN;
    }
    return sum(values) / static_cast<double>(values.size());
}

auto stddev(std::span<const double> values, std::size_t ddof) -> double {
    if (values.size() <= ddof) {
        return kNaN;
    }
    const double mu = mean(values);
    double sq = 0.0;
    for (double v : values) {
        const double d = v - mu;
        sq += d * d;
    }
    return std::sqrt(sq / static_cast<double>(values.size() - ddof));
}

auto quantile(std::span<const double> values, double q) -> double {
    if (values.empty() || !(q >= 0.0 && q <= 1.0) || has_nan(values)) {
        return kNaN;
    }
    std::vector<double> sorted(values.begin(), values.end());
    std::ranges::sort(sorted);
    const double pos = q * static_cast<double>(sorted.size() - 1);
    const auto lo = static_cast<std::size_t>(std::floor(pos));
    const double frac = pos - static_cast<double>(lo);
    if (lo + 1 < sorted.size()) {
        return sorted[lo] + (sorted[lo + 1] - sorted[lo]) * frac;
    }
    return sorted[lo];
}

auto min(std::span<const double> values) -> double {
    if (values.empty() || has_nan(values)) {
        return kNaN;
    }
    return std::ranges::min(values);
}

auto max(std::span<const double> values) -> double {
    if (values.empty() || has_nan(values)) {
        return kNaN;
    }
    return std::ranges::max(values);
}

}  // namespace sieve::stats
