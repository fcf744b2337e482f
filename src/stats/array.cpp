#include <sieve/stats/array.hpp>

#include <fmt/format.h>

#include <functional>
#include <numeric>
#include <stdexcept>

namespace sieve::stats {

NdArray::NdArray(std::vector<size_type> shape, std::vector<double> values)
    : shape_(std::move(shape)), values_(std::move(values)) {
    const size_type expected =
        std::accumulate(shape_.begin(), shape_.end(), size_type{1}, std::multiplies<>{});
    if (expected != values_.size()) {
        throw std::invalid_argument(
            fmt::format("shape holds {} values, {} given", expected, values_.size()));
    }
}

auto NdArray::from_rows(const std::vector<std::vector<double>>& rows) -> NdArray {
    const size_type width = rows.empty() ? 0 : rows.front().size();
    std::vector<double> values;
    values.reserve(rows.size() * width);
    for (std::size_t r = 0; r < rows.size(); ++r) {
        if (rows[r].size() != width) {
            throw std::invalid_argument(
                fmt::format("ragged rows: row {} has {} values, expected {}", r, rows[r].size(),
                            width));
        }
        values.insert(values.end(), rows[r].begin(), rows[r].end());
    }
    return NdArray(std::vector<size_type>{rows.size(), width}, std::move(values));
}

}  // namespace sieve::stats
