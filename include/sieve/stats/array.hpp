#pragma once

#include <cstddef>
#include <initializer_list>
#include <span>
#include <vector>

namespace sieve::stats {

/// Row-major array of doubles with an explicit shape.
///
/// The sequence statistics only accept one-dimensional arrays; the shape is
/// kept so that nested input can be represented and rejected.
class NdArray {
   public:
    using value_type = double;
    using size_type = std::size_t;

    NdArray() : shape_{0} {}

    NdArray(std::initializer_list<double> init) : shape_{init.size()}, values_(init) {}

    /// One-dimensional array over `values`.
    explicit NdArray(std::vector<double> values)
        : shape_{values.size()}, values_(std::move(values)) {}

    /// Array of the given shape. Throws std::invalid_argument if the product
    /// of `shape` differs from `values.size()`.
    NdArray(std::vector<size_type> shape, std::vector<double> values);

    /// Two-dimensional array from nested rows. Throws std::invalid_argument
    /// if the rows are ragged.
    [[nodiscard]] static auto from_rows(const std::vector<std::vector<double>>& rows) -> NdArray;

    [[nodiscard]] auto ndim() const noexcept -> size_type { return shape_.size(); }
    [[nodiscard]] auto shape() const noexcept -> const std::vector<size_type>& { return shape_; }
    [[nodiscard]] auto size() const noexcept -> size_type { return values_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return values_.empty(); }

    [[nodiscard]] auto operator[](size_type idx) const noexcept -> double { return values_[idx]; }
    [[nodiscard]] auto at(size_type idx) const -> double { return values_.at(idx); }

    [[nodiscard]] auto span() const noexcept -> std::span<const double> { return values_; }

    [[nodiscard]] auto begin() const noexcept { return values_.cbegin(); }
    [[nodiscard]] auto end() const noexcept { return values_.cend(); }

    [[nodiscard]] auto operator==(const NdArray&) const -> bool = default;

   private:
    std::vector<size_type> shape_;
    std::vector<double> values_;
};

}  // namespace sieve::stats
