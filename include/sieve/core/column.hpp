#pragma once

#include <concepts>
#include <cstddef>
#include <initializer_list>
#include <span>
#include <utility>
#include <vector>

namespace sieve {

/// Concept constraining valid column element types.
template <typename T>
concept ColumnElement = std::regular<T> && std::totally_ordered<T>;

/// A typed, owning columnar storage container.
///
/// Column<T> owns a contiguous vector of homogeneously typed values.
/// Copies are deep: two columns never share storage.
template <typename T>
class Column {
   public:
    using value_type = T;
    using size_type = std::size_t;

    static_assert(ColumnElement<T>,
                  "Column<T> requires T to satisfy ColumnElement (regular + totally ordered).");

    Column() = default;

    explicit Column(std::vector<T> data) : data_(std::move(data)) {}

    Column(std::initializer_list<T> init) : data_(init) {}

    [[nodiscard]] auto size() const noexcept -> size_type { return data_.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return data_.empty(); }

    /// Bounds-checked element access.
    [[nodiscard]] auto at(size_type idx) const -> const T& { return data_.at(idx); }
    [[nodiscard]] auto at(size_type idx) -> T& { return data_.at(idx); }

    /// Unchecked element access.
    [[nodiscard]] auto operator[](size_type idx) const noexcept -> const T& { return data_[idx]; }
    [[nodiscard]] auto operator[](size_type idx) noexcept -> T& { return data_[idx]; }

    /// Immutable view of the underlying data.
    [[nodiscard]] auto span() const noexcept -> std::span<const T> { return data_; }

    void push_back(const T& value) { data_.push_back(value); }
    void push_back(T&& value) { data_.push_back(std::move(value)); }

    void reserve(size_type capacity) { data_.reserve(capacity); }
    void resize(size_type count) { data_.resize(count); }

    [[nodiscard]] auto data() noexcept -> T* { return data_.data(); }
    [[nodiscard]] auto data() const noexcept -> const T* { return data_.data(); }

    /// Gather the elements at `positions`, in the order given.
    [[nodiscard]] auto take(std::span<const std::size_t> positions) const -> Column<T> {
        std::vector<T> result;
        result.reserve(positions.size());
        for (auto row : positions) {
            result.push_back(data_[row]);
        }
        return Column<T>{std::move(result)};
    }

    [[nodiscard]] auto operator==(const Column&) const -> bool = default;

    // Iterator support
    [[nodiscard]] auto begin() noexcept { return data_.begin(); }
    [[nodiscard]] auto end() noexcept { return data_.end(); }
    [[nodiscard]] auto begin() const noexcept { return data_.cbegin(); }
    [[nodiscard]] auto end() const noexcept { return data_.cend(); }

   private:
    std::vector<T> data_;
};

}  // namespace sieve
