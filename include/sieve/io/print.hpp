#pragma once

#include <sieve/core/table.hpp>
#include <sieve/stats/array.hpp>

#include <iostream>
#include <string>

namespace sieve::io {

/// Render one cell for display; missing cells render as "null".
[[nodiscard]] auto format_cell(const ColumnEntry& entry, std::size_t row) -> std::string;

/// Print an aligned grid with the row labels as the leading column.
void print(const Table& table, std::ostream& out = std::cout);

/// Print one value per line.
void print(const stats::NdArray& array, std::ostream& out = std::cout);

}  // namespace sieve::io
