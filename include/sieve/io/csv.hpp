#pragma once

#include <sieve/core/table.hpp>

#include <expected>
#include <string>
#include <string_view>
#include <unordered_set>

namespace sieve::io {

struct CsvReadOptions {
    /// Treat empty cells as missing.
    bool null_if_empty = false;
    /// Literal cell values that mark a missing cell (e.g. "NA").
    std::unordered_set<std::string> null_tokens;
};

/// Parse a comma-separated null spec such as "<empty>,NA,null".
/// The token "<empty>" turns on null_if_empty.
[[nodiscard]] auto parse_null_spec(std::string_view spec) -> CsvReadOptions;

/// Read an RFC 4180 CSV file with a header row into a Table.
///
/// A column whose present cells all parse as integers becomes an int column,
/// one whose present cells all parse as numbers becomes a double column, and
/// anything else is text. Missing cells are recorded in the validity bitmap.
[[nodiscard]] auto read_csv(std::string_view path, const CsvReadOptions& options = {})
    -> std::expected<Table, std::string>;

}  // namespace sieve::io
