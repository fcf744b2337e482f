#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <string_view>

namespace sieve {

enum class ErrorKind : std::uint8_t {
    /// A named column does not exist in the table.
    ColumnNotFound,
    /// A column or sequence has the wrong logical type or shape for the operation.
    TypeMismatch,
    /// A parameter has the right type but a value the algorithm cannot use.
    InvalidParameter,
};

/// Error returned by every table and sequence operation.
struct Error {
    ErrorKind kind = ErrorKind::InvalidParameter;
    std::string message;

    [[nodiscard]] auto format() const -> std::string;
};

template <typename T>
using Result = std::expected<T, Error>;

[[nodiscard]] auto to_string(ErrorKind kind) -> std::string_view;

[[nodiscard]] auto column_not_found(std::string_view op, std::string_view column) -> Error;
[[nodiscard]] auto type_mismatch(std::string_view op, std::string message) -> Error;
[[nodiscard]] auto invalid_parameter(std::string_view op, std::string message) -> Error;

}  // namespace sieve
