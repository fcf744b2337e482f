#include <sieve/core/error.hpp>

#include <fmt/format.h>

namespace sieve {

auto to_string(ErrorKind kind) -> std::string_view {
    switch (kind) {
        case ErrorKind::ColumnNotFound:
            return "column not found";
        case ErrorKind::TypeMismatch:
            return "type mismatch";
        case ErrorKind::InvalidParameter:
            return "invalid parameter";
    }
    return "unknown error";
}

auto Error::format() const -> std::string {
    return fmt::format("{}: {}", to_string(kind), message);
}

auto column_not_found(std::string_view op, std::string_view column) -> Error {
    return Error{.kind = ErrorKind::ColumnNotFound,
                 .message = fmt::format("{}: column not found: {}", op, column)};
}

auto type_mismatch(std::string_view op, std::string message) -> Error {
    return Error{.kind = ErrorKind::TypeMismatch, .message = fmt::format("{}: {}", op, message)};
}

auto invalid_parameter(std::string_view op, std::string message) -> Error {
    return Error{.kind = ErrorKind::InvalidParameter,
                 .message = fmt::format("{}: {}", op, message)};
}

}  // namespace sieve
