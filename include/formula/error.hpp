#pragma once
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

namespace formula {

enum class ErrorCode {
    ParseError,
    UnknownFunction,
    InvalidArguments,
    UnknownReference,
    DivisionByZero,
    TypeError,
    CircularReference,
    AsyncError,
    Timeout,
};

/// Upper-snake name of the code, e.g. "DIVISION_BY_ZERO".
const char* to_string(ErrorCode code);

struct FormulaError : std::runtime_error {
    FormulaError(std::string message, ErrorCode code, std::optional<std::size_t> position = std::nullopt)
        : std::runtime_error(std::move(message)), code(code), position(position) {}

    ErrorCode code;
    std::optional<std::size_t> position; // byte offset into the formula source
};

} // namespace formula
