#include "formula/error.hpp"

namespace formula {

const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::ParseError:        return "PARSE_ERROR";
        case ErrorCode::UnknownFunction:   return "UNKNOWN_FUNCTION";
        case ErrorCode::InvalidArguments:  return "INVALID_ARGUMENTS";
        case ErrorCode::UnknownReference:  return "UNKNOWN_REFERENCE";
        case ErrorCode::DivisionByZero:    return "DIVISION_BY_ZERO";
        case ErrorCode::TypeError:         return "TYPE_ERROR";
        case ErrorCode::CircularReference: return "CIRCULAR_REFERENCE";
        case ErrorCode::AsyncError:        return "ASYNC_ERROR";
        case ErrorCode::Timeout:           return "TIMEOUT";
    }
    return "UNKNOWN";
}

} // namespace formula
