#include "OrderingError.hpp"

namespace ordering {

std::string errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::UNSUPPORTED_COLUMN_TYPE:   return "UnsupportedColumnType";
        case ErrorCode::EMPTY_ORDER_SPEC:          return "EmptyOrderSpec";
        case ErrorCode::UNKNOWN_COLUMN_REFERENCE:  return "UnknownColumnReference";
        case ErrorCode::LOCALE_UNAVAILABLE:        return "LocaleUnavailable";
        case ErrorCode::INVALID_LOCALE_IDENTIFIER: return "InvalidLocaleIdentifier";
    }
    return "Unknown";
}

} // namespace ordering
