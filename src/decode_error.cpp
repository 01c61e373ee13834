#include "uule/decode_error.hpp"

namespace uule {

std::string_view toString(DecodeErrorKind kind) {
    switch (kind) {
        case DecodeErrorKind::InvalidPrefix: return "InvalidPrefix";
        case DecodeErrorKind::InvalidBase64: return "InvalidBase64";
        case DecodeErrorKind::MalformedField: return "MalformedField";
        case DecodeErrorKind::MissingField: return "MissingField";
        case DecodeErrorKind::UnknownField: return "UnknownField";
        case DecodeErrorKind::StructureError: return "StructureError";
    }
    return "Unknown";
}

DecodeError::DecodeError(DecodeErrorKind kind, const std::string& message)
    : std::invalid_argument(message), kind_(kind) {}

} // namespace uule
