#pragma once
#include <stdexcept>
#include <string>
#include <string_view>

namespace uule {

/// Category of a decode failure
enum class DecodeErrorKind {
    InvalidPrefix,   // token does not start with "w+" / "a+"
    InvalidBase64,   // payload is not URL-safe base64
    MalformedField,  // a field value cannot be parsed or overruns the buffer
    MissingField,    // a required UULEv2 key is absent
    UnknownField,    // a UULEv2 line carries an unrecognized key
    StructureError   // latlng block or field order is broken
};

/// Name of an error kind, e.g. "MalformedField"
[[nodiscard]] std::string_view toString(DecodeErrorKind kind);

/// Thrown by the decoders. Derives from std::invalid_argument so callers can
/// treat it like any other bad-input error.
class DecodeError : public std::invalid_argument {
public:
    DecodeError(DecodeErrorKind kind, const std::string& message);

    [[nodiscard]] DecodeErrorKind kind() const noexcept { return kind_; }

private:
    DecodeErrorKind kind_;
};

} // namespace uule
