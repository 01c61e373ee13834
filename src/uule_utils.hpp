#pragma once

#include "uule/decode_options.hpp"
#include <string>
#include <string_view>
#include <cstdint>
#include <vector>
#include <span>

namespace uule::internal {

/// Get current Unix timestamp in microseconds
/// @return Microseconds since epoch
std::int64_t getCurrentTimestampMicros();

/// View the characters of a string as bytes
std::span<const std::uint8_t> asBytes(std::string_view text);

/// Split the version prefix off a token
/// @param token Token such as "w+CAIQ..."
/// @param prefix Expected prefix ("w+" or "a+")
/// @param opts When requirePrefix is false a bare payload is accepted
/// @return The base64 payload after the prefix
/// @throws DecodeError (InvalidPrefix) if the prefix is required and absent
std::string_view stripPrefix(std::string_view token, std::string_view prefix,
                             const DecodeOptions& opts);

/// Append a protobuf base-128 varint
void appendVarint(std::vector<std::uint8_t>& out, std::uint64_t value);

/// Read a protobuf base-128 varint starting at pos, advancing pos past it
/// @param field Field name used in the error message
/// @throws DecodeError (MalformedField) if truncated, longer than 10 bytes,
///         overflowing 64 bits or not in its shortest form
std::uint64_t readVarint(std::span<const std::uint8_t> bytes, std::size_t& pos,
                         std::string_view field);

/// Check that text is well-formed UTF-8 (no overlongs, surrogates or values past U+10FFFF)
bool isValidUtf8(std::string_view text);

}
