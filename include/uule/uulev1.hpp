#pragma once
#include "uule/decode_options.hpp"
#include <cstdint>
#include <string>
#include <string_view>

namespace uule {

/// Data carried by a UULEv1 token: a canonical place name plus the role and
/// producer that describe how the location was chosen.
struct Uulev1Data {
    std::uint32_t role = 0;
    std::uint32_t producer = 0;
    std::string canonical_name;

    /// Build a place lookup with the default role (2) and producer (32)
    [[nodiscard]] static Uulev1Data forPlace(const std::string& canonicalName);

    /// Encode to a "w+..." token
    /// @throws std::invalid_argument if a field does not fit the wire format
    [[nodiscard]] std::string encode() const;

    /// Decode a "w+..." token
    /// @throws DecodeError describing the first problem found
    [[nodiscard]] static Uulev1Data decode(std::string_view token,
                                           const DecodeOptions& opts = DecodeOptions::strict());

    /// Check that role/producer fit one byte and the name is UTF-8 of at most 255 bytes
    /// @throws std::invalid_argument on violation
    void validate() const;

    bool operator==(const Uulev1Data& other) const = default;
};

} // namespace uule
