#pragma once
#include "uule/decode_options.hpp"
#include "uule/uule_constants.hpp"
#include <cstdint>
#include <string>
#include <string_view>

namespace uule {

/// Data carried by a UULEv2 token.
///
/// Only lat, lng and radius are well understood. role and producer default to
/// USER_SPECIFIED_FOR_REQUEST and LOGGED_IN_USER_SPECIFIED; timestamp is in
/// microseconds since the Unix epoch; a radius of -1 means unspecified.
struct Uulev2Data {
    std::int32_t role = USER_SPECIFIED_FOR_REQUEST;
    std::int32_t producer = LOGGED_IN_USER_SPECIFIED;
    std::int32_t provenance = 0;
    std::int64_t timestamp = 0;
    double lat = 0.0;
    double lng = 0.0;
    std::int32_t radius = UNSPECIFIED_RADIUS;

    /// Default field values with the timestamp set to now
    [[nodiscard]] static Uulev2Data defaults();

    /// Defaults for a coordinate, timestamp set to now
    [[nodiscard]] static Uulev2Data forLocation(double lat, double lng,
                                                std::int32_t radius = UNSPECIFIED_RADIUS);

    [[nodiscard]] Uulev2Data withLat(double value) const;
    [[nodiscard]] Uulev2Data withLng(double value) const;
    [[nodiscard]] Uulev2Data withRadius(std::int32_t value) const;
    [[nodiscard]] Uulev2Data withTimestamp(std::int64_t value) const;

    /// Render the key:value text that gets base64 encoded (no trailing newline)
    [[nodiscard]] std::string toString() const;

    /// Encode to an "a+..." token
    /// @throws std::invalid_argument if lat or lng is not a valid coordinate
    [[nodiscard]] std::string encode() const;

    /// Decode an "a+..." token
    /// @throws DecodeError describing the first problem found
    [[nodiscard]] static Uulev2Data decode(std::string_view token,
                                           const DecodeOptions& opts = DecodeOptions::strict());

    /// Check that lat is finite within [-90, 90] and lng finite within [-180, 180]
    /// @throws std::invalid_argument on violation
    void validate() const;

    /// Field-wise equality; lat and lng compare as e7 integers
    bool operator==(const Uulev2Data& other) const;
};

} // namespace uule
