#pragma once
#include <cstddef>
#include <cstdint>

namespace uule {

// Token prefixes
inline constexpr const char* UULEV1_PREFIX = "w+";
inline constexpr const char* UULEV2_PREFIX = "a+";

// Default role and producer for a UULEv1 place lookup
inline constexpr std::uint32_t UULEV1_ROLE = 2;
inline constexpr std::uint32_t UULEV1_PRODUCER = 32;

// Default role and producer for UULEv2
inline constexpr std::int32_t USER_SPECIFIED_FOR_REQUEST = 1;
inline constexpr std::int32_t LOGGED_IN_USER_SPECIFIED = 12;

// Radius value meaning "unspecified"
inline constexpr std::int32_t UNSPECIFIED_RADIUS = -1;

// UULEv1 wire limits: role/producer fit one byte, name length fits one byte
inline constexpr std::uint32_t MAX_UULEV1_FIELD_VALUE = 0xFF;
inline constexpr std::size_t MAX_CANONICAL_NAME_BYTES = 255;

// Coordinates travel as degrees * 10^7
inline constexpr double E7_SCALE = 10'000'000.0;

// Valid coordinate ranges in degrees
inline constexpr double MAX_LATITUDE = 90.0;
inline constexpr double MAX_LONGITUDE = 180.0;

} // namespace uule
