#pragma once
#include <cstdint>

namespace uule {

/// Convert degrees to the e7 integer form used on the wire
/// @param degrees Latitude or longitude, e.g. 37.4210000
/// @return degrees * 10^7, rounded half away from zero (374210000)
/// @throws std::invalid_argument if degrees is not finite or overflows int64 once scaled
[[nodiscard]] std::int64_t latlongToE7(double degrees);

/// Convert an e7 integer back to degrees
/// @param e7 Latitude or longitude times 10^7
/// @return e7 / 10^7
[[nodiscard]] double latlongFromE7(std::int64_t e7);

} // namespace uule
