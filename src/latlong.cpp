#include "uule/latlong.hpp"
#include "uule/uule_constants.hpp"
#include <cmath>
#include <stdexcept>
#include <string>

namespace uule {

namespace {
    // Scaled magnitudes above this do not fit an int64
    constexpr double MAX_E7_MAGNITUDE = 9.0e18;
}

std::int64_t latlongToE7(double degrees) {
    double scaled = degrees * E7_SCALE;
    if (!std::isfinite(scaled) || std::fabs(scaled) > MAX_E7_MAGNITUDE) {
        throw std::invalid_argument("Coordinate cannot be expressed as e7 integer: " + std::to_string(degrees));
    }
    return std::llround(scaled);
}

double latlongFromE7(std::int64_t e7) {
    return static_cast<double>(e7) / E7_SCALE;
}

} // namespace uule
