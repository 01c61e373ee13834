#include "uule/uulev2.hpp"
#include "uule/decode_error.hpp"
#include "uule/latlong.hpp"
#include "base64url.hpp"
#include "uule_utils.hpp"
#include <array>
#include <charconv>
#include <cmath>
#include <limits>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace uule {

namespace {
    constexpr std::string_view BLOCK_OPEN = "latlng{";
    constexpr std::string_view BLOCK_CLOSE = "}";

    enum Key : std::size_t {
        ROLE, PRODUCER, PROVENANCE, TIMESTAMP, LATITUDE_E7, LONGITUDE_E7, RADIUS, KEY_COUNT
    };

    struct KeySpec {
        std::string_view name;
        bool inBlock;        // Lives inside latlng{ }
        bool wide;           // 64-bit field, otherwise 32-bit
    };

    constexpr std::array<KeySpec, KEY_COUNT> KEYS = {{
        {"role", false, false},
        {"producer", false, false},
        {"provenance", false, false},
        {"timestamp", false, true},
        {"latitude_e7", true, true},
        {"longitude_e7", true, true},
        {"radius", false, false},
    }};

    // One entry per line of the encoded text, in encoder order.
    // Block markers are represented by KEY_COUNT (open) and KEY_COUNT + 1 (close).
    constexpr std::size_t OPEN_SLOT = KEY_COUNT;
    constexpr std::size_t CLOSE_SLOT = KEY_COUNT + 1;
    constexpr std::array<std::size_t, KEY_COUNT + 2> LINE_ORDER = {
        ROLE, PRODUCER, PROVENANCE, TIMESTAMP, OPEN_SLOT, LATITUDE_E7, LONGITUDE_E7, CLOSE_SLOT, RADIUS
    };

    std::string slotName(std::size_t slot) {
        if (slot == OPEN_SLOT) return std::string(BLOCK_OPEN);
        if (slot == CLOSE_SLOT) return std::string(BLOCK_CLOSE);
        return std::string(KEYS[slot].name);
    }

    std::optional<std::size_t> findKey(std::string_view name) {
        for (std::size_t i = 0; i < KEYS.size(); ++i) {
            if (KEYS[i].name == name) return i;
        }
        return std::nullopt;
    }

    std::int64_t parseValue(std::string_view value, const KeySpec& key) {
        std::int64_t result = 0;
        const char* first = value.data();
        const char* last = value.data() + value.size();
        auto [ptr, ec] = std::from_chars(first, last, result);

        if (value.empty() || ec != std::errc() || ptr != last) {
            throw DecodeError(DecodeErrorKind::MalformedField,
                "Invalid integer value for '" + std::string(key.name) + "': '" + std::string(value) + "'");
        }
        if (!key.wide && (result < std::numeric_limits<std::int32_t>::min() ||
                          result > std::numeric_limits<std::int32_t>::max())) {
            throw DecodeError(DecodeErrorKind::MalformedField,
                "Value for '" + std::string(key.name) + "' out of range: " + std::string(value));
        }
        return result;
    }

    void checkCoordinateRange(std::int64_t e7, double maxDegrees, std::string_view name) {
        auto limit = static_cast<std::int64_t>(maxDegrees * E7_SCALE);
        if (e7 < -limit || e7 > limit) {
            throw DecodeError(DecodeErrorKind::MalformedField,
                "Value for '" + std::string(name) + "' out of range: " + std::to_string(e7));
        }
    }

    // Values that have no e7 form (NaN, infinities, huge magnitudes) compare as plain doubles
    bool sameCoordinate(double a, double b) {
        auto representable = [](double v) { return std::isfinite(v) && std::fabs(v) <= 2 * MAX_LONGITUDE; };
        if (!representable(a) || !representable(b)) {
            return a == b;
        }
        return latlongToE7(a) == latlongToE7(b);
    }

    /// Split on '\n', dropping a trailing '\r' per line and one trailing newline
    std::vector<std::string_view> splitLines(std::string_view text) {
        std::vector<std::string_view> lines;
        if (text.ends_with('\n')) {
            text.remove_suffix(1);
        }
        if (text.empty()) {
            return lines;
        }

        std::size_t start = 0;
        while (true) {
            std::size_t end = text.find('\n', start);
            std::string_view line = text.substr(start, end == std::string_view::npos ? end : end - start);
            if (line.ends_with('\r')) {
                line.remove_suffix(1);
            }
            lines.push_back(line);
            if (end == std::string_view::npos) break;
            start = end + 1;
        }
        return lines;
    }
}

Uulev2Data Uulev2Data::defaults() {
    Uulev2Data data;
    data.timestamp = internal::getCurrentTimestampMicros();
    return data;
}

Uulev2Data Uulev2Data::forLocation(double lat, double lng, std::int32_t radius) {
    return defaults().withLat(lat).withLng(lng).withRadius(radius);
}

Uulev2Data Uulev2Data::withLat(double value) const {
    Uulev2Data copy = *this;
    copy.lat = value;
    return copy;
}

Uulev2Data Uulev2Data::withLng(double value) const {
    Uulev2Data copy = *this;
    copy.lng = value;
    return copy;
}

Uulev2Data Uulev2Data::withRadius(std::int32_t value) const {
    Uulev2Data copy = *this;
    copy.radius = value;
    return copy;
}

Uulev2Data Uulev2Data::withTimestamp(std::int64_t value) const {
    Uulev2Data copy = *this;
    copy.timestamp = value;
    return copy;
}

std::string Uulev2Data::toString() const {
    std::ostringstream oss;
    oss << "role:" << role << "\n"
        << "producer:" << producer << "\n"
        << "provenance:" << provenance << "\n"
        << "timestamp:" << timestamp << "\n"
        << BLOCK_OPEN << "\n"
        << "latitude_e7:" << latlongToE7(lat) << "\n"
        << "longitude_e7:" << latlongToE7(lng) << "\n"
        << BLOCK_CLOSE << "\n"
        << "radius:" << radius;
    return oss.str();
}

void Uulev2Data::validate() const {
    if (!std::isfinite(lat) || std::fabs(lat) > MAX_LATITUDE) {
        throw std::invalid_argument("UULEv2 latitude must be within [-90, 90], got " + std::to_string(lat));
    }
    if (!std::isfinite(lng) || std::fabs(lng) > MAX_LONGITUDE) {
        throw std::invalid_argument("UULEv2 longitude must be within [-180, 180], got " + std::to_string(lng));
    }
}

std::string Uulev2Data::encode() const {
    using namespace internal;

    validate();

    std::string text = toString();
    return std::string(UULEV2_PREFIX) + base64url_encode(asBytes(text));
}

Uulev2Data Uulev2Data::decode(std::string_view token, const DecodeOptions& opts) {
    using namespace internal;

    std::string_view payload = stripPrefix(token, UULEV2_PREFIX, opts);
    std::vector<std::uint8_t> bytes = base64url_decode(payload);
    std::string text(bytes.begin(), bytes.end());

    std::array<std::optional<std::int64_t>, KEY_COUNT> values;
    std::vector<std::size_t> order;
    bool in_block = false;
    bool block_opened = false;

    for (std::string_view line : splitLines(text)) {
        if (line == BLOCK_OPEN) {
            if (block_opened) {
                throw DecodeError(DecodeErrorKind::StructureError, "Duplicate or nested 'latlng{' block");
            }
            block_opened = in_block = true;
            order.push_back(OPEN_SLOT);
            continue;
        }
        if (line == BLOCK_CLOSE) {
            if (!in_block) {
                throw DecodeError(DecodeErrorKind::StructureError, "Unmatched '}'");
            }
            in_block = false;
            order.push_back(CLOSE_SLOT);
            continue;
        }
        if (line.empty()) {
            throw DecodeError(DecodeErrorKind::StructureError, "Unexpected blank line");
        }

        std::size_t colon = line.find(':');
        std::string_view name = line.substr(0, colon);
        auto key = findKey(name);
        if (!key) {
            throw DecodeError(DecodeErrorKind::UnknownField, "Unknown field '" + std::string(name) + "'");
        }
        if (colon == std::string_view::npos) {
            throw DecodeError(DecodeErrorKind::MalformedField, "Missing value for field '" + std::string(name) + "'");
        }

        const KeySpec& spec = KEYS[*key];
        if (spec.inBlock != in_block) {
            throw DecodeError(DecodeErrorKind::StructureError,
                "Field '" + std::string(name) + (spec.inBlock ? "' must be inside" : "' must be outside") +
                " the latlng block");
        }
        if (values[*key]) {
            throw DecodeError(DecodeErrorKind::StructureError, "Duplicate field '" + std::string(name) + "'");
        }

        values[*key] = parseValue(line.substr(colon + 1), spec);
        order.push_back(*key);
    }

    if (in_block) {
        throw DecodeError(DecodeErrorKind::StructureError, "Unterminated 'latlng{' block");
    }

    for (std::size_t slot : LINE_ORDER) {
        if (slot == OPEN_SLOT) {
            if (!block_opened) {
                throw DecodeError(DecodeErrorKind::StructureError, "Missing 'latlng{' block");
            }
        } else if (slot != CLOSE_SLOT && !values[slot]) {
            throw DecodeError(DecodeErrorKind::MissingField, "Missing field '" + slotName(slot) + "'");
        }
    }

    // Every key and both markers are present exactly once, so order matches LINE_ORDER in size
    if (opts.strictFieldOrder) {
        for (std::size_t i = 0; i < LINE_ORDER.size(); ++i) {
            if (order[i] != LINE_ORDER[i]) {
                throw DecodeError(DecodeErrorKind::StructureError,
                    "Field out of order at line " + std::to_string(i + 1) + ": expected '" +
                    slotName(LINE_ORDER[i]) + "', got '" + slotName(order[i]) + "'");
            }
        }
    }

    checkCoordinateRange(*values[LATITUDE_E7], MAX_LATITUDE, KEYS[LATITUDE_E7].name);
    checkCoordinateRange(*values[LONGITUDE_E7], MAX_LONGITUDE, KEYS[LONGITUDE_E7].name);

    Uulev2Data data;
    data.role = static_cast<std::int32_t>(*values[ROLE]);
    data.producer = static_cast<std::int32_t>(*values[PRODUCER]);
    data.provenance = static_cast<std::int32_t>(*values[PROVENANCE]);
    data.timestamp = *values[TIMESTAMP];
    data.lat = latlongFromE7(*values[LATITUDE_E7]);
    data.lng = latlongFromE7(*values[LONGITUDE_E7]);
    data.radius = static_cast<std::int32_t>(*values[RADIUS]);
    return data;
}

bool Uulev2Data::operator==(const Uulev2Data& other) const {
    return role == other.role &&
           producer == other.producer &&
           provenance == other.provenance &&
           timestamp == other.timestamp &&
           sameCoordinate(lat, other.lat) &&
           sameCoordinate(lng, other.lng) &&
           radius == other.radius;
}

} // namespace uule
