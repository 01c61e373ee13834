#include "uule/uulev1.hpp"
#include "uule/uule_constants.hpp"
#include "uule/decode_error.hpp"
#include "base64url.hpp"
#include "uule_utils.hpp"
#include <array>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace uule {

namespace {
    // Protobuf tags: (field_number << 3) | wire_type
    constexpr std::uint8_t ROLE_TAG = (1 << 3) | 0;      // 0x08, varint
    constexpr std::uint8_t PRODUCER_TAG = (2 << 3) | 0;  // 0x10, varint
    constexpr std::uint8_t NAME_TAG = (4 << 3) | 2;      // 0x22, length-delimited

    // Wire order of the fields, also used as index into the "seen" table
    constexpr std::array<std::uint8_t, 3> FIELD_TAGS = {ROLE_TAG, PRODUCER_TAG, NAME_TAG};
    constexpr std::array<const char*, 3> FIELD_NAMES = {"role", "producer", "canonical_name"};

    std::string hexTag(std::uint64_t tag) {
        std::ostringstream oss;
        oss << "0x" << std::hex << std::setw(2) << std::setfill('0') << tag;
        return oss.str();
    }

    std::uint32_t readByteField(std::span<const std::uint8_t> bytes, std::size_t& pos,
                                const char* field) {
        std::uint64_t value = internal::readVarint(bytes, pos, field);
        if (value > MAX_UULEV1_FIELD_VALUE) {
            throw DecodeError(DecodeErrorKind::MalformedField,
                std::string("Field '") + field + "' out of range: " + std::to_string(value));
        }
        return static_cast<std::uint32_t>(value);
    }

    std::string readName(std::span<const std::uint8_t> bytes, std::size_t& pos) {
        std::uint64_t len = internal::readVarint(bytes, pos, "canonical_name");
        if (len > MAX_CANONICAL_NAME_BYTES) {
            throw DecodeError(DecodeErrorKind::MalformedField,
                "Canonical name too long: " + std::to_string(len) + " bytes");
        }
        if (len > bytes.size() - pos) {
            throw DecodeError(DecodeErrorKind::MalformedField,
                "Canonical name length " + std::to_string(len) + " overruns buffer (" +
                std::to_string(bytes.size() - pos) + " bytes left)");
        }

        std::string name(reinterpret_cast<const char*>(bytes.data() + pos),
                         static_cast<std::size_t>(len));
        pos += static_cast<std::size_t>(len);

        if (!internal::isValidUtf8(name)) {
            throw DecodeError(DecodeErrorKind::MalformedField, "Canonical name is not valid UTF-8");
        }
        return name;
    }
}

Uulev1Data Uulev1Data::forPlace(const std::string& canonicalName) {
    return Uulev1Data{UULEV1_ROLE, UULEV1_PRODUCER, canonicalName};
}

void Uulev1Data::validate() const {
    if (role > MAX_UULEV1_FIELD_VALUE) {
        throw std::invalid_argument("UULEv1 role must fit in one byte, got " + std::to_string(role));
    }
    if (producer > MAX_UULEV1_FIELD_VALUE) {
        throw std::invalid_argument("UULEv1 producer must fit in one byte, got " + std::to_string(producer));
    }
    if (canonical_name.size() > MAX_CANONICAL_NAME_BYTES) {
        throw std::invalid_argument(
            "UULEv1 canonical name exceeds " + std::to_string(MAX_CANONICAL_NAME_BYTES) +
            " bytes (" + std::to_string(canonical_name.size()) + ")");
    }
    if (!internal::isValidUtf8(canonical_name)) {
        throw std::invalid_argument("UULEv1 canonical name must be valid UTF-8");
    }
}

std::string Uulev1Data::encode() const {
    using namespace internal;

    validate();

    std::vector<std::uint8_t> bytes;
    bytes.reserve(8 + canonical_name.size());

    bytes.push_back(ROLE_TAG);
    appendVarint(bytes, role);
    bytes.push_back(PRODUCER_TAG);
    appendVarint(bytes, producer);
    bytes.push_back(NAME_TAG);
    appendVarint(bytes, canonical_name.size());

    auto name_bytes = asBytes(canonical_name);
    bytes.insert(bytes.end(), name_bytes.begin(), name_bytes.end());

    return std::string(UULEV1_PREFIX) + base64url_encode(bytes);
}

Uulev1Data Uulev1Data::decode(std::string_view token, const DecodeOptions& opts) {
    using namespace internal;

    std::string_view payload = stripPrefix(token, UULEV1_PREFIX, opts);
    std::vector<std::uint8_t> bytes = base64url_decode(payload);
    std::span<const std::uint8_t> view(bytes);

    Uulev1Data data;
    std::array<bool, FIELD_TAGS.size()> seen{};
    std::size_t fields_read = 0;
    std::size_t pos = 0;

    while (pos < view.size()) {
        std::size_t tag_offset = pos;
        std::uint64_t tag = readVarint(view, pos, "tag");

        std::size_t index = 0;
        while (index < FIELD_TAGS.size() && FIELD_TAGS[index] != tag) {
            ++index;
        }
        if (index == FIELD_TAGS.size()) {
            throw DecodeError(DecodeErrorKind::MalformedField,
                "Unexpected tag " + hexTag(tag) + " at offset " + std::to_string(tag_offset));
        }
        if (seen[index]) {
            throw DecodeError(DecodeErrorKind::MalformedField,
                std::string("Duplicate field '") + FIELD_NAMES[index] + "'");
        }
        if (opts.strictFieldOrder && index != fields_read) {
            throw DecodeError(DecodeErrorKind::MalformedField,
                std::string("Field '") + FIELD_NAMES[index] + "' out of order, expected '" +
                FIELD_NAMES[fields_read] + "'");
        }

        switch (tag) {
            case ROLE_TAG:
                data.role = readByteField(view, pos, "role");
                break;
            case PRODUCER_TAG:
                data.producer = readByteField(view, pos, "producer");
                break;
            case NAME_TAG:
                data.canonical_name = readName(view, pos);
                break;
        }

        seen[index] = true;
        ++fields_read;
    }

    for (std::size_t i = 0; i < seen.size(); ++i) {
        if (!seen[i]) {
            throw DecodeError(DecodeErrorKind::MalformedField,
                std::string("Missing field '") + FIELD_NAMES[i] + "'");
        }
    }

    return data;
}

} // namespace uule
