#include "uule_utils.hpp"
#include "uule/decode_error.hpp"
#include <chrono>

namespace uule::internal {

namespace {
    // A 64-bit value needs at most 10 groups of 7 bits
    constexpr std::size_t MAX_VARINT_BYTES = 10;
}

std::int64_t getCurrentTimestampMicros() {
    using namespace std::chrono;
    return duration_cast<microseconds>(system_clock::now().time_since_epoch()).count();
}

std::span<const std::uint8_t> asBytes(std::string_view text) {
    return std::span<const std::uint8_t>(
        reinterpret_cast<const std::uint8_t*>(text.data()),
        text.size()
    );
}

std::string_view stripPrefix(std::string_view token, std::string_view prefix,
                             const DecodeOptions& opts) {
    if (token.starts_with(prefix)) {
        token.remove_prefix(prefix.size());
        return token;
    }
    if (opts.requirePrefix) {
        throw DecodeError(DecodeErrorKind::InvalidPrefix,
            "Invalid prefix: expected '" + std::string(prefix) + "', got '" +
            std::string(token.substr(0, prefix.size())) + "'");
    }
    return token;
}

void appendVarint(std::vector<std::uint8_t>& out, std::uint64_t value) {
    while (value >= 0x80) {
        out.push_back(static_cast<std::uint8_t>((value & 0x7F) | 0x80));
        value >>= 7;
    }
    out.push_back(static_cast<std::uint8_t>(value));
}

std::uint64_t readVarint(std::span<const std::uint8_t> bytes, std::size_t& pos,
                         std::string_view field) {
    std::uint64_t value = 0;
    for (std::size_t n = 0; n < MAX_VARINT_BYTES; ++n) {
        if (pos >= bytes.size()) {
            throw DecodeError(DecodeErrorKind::MalformedField,
                "Truncated varint in field '" + std::string(field) + "'");
        }
        std::uint8_t byte = bytes[pos++];
        // The 10th byte holds only bit 63
        if (n == MAX_VARINT_BYTES - 1 && byte > 1) {
            throw DecodeError(DecodeErrorKind::MalformedField,
                "Varint overflows 64 bits in field '" + std::string(field) + "'");
        }
        value |= static_cast<std::uint64_t>(byte & 0x7F) << (7 * n);
        if ((byte & 0x80) == 0) {
            // A zero final group after the first byte is an overlong encoding
            if (n > 0 && byte == 0) {
                throw DecodeError(DecodeErrorKind::MalformedField,
                    "Overlong varint in field '" + std::string(field) + "'");
            }
            return value;
        }
    }
    throw DecodeError(DecodeErrorKind::MalformedField,
        "Varint too long in field '" + std::string(field) + "'");
}

bool isValidUtf8(std::string_view text) {
    std::size_t i = 0;
    while (i < text.size()) {
        auto lead = static_cast<std::uint8_t>(text[i]);
        std::size_t len;
        std::uint32_t cp;
        if (lead < 0x80) {
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            len = 2;
            cp = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            len = 3;
            cp = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            len = 4;
            cp = lead & 0x07;
        } else {
            return false;
        }

        if (i + len > text.size()) {
            return false;
        }
        for (std::size_t k = 1; k < len; ++k) {
            auto cont = static_cast<std::uint8_t>(text[i + k]);
            if ((cont & 0xC0) != 0x80) {
                return false;
            }
            cp = (cp << 6) | (cont & 0x3F);
        }

        // Reject overlong forms, UTF-16 surrogates and out-of-range code points
        if ((len == 2 && cp < 0x80) || (len == 3 && cp < 0x800) || (len == 4 && cp < 0x10000) ||
            (cp >= 0xD800 && cp <= 0xDFFF) || cp > 0x10FFFF) {
            return false;
        }
        i += len;
    }
    return true;
}

}
