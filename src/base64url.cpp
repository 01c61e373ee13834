#include "base64url.hpp"
#include "uule/decode_error.hpp"
#include <array>

namespace uule {
namespace internal {

namespace {
    // Base64 URL alphabet (RFC 4648): differs from standard in chars 62 and 63
    constexpr char alphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

    constexpr std::uint8_t INVALID = 0xFF;

    // Maps ASCII value to 6-bit value. '=' is only legal as trailing padding,
    // which is stripped before lookup, so it maps to INVALID here.
    constexpr std::array<std::uint8_t, 256> createDecodeLookup() {
        std::array<std::uint8_t, 256> lookup{};
        for (auto& val : lookup) val = INVALID;

        for (std::uint8_t i = 0; i < 64; ++i) {
            lookup[static_cast<std::uint8_t>(alphabet[i])] = i;
        }

        return lookup;
    }

    constexpr auto decode_lookup = createDecodeLookup();

    std::uint8_t sextet(char c, std::size_t pos) {
        std::uint8_t v = decode_lookup[static_cast<std::uint8_t>(c)];
        if (v == INVALID) {
            throw DecodeError(DecodeErrorKind::InvalidBase64,
                "Invalid Base64 URL character at position " + std::to_string(pos));
        }
        return v;
    }
}

std::string base64url_encode(std::span<const std::uint8_t> data) {
    if (data.empty()) {
        return "";
    }

    std::string result;
    result.reserve((data.size() * 4 + 2) / 3);

    size_t i = 0;
    while (i + 2 < data.size()) {
        std::uint32_t triple = (static_cast<std::uint32_t>(data[i]) << 16) |
                                (static_cast<std::uint32_t>(data[i + 1]) << 8) |
                                 static_cast<std::uint32_t>(data[i + 2]);

        result.push_back(alphabet[(triple >> 18) & 0x3F]);
        result.push_back(alphabet[(triple >> 12) & 0x3F]);
        result.push_back(alphabet[(triple >> 6) & 0x3F]);
        result.push_back(alphabet[triple & 0x3F]);

        i += 3;
    }

    // 1 byte left -> 2 chars, 2 bytes left -> 3 chars, never padded
    if (i < data.size()) {
        std::uint32_t remaining = static_cast<std::uint32_t>(data[i]) << 16;
        if (i + 1 < data.size()) {
            remaining |= static_cast<std::uint32_t>(data[i + 1]) << 8;
        }

        result.push_back(alphabet[(remaining >> 18) & 0x3F]);
        result.push_back(alphabet[(remaining >> 12) & 0x3F]);
        if (i + 1 < data.size()) {
            result.push_back(alphabet[(remaining >> 6) & 0x3F]);
        }
    }

    return result;
}

std::vector<std::uint8_t> base64url_decode(std::string_view input) {
    // Padding is optional, but when present it must complete a 4-char group
    const std::size_t padded_size = input.size();
    std::size_t padding = 0;
    while (!input.empty() && input.back() == '=') {
        input.remove_suffix(1);
        ++padding;
    }
    if (padding > 2 || (padding > 0 && padded_size % 4 != 0)) {
        throw DecodeError(DecodeErrorKind::InvalidBase64, "Invalid Base64 URL padding");
    }

    if (input.empty()) {
        return {};
    }

    std::vector<std::uint8_t> result;
    result.reserve((input.size() * 3) / 4 + 1);

    size_t i = 0;
    while (i + 3 < input.size()) {
        std::uint32_t quad = (static_cast<std::uint32_t>(sextet(input[i], i)) << 18) |
                             (static_cast<std::uint32_t>(sextet(input[i + 1], i + 1)) << 12) |
                             (static_cast<std::uint32_t>(sextet(input[i + 2], i + 2)) << 6) |
                              static_cast<std::uint32_t>(sextet(input[i + 3], i + 3));

        result.push_back(static_cast<std::uint8_t>((quad >> 16) & 0xFF));
        result.push_back(static_cast<std::uint8_t>((quad >> 8) & 0xFF));
        result.push_back(static_cast<std::uint8_t>(quad & 0xFF));

        i += 4;
    }

    size_t remaining = input.size() - i;
    if (remaining > 0) {
        if (remaining == 1) {
            throw DecodeError(DecodeErrorKind::InvalidBase64, "Invalid Base64 URL input length");
        }

        std::uint8_t a = sextet(input[i], i);
        std::uint8_t b = sextet(input[i + 1], i + 1);
        std::uint8_t c = (remaining == 3) ? sextet(input[i + 2], i + 2) : 0;

        // Bits past the last whole byte must be zero, otherwise two tokens map to the same bytes
        std::uint8_t last = (remaining == 3) ? c : b;
        std::uint8_t unused_mask = (remaining == 3) ? 0x03 : 0x0F;
        if ((last & unused_mask) != 0) {
            throw DecodeError(DecodeErrorKind::InvalidBase64,
                "Invalid Base64 URL last symbol at position " + std::to_string(input.size() - 1));
        }

        std::uint32_t partial = (static_cast<std::uint32_t>(a) << 18) |
                                (static_cast<std::uint32_t>(b) << 12) |
                                (static_cast<std::uint32_t>(c) << 6);

        result.push_back(static_cast<std::uint8_t>((partial >> 16) & 0xFF));

        if (remaining == 3) {
            result.push_back(static_cast<std::uint8_t>((partial >> 8) & 0xFF));
        }
    }

    return result;
}

} // namespace internal
} // namespace uule
