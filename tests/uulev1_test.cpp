#include <gtest/gtest.h>
#include "uule/uule.hpp"
#include "../src/base64url.hpp"
#include <string>
#include <vector>

namespace {

const std::string QUEENS = "Queens County,New York,United States";
const std::string QUEENS_TOKEN = "w+CAIQICIkUXVlZW5zIENvdW50eSxOZXcgWW9yayxVbml0ZWQgU3RhdGVz";

// Build a token from raw wire bytes
std::string tokenFor(const std::vector<std::uint8_t>& bytes) {
    return "w+" + uule::internal::base64url_encode(bytes);
}

uule::DecodeErrorKind decodeErrorKind(const std::string& token,
                                      const uule::DecodeOptions& opts = uule::DecodeOptions::strict()) {
    try {
        (void)uule::Uulev1Data::decode(token, opts);
    } catch (const uule::DecodeError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "Expected DecodeError for " << token;
    return uule::DecodeErrorKind::MalformedField;
}

}

// ============================================================================
// Construction and Encoding
// ============================================================================

TEST(Uulev1Test, ForPlaceUsesDefaults) {
    auto data = uule::Uulev1Data::forPlace(QUEENS);
    EXPECT_EQ(data.role, 2u);
    EXPECT_EQ(data.producer, 32u);
    EXPECT_EQ(data.canonical_name, QUEENS);
}

TEST(Uulev1Test, EncodeQueensCounty) {
    uule::Uulev1Data data{2, 32, QUEENS};
    EXPECT_EQ(data.encode(), QUEENS_TOKEN);
    EXPECT_EQ(uule::Uulev1Data::forPlace(QUEENS).encode(), QUEENS_TOKEN);
}

TEST(Uulev1Test, EncodeWritesProtobufFields) {
    uule::Uulev1Data data{2, 32, "X"};
    auto payload = uule::internal::base64url_decode(data.encode().substr(2));
    std::vector<std::uint8_t> expected = {0x08, 2, 0x10, 32, 0x22, 1, 'X'};
    EXPECT_EQ(payload, expected);
}

TEST(Uulev1Test, EncodeUsesVarintsAbove127) {
    uule::Uulev1Data data{200, 255, ""};
    EXPECT_EQ(data.encode(), "w+CMgBEP8BIgA");
}

TEST(Uulev1Test, ValidateRejectsOutOfRangeValues) {
    EXPECT_THROW((uule::Uulev1Data{256, 32, QUEENS}.validate()), std::invalid_argument);
    EXPECT_THROW((uule::Uulev1Data{2, 1000, QUEENS}.validate()), std::invalid_argument);
    EXPECT_THROW((void)(uule::Uulev1Data{256, 32, QUEENS}.encode()), std::invalid_argument);
}

TEST(Uulev1Test, ValidateRejectsLongName) {
    uule::Uulev1Data ok{2, 32, std::string(255, 'a')};
    EXPECT_NO_THROW(ok.validate());

    uule::Uulev1Data tooLong{2, 32, std::string(256, 'a')};
    EXPECT_THROW(tooLong.validate(), std::invalid_argument);
}

TEST(Uulev1Test, ValidateRejectsInvalidUtf8) {
    uule::Uulev1Data data{2, 32, std::string("Caf\xC3", 4)};
    EXPECT_THROW(data.validate(), std::invalid_argument);
}

// ============================================================================
// Decoding
// ============================================================================

TEST(Uulev1Test, DecodeQueensCounty) {
    auto data = uule::Uulev1Data::decode(QUEENS_TOKEN);
    EXPECT_EQ(data, (uule::Uulev1Data{2, 32, QUEENS}));
}

TEST(Uulev1Test, RoundTripBoundaryValues) {
    std::vector<uule::Uulev1Data> values = {
        {0, 0, ""},
        {127, 128, "Z\xC3\xBCrich,Z\xC3\xBCrich,Switzerland"},
        {255, 255, std::string(255, 'n')},
        {2, 32, "\xE6\x9D\xB1\xE4\xBA\xAC\xE9\x83\xBD,Japan"},
    };
    for (const auto& original : values) {
        EXPECT_EQ(uule::Uulev1Data::decode(original.encode()), original) << original.canonical_name;
    }
}

TEST(Uulev1Test, DecodeRequiresPrefix) {
    EXPECT_EQ(decodeErrorKind("asdf"), uule::DecodeErrorKind::InvalidPrefix);
    EXPECT_EQ(decodeErrorKind(QUEENS_TOKEN.substr(2)), uule::DecodeErrorKind::InvalidPrefix);
    EXPECT_EQ(decodeErrorKind("a+CAIQICIA"), uule::DecodeErrorKind::InvalidPrefix);
}

TEST(Uulev1Test, LenientDecodeAcceptsBarePayload) {
    auto opts = uule::DecodeOptions::lenient();
    EXPECT_EQ(uule::Uulev1Data::decode(QUEENS_TOKEN.substr(2), opts), uule::Uulev1Data::forPlace(QUEENS));
    EXPECT_EQ(uule::Uulev1Data::decode(QUEENS_TOKEN, opts), uule::Uulev1Data::forPlace(QUEENS));
}

TEST(Uulev1Test, DecodeRejectsInvalidBase64) {
    // Trailing whitespace is outside the alphabet
    EXPECT_EQ(decodeErrorKind(QUEENS_TOKEN + " "), uule::DecodeErrorKind::InvalidBase64);
    EXPECT_EQ(decodeErrorKind("w+!!!!"), uule::DecodeErrorKind::InvalidBase64);
    EXPECT_EQ(decodeErrorKind("w+C"), uule::DecodeErrorKind::InvalidBase64);
}

TEST(Uulev1Test, DecodeRejectsOverrunningName) {
    // Length says 10, only 3 bytes follow
    auto token = tokenFor({0x08, 2, 0x10, 32, 0x22, 10, 'a', 'b', 'c'});
    EXPECT_EQ(decodeErrorKind(token), uule::DecodeErrorKind::MalformedField);
}

TEST(Uulev1Test, DecodeRejectsTruncatedInput) {
    EXPECT_EQ(decodeErrorKind(tokenFor({0x08})), uule::DecodeErrorKind::MalformedField);
    EXPECT_EQ(decodeErrorKind(tokenFor({0x08, 0x80})), uule::DecodeErrorKind::MalformedField);
    EXPECT_EQ(decodeErrorKind(tokenFor({0x08, 2, 0x10, 32, 0x22})), uule::DecodeErrorKind::MalformedField);
}

TEST(Uulev1Test, DecodeRejectsMissingField) {
    EXPECT_EQ(decodeErrorKind(tokenFor({0x08, 2, 0x10, 32})), uule::DecodeErrorKind::MalformedField);
    EXPECT_EQ(decodeErrorKind("w+"), uule::DecodeErrorKind::MalformedField);
}

TEST(Uulev1Test, DecodeRejectsUnknownTag) {
    EXPECT_EQ(decodeErrorKind(tokenFor({0x18, 2})), uule::DecodeErrorKind::MalformedField);
}

TEST(Uulev1Test, DecodeRejectsTrailingBytes) {
    auto token = tokenFor({0x08, 2, 0x10, 32, 0x22, 1, 'X', 0x08});
    EXPECT_EQ(decodeErrorKind(token), uule::DecodeErrorKind::MalformedField);
}

TEST(Uulev1Test, DecodeRejectsOutOfRangeRole) {
    // Role varint 0x80 0x02 = 256
    auto token = tokenFor({0x08, 0x80, 0x02, 0x10, 32, 0x22, 0});
    EXPECT_EQ(decodeErrorKind(token), uule::DecodeErrorKind::MalformedField);
}

TEST(Uulev1Test, DecodeRejectsOversizedVarint) {
    std::vector<std::uint8_t> bytes = {0x08};
    bytes.insert(bytes.end(), 11, 0xFF);
    EXPECT_EQ(decodeErrorKind(tokenFor(bytes)), uule::DecodeErrorKind::MalformedField);

    // Ten bytes whose last group spills past bit 63 would wrap role to 0
    std::vector<std::uint8_t> overflow = {0x08};
    overflow.insert(overflow.end(), 9, 0x80);
    overflow.insert(overflow.end(), {0x02, 0x10, 32, 0x22, 1, 'X'});
    EXPECT_EQ(decodeErrorKind(tokenFor(overflow)), uule::DecodeErrorKind::MalformedField);
}

TEST(Uulev1Test, DecodeRejectsOverlongVarint) {
    // Role 2 padded as 0x82 0x00 would re-encode to a different token
    auto token = tokenFor({0x08, 0x82, 0x00, 0x10, 32, 0x22, 1, 'X'});
    EXPECT_EQ(decodeErrorKind(token), uule::DecodeErrorKind::MalformedField);

    auto lengthToken = tokenFor({0x08, 2, 0x10, 32, 0x22, 0x81, 0x00, 'X'});
    EXPECT_EQ(decodeErrorKind(lengthToken), uule::DecodeErrorKind::MalformedField);
}

TEST(Uulev1Test, DecodeAcceptsTwoByteVarint) {
    auto data = uule::Uulev1Data::decode(tokenFor({0x08, 0xC8, 0x01, 0x10, 0xFF, 0x01, 0x22, 0}));
    EXPECT_EQ(data, (uule::Uulev1Data{200, 255, ""}));
}

TEST(Uulev1Test, DecodeRejectsInvalidUtf8Name) {
    auto token = tokenFor({0x08, 2, 0x10, 32, 0x22, 2, 0xC3, 0x28});
    EXPECT_EQ(decodeErrorKind(token), uule::DecodeErrorKind::MalformedField);
}

TEST(Uulev1Test, StrictDecodeRejectsFieldsOutOfOrder) {
    auto token = tokenFor({0x10, 32, 0x08, 2, 0x22, 1, 'X'});
    EXPECT_EQ(decodeErrorKind(token), uule::DecodeErrorKind::MalformedField);
}

TEST(Uulev1Test, LenientDecodeAcceptsFieldsOutOfOrder) {
    auto token = tokenFor({0x22, 1, 'X', 0x10, 32, 0x08, 2});
    auto data = uule::Uulev1Data::decode(token, uule::DecodeOptions::lenient());
    EXPECT_EQ(data, (uule::Uulev1Data{2, 32, "X"}));
}

TEST(Uulev1Test, LenientDecodeStillRejectsDuplicates) {
    auto token = tokenFor({0x08, 2, 0x08, 3, 0x10, 32, 0x22, 0});
    EXPECT_EQ(decodeErrorKind(token, uule::DecodeOptions::lenient()), uule::DecodeErrorKind::MalformedField);
}

TEST(Uulev1Test, DecodeErrorMessageNamesField) {
    try {
        (void)uule::Uulev1Data::decode(tokenFor({0x08, 2, 0x10, 32}));
        FAIL() << "Expected DecodeError";
    } catch (const uule::DecodeError& e) {
        EXPECT_NE(std::string(e.what()).find("canonical_name"), std::string::npos);
        EXPECT_EQ(uule::toString(e.kind()), "MalformedField");
    }
}
