#include <gtest/gtest.h>
#include "../src/base64.hpp"
#include <stdexcept>
#include <string>
#include <vector>

using ancryptor::internal::base64_decode;
using ancryptor::internal::base64_encode;
using ancryptor::internal::base64_encoded_size;

namespace {

std::vector<std::uint8_t> bytes(const std::string& s) {
    return std::vector<std::uint8_t>(s.begin(), s.end());
}

std::string text(const std::vector<std::uint8_t>& v) {
    return std::string(v.begin(), v.end());
}

}

// ============================================================================
// Encoding (RFC 4648 section 10 test vectors)
// ============================================================================

TEST(Base64EncodeTest, Rfc4648Vectors) {
    EXPECT_EQ(base64_encode(bytes("")), "");
    EXPECT_EQ(base64_encode(bytes("f")), "Zg==");
    EXPECT_EQ(base64_encode(bytes("fo")), "Zm8=");
    EXPECT_EQ(base64_encode(bytes("foo")), "Zm9v");
    EXPECT_EQ(base64_encode(bytes("foob")), "Zm9vYg==");
    EXPECT_EQ(base64_encode(bytes("fooba")), "Zm9vYmE=");
    EXPECT_EQ(base64_encode(bytes("foobar")), "Zm9vYmFy");
}

TEST(Base64EncodeTest, UsesStandardAlphabet) {
    // 0xFB 0xFF encodes to symbols 62 and 63
    std::vector<std::uint8_t> data = {0xFB, 0xFF, 0xBF};
    EXPECT_EQ(base64_encode(data), "+/+/");
}

TEST(Base64EncodeTest, SingleHighByte) {
    std::vector<std::uint8_t> data = {0xFF};
    EXPECT_EQ(base64_encode(data), "/w==");
}

TEST(Base64EncodeTest, OutputLengthIsPaddedQuads) {
    for (std::size_t n = 0; n < 32; ++n) {
        std::vector<std::uint8_t> data(n, 0x41);
        std::string encoded = base64_encode(data);
        EXPECT_EQ(encoded.size(), base64_encoded_size(n)) << "n=" << n;
        EXPECT_EQ(encoded.size() % 4, 0u);
    }
    EXPECT_EQ(base64_encoded_size(0), 0u);
    EXPECT_EQ(base64_encoded_size(1), 4u);
    EXPECT_EQ(base64_encoded_size(3), 4u);
    EXPECT_EQ(base64_encoded_size(4), 8u);
}

// ============================================================================
// Decoding
// ============================================================================

TEST(Base64DecodeTest, Rfc4648Vectors) {
    EXPECT_TRUE(base64_decode("").empty());
    EXPECT_EQ(text(base64_decode("Zg==")), "f");
    EXPECT_EQ(text(base64_decode("Zm8=")), "fo");
    EXPECT_EQ(text(base64_decode("Zm9v")), "foo");
    EXPECT_EQ(text(base64_decode("Zm9vYg==")), "foob");
    EXPECT_EQ(text(base64_decode("Zm9vYmE=")), "fooba");
    EXPECT_EQ(text(base64_decode("Zm9vYmFy")), "foobar");
}

TEST(Base64DecodeTest, AllByteValues) {
    std::vector<std::uint8_t> data;
    for (int i = 0; i < 256; ++i) {
        data.push_back(static_cast<std::uint8_t>(i));
    }
    EXPECT_EQ(base64_decode(base64_encode(data)), data);
}

TEST(Base64DecodeTest, RejectsLengthNotMultipleOfFour) {
    EXPECT_THROW(base64_decode("Z"), std::invalid_argument);
    EXPECT_THROW(base64_decode("Zg"), std::invalid_argument);
    EXPECT_THROW(base64_decode("Zg="), std::invalid_argument);
    EXPECT_THROW(base64_decode("Zm9vY"), std::invalid_argument);
    EXPECT_THROW(base64_decode("dfoiuerw892"), std::invalid_argument);
}

TEST(Base64DecodeTest, RejectsCharactersOutsideAlphabet) {
    EXPECT_THROW(base64_decode("Zm9*"), std::invalid_argument);
    EXPECT_THROW(base64_decode("Zm9v\nYmFy"), std::invalid_argument);
    EXPECT_THROW(base64_decode("Zm 9"), std::invalid_argument);
    // URL-safe alphabet is not accepted
    EXPECT_THROW(base64_decode("-_-_"), std::invalid_argument);
}

TEST(Base64DecodeTest, RejectsMisplacedPadding) {
    EXPECT_THROW(base64_decode("===="), std::invalid_argument);
    EXPECT_THROW(base64_decode("Z==="), std::invalid_argument);
    EXPECT_THROW(base64_decode("=Zm9"), std::invalid_argument);
    EXPECT_THROW(base64_decode("Zm=v"), std::invalid_argument);
    // Padding in the middle of the input
    EXPECT_THROW(base64_decode("Zg==Zm9v"), std::invalid_argument);
}

TEST(Base64DecodeTest, RejectsNonZeroTrailingBits) {
    // "Zg==" is canonical for "f"; "Zh==" carries stray low bits
    EXPECT_THROW(base64_decode("Zh=="), std::invalid_argument);
    // "Zm8=" is canonical for "fo"; "Zm9=" carries stray low bits
    EXPECT_THROW(base64_decode("Zm9="), std::invalid_argument);
}

TEST(Base64DecodeTest, ErrorMessagesDescribeProblem) {
    try {
        (void)base64_decode("abc");
        FAIL() << "Expected std::invalid_argument";
    } catch (const std::invalid_argument& e) {
        EXPECT_NE(std::string(e.what()).find("length"), std::string::npos);
    }

    try {
        (void)base64_decode("ab*d");
        FAIL() << "Expected std::invalid_argument";
    } catch (const std::invalid_argument& e) {
        EXPECT_NE(std::string(e.what()).find("offset 2"), std::string::npos);
    }

    try {
        (void)base64_decode("Zg==Zm9v");
        FAIL() << "Expected std::invalid_argument";
    } catch (const std::invalid_argument& e) {
        EXPECT_NE(std::string(e.what()).find("padding"), std::string::npos);
    }
}
