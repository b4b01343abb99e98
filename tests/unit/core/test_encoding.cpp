/**
 * @file test_encoding.cpp
 * @brief Unit tests for hex, base64 and URL encoding helpers
 */

#include <gtest/gtest.h>

#include <kcenon/package_client/core/encoding.h>

#include <set>
#include <string>
#include <vector>

namespace kcenon::package_client::test {

class EncodingTest : public ::testing::Test {};

// ============================================================================
// Hex
// ============================================================================

TEST_F(EncodingTest, BytesToHexIsLowercase) {
    std::vector<uint8_t> bytes = {0x00, 0x0f, 0xab, 0xff};
    EXPECT_EQ(encoding::bytes_to_hex(bytes), "000fabff");
}

TEST_F(EncodingTest, HexToBytesAcceptsMixedCase) {
    auto bytes = encoding::hex_to_bytes("00Ff7a");
    ASSERT_TRUE(bytes.has_value());
    EXPECT_EQ(bytes.value(), (std::vector<uint8_t>{0x00, 0xff, 0x7a}));
}

TEST_F(EncodingTest, HexToBytesRejectsOddLength) {
    auto bytes = encoding::hex_to_bytes("abc");
    ASSERT_FALSE(bytes.has_value());
    EXPECT_EQ(bytes.error().code, error_code::invalid_digest);
}

TEST_F(EncodingTest, HexToBytesRejectsNonHex) {
    auto bytes = encoding::hex_to_bytes("zz");
    ASSERT_FALSE(bytes.has_value());
    EXPECT_EQ(bytes.error().code, error_code::invalid_digest);
}

// ============================================================================
// Base64
// ============================================================================

TEST_F(EncodingTest, Base64KnownVectors) {
    EXPECT_EQ(encoding::base64_encode(std::string_view("")), "");
    EXPECT_EQ(encoding::base64_encode(std::string_view("f")), "Zg==");
    EXPECT_EQ(encoding::base64_encode(std::string_view("fo")), "Zm8=");
    EXPECT_EQ(encoding::base64_encode(std::string_view("foo")), "Zm9v");
    EXPECT_EQ(encoding::base64_encode(std::string_view("foobar")), "Zm9vYmFy");
}

TEST_F(EncodingTest, Base64DecodeOfJsonPayload) {
    std::string payload = R"({"dist_id":"abc"})";
    auto encoded = encoding::base64_encode(std::string_view(payload));
    auto decoded = encoding::base64_decode(encoded);
    EXPECT_EQ(std::string(decoded.begin(), decoded.end()), payload);
}

TEST_F(EncodingTest, Base64DecodeSkipsWhitespace) {
    auto decoded = encoding::base64_decode("Zm9v\nYmFy");
    EXPECT_EQ(std::string(decoded.begin(), decoded.end()), "foobar");
}

// ============================================================================
// URL encoding
// ============================================================================

TEST_F(EncodingTest, UrlEncodeLeavesUnreservedCharacters) {
    EXPECT_EQ(encoding::url_encode("pkg-1.0_beta~2"), "pkg-1.0_beta~2");
}

TEST_F(EncodingTest, UrlEncodeEscapesReserved) {
    EXPECT_EQ(encoding::url_encode("a b/c+d"), "a%20b%2Fc%2Bd");
}

TEST_F(EncodingTest, UrlEncodeCanKeepSlash) {
    EXPECT_EQ(encoding::url_encode("linux-64/pkg 1.tar.bz2", true),
              "linux-64/pkg%201.tar.bz2");
}

TEST_F(EncodingTest, UrlEncodeEscapesUtf8Bytes) {
    EXPECT_EQ(encoding::url_encode("\xc3\xa9"), "%C3%A9");
}

// ============================================================================
// Random
// ============================================================================

TEST_F(EncodingTest, RandomHexHasRequestedLength) {
    auto hex = encoding::generate_random_hex(16);
    EXPECT_EQ(hex.size(), 32u);
    EXPECT_EQ(hex.find_first_not_of("0123456789abcdef"), std::string::npos);
}

TEST_F(EncodingTest, RandomHexValuesDiffer) {
    std::set<std::string> seen;
    for (int i = 0; i < 100; ++i) {
        seen.insert(encoding::generate_random_hex(16));
    }
    EXPECT_EQ(seen.size(), 100u);
}

}  // namespace kcenon::package_client::test
