/**
 * @file test_multipart_encoder.cpp
 * @brief Unit tests for the streaming multipart/form-data encoder
 */

#include <gtest/gtest.h>

#include <kcenon/package_client/core/multipart_encoder.h>

#include "support/multipart_parser.h"

#include <array>
#include <set>
#include <sstream>
#include <string>
#include <vector>

namespace kcenon::package_client::test {

namespace {

auto drain(body_source& source, std::size_t chunk = 7) -> result<std::string> {
    std::string out;
    std::vector<std::byte> buffer(chunk);
    while (true) {
        auto n = source.read(buffer);
        if (!n) {
            return unexpected{n.error()};
        }
        if (n.value() == 0) {
            break;
        }
        out.append(reinterpret_cast<const char*>(buffer.data()), n.value());
    }
    return out;
}

}  // namespace

class MultipartEncoderTest : public ::testing::Test {
protected:
    form_fields fields_ = {
        {"key", "owner/pkg/1.0/pkg.tar.bz2"},
        {"acl", "private"},
        {"policy", "eyJleHBpcmF0aW9uIjoi"},
    };
};

// ============================================================================
// Layout
// ============================================================================

TEST_F(MultipartEncoderTest, ExactLayoutWithFixedBoundary) {
    std::istringstream file("DATA");
    multipart_options options;
    options.boundary = "XYZ";

    auto encoded = multipart_encoder::encode(
        {{"a", "1"}}, {file_part{"file", "x.bin", &file, 4}}, options);
    ASSERT_TRUE(encoded.has_value());

    auto body = drain(*encoded.value().body);
    ASSERT_TRUE(body.has_value());

    std::string expected =
        "--XYZ\r\n"
        "Content-Disposition: form-data; name=\"a\"\r\n"
        "\r\n"
        "1\r\n"
        "--XYZ\r\n"
        "Content-Disposition: form-data; name=\"file\"; filename=\"x.bin\"\r\n"
        "Content-Type: application/octet-stream\r\n"
        "\r\n"
        "DATA\r\n"
        "--XYZ--\r\n";
    EXPECT_EQ(body.value(), expected);
    EXPECT_EQ(encoded.value().content_length, expected.size());
    EXPECT_EQ(encoded.value().content_type, "multipart/form-data; boundary=XYZ");
}

TEST_F(MultipartEncoderTest, FieldsKeepOrderAndFileComesLast) {
    std::string content(10000, 'z');
    std::istringstream file(content);

    auto encoded = multipart_encoder::encode(
        fields_, {file_part{"file", "pkg.tar.bz2", &file, content.size()}});
    ASSERT_TRUE(encoded.has_value());

    auto body = drain(*encoded.value().body, 1000);
    ASSERT_TRUE(body.has_value());

    auto parts = parse_multipart(body.value(), encoded.value().boundary);
    ASSERT_TRUE(parts.has_value());
    ASSERT_EQ(parts->size(), 4u);
    EXPECT_EQ((*parts)[0].name, "key");
    EXPECT_EQ((*parts)[0].data, "owner/pkg/1.0/pkg.tar.bz2");
    EXPECT_EQ((*parts)[1].name, "acl");
    EXPECT_EQ((*parts)[2].name, "policy");
    EXPECT_EQ((*parts)[3].name, "file");
    EXPECT_EQ((*parts)[3].filename, "pkg.tar.bz2");
    EXPECT_EQ((*parts)[3].content_type, "application/octet-stream");
    EXPECT_EQ((*parts)[3].data, content);
}

TEST_F(MultipartEncoderTest, ContentLengthMatchesEmittedBytes) {
    std::string content(12345, 'q');
    std::istringstream file(content);

    auto encoded = multipart_encoder::encode(
        fields_, {file_part{"file", "f", &file, content.size()}});
    ASSERT_TRUE(encoded.has_value());

    auto& body = *encoded.value().body;
    auto drained = drain(body, 4096);
    ASSERT_TRUE(drained.has_value());
    EXPECT_EQ(drained.value().size(), encoded.value().content_length);
    EXPECT_EQ(body.bytes_emitted(), body.size());
}

TEST_F(MultipartEncoderTest, PartSizesMatchDeclaredContent) {
    std::istringstream file("12345");
    auto encoded = multipart_encoder::encode(
        {{"k", "abc"}}, {file_part{"file", "f", &file, 5}});
    ASSERT_TRUE(encoded.has_value());
    EXPECT_EQ(encoded.value().part_sizes, (std::vector<uint64_t>{3, 5}));
}

TEST_F(MultipartEncoderTest, EmptyFilePart) {
    std::istringstream file("");
    auto encoded = multipart_encoder::encode({}, {file_part{"file", "empty", &file, 0}});
    ASSERT_TRUE(encoded.has_value());

    auto body = drain(*encoded.value().body);
    ASSERT_TRUE(body.has_value());
    auto parts = parse_multipart(body.value(), encoded.value().boundary);
    ASSERT_TRUE(parts.has_value());
    ASSERT_EQ(parts->size(), 1u);
    EXPECT_TRUE((*parts)[0].data.empty());
}

TEST_F(MultipartEncoderTest, QuotesInNamesAreEscaped) {
    multipart_options options;
    options.boundary = "B";
    auto encoded = multipart_encoder::encode({{"we\"ird\r\n", "v"}}, {}, options);
    ASSERT_TRUE(encoded.has_value());

    auto body = drain(*encoded.value().body);
    ASSERT_TRUE(body.has_value());
    EXPECT_NE(body.value().find("name=\"we%22ird%0D%0A\""), std::string::npos);
}

TEST_F(MultipartEncoderTest, FileWithoutStreamIsRejected) {
    auto encoded = multipart_encoder::encode({}, {file_part{"file", "f", nullptr, 3}});
    ASSERT_FALSE(encoded.has_value());
    EXPECT_EQ(encoded.error().code, error_code::unsupported_stream);
}

// ============================================================================
// Boundary
// ============================================================================

TEST_F(MultipartEncoderTest, GeneratedBoundaryShape) {
    auto boundary = multipart_encoder::generate_boundary();
    EXPECT_EQ(boundary.size(), multipart_encoder::boundary_length);
    EXPECT_EQ(boundary.find_first_not_of("0123456789abcdef"), std::string::npos);
}

TEST_F(MultipartEncoderTest, GeneratedBoundariesAreUnique) {
    std::set<std::string> seen;
    for (int i = 0; i < 1000; ++i) {
        seen.insert(multipart_encoder::generate_boundary());
    }
    EXPECT_EQ(seen.size(), 1000u);
}

// ============================================================================
// Streaming behavior
// ============================================================================

TEST_F(MultipartEncoderTest, ProgressIsMonotonicAndEndsAtTotal) {
    std::string content(50000, 'p');
    std::istringstream file(content);

    std::vector<std::pair<uint64_t, uint64_t>> calls;
    multipart_options options;
    options.on_progress = [&calls](uint64_t sent, uint64_t total) {
        calls.emplace_back(sent, total);
    };

    auto encoded = multipart_encoder::encode(
        fields_, {file_part{"file", "f", &file, content.size()}}, options);
    ASSERT_TRUE(encoded.has_value());
    ASSERT_TRUE(drain(*encoded.value().body, 8192).has_value());

    ASSERT_FALSE(calls.empty());
    for (std::size_t i = 1; i < calls.size(); ++i) {
        EXPECT_GT(calls[i].first, calls[i - 1].first);
    }
    EXPECT_EQ(calls.back().first, encoded.value().content_length);
    EXPECT_EQ(calls.back().second, encoded.value().content_length);
}

TEST_F(MultipartEncoderTest, ReadsAreBoundedByBuffer) {
    std::string content(1000, 'b');
    std::istringstream file(content);

    auto encoded = multipart_encoder::encode({}, {file_part{"file", "f", &file, 1000}});
    ASSERT_TRUE(encoded.has_value());

    std::array<std::byte, 64> buffer{};
    auto n = encoded.value().body->read(buffer);
    ASSERT_TRUE(n.has_value());
    EXPECT_EQ(n.value(), buffer.size());
    EXPECT_EQ(encoded.value().body->bytes_emitted(), 64u);
}

TEST_F(MultipartEncoderTest, ShortStreamFails) {
    std::istringstream file("abc");
    auto encoded = multipart_encoder::encode({}, {file_part{"file", "f", &file, 10}});
    ASSERT_TRUE(encoded.has_value());

    auto body = drain(*encoded.value().body);
    ASSERT_FALSE(body.has_value());
    EXPECT_EQ(body.error().code, error_code::file_read_error);
}

TEST_F(MultipartEncoderTest, CancellationStopsAtNextRead) {
    std::string content(10000, 'c');
    std::istringstream file(content);

    cancellation_token token;
    multipart_options options;
    options.cancel = token;

    auto encoded = multipart_encoder::encode(
        {}, {file_part{"file", "f", &file, content.size()}}, options);
    ASSERT_TRUE(encoded.has_value());

    std::array<std::byte, 128> buffer{};
    ASSERT_TRUE(encoded.value().body->read(buffer).has_value());

    token.cancel();
    auto n = encoded.value().body->read(buffer);
    ASSERT_FALSE(n.has_value());
    EXPECT_EQ(n.error().code, error_code::transfer_cancelled);
    EXPECT_EQ(encoded.value().body->bytes_emitted(), 128u);
}

}  // namespace kcenon::package_client::test
