/**
 * @file multipart_encoder.h
 * @brief Streaming multipart/form-data encoder
 */

#ifndef KCENON_PACKAGE_CLIENT_CORE_MULTIPART_ENCODER_H
#define KCENON_PACKAGE_CLIENT_CORE_MULTIPART_ENCODER_H

#include <kcenon/package_client/core/body_source.h>
#include <kcenon/package_client/core/types.h>

#include <cstdint>
#include <functional>
#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace kcenon::package_client {

/**
 * @brief Ordered text fields of a form, emitted in insertion order
 */
using form_fields = std::vector<std::pair<std::string, std::string>>;

/**
 * @brief Progress callback: (cumulative bytes emitted, total bytes)
 */
using progress_callback = std::function<void(uint64_t, uint64_t)>;

/**
 * @brief File part of a multipart body
 *
 * The stream is borrowed, never copied or closed. Exactly `size` bytes
 * are read from its current position.
 */
struct file_part {
    std::string name;
    std::string filename;
    std::istream* stream = nullptr;
    uint64_t size = 0;
    std::string content_type = "application/octet-stream";
};

/**
 * @brief Encoding options
 */
struct multipart_options {
    progress_callback on_progress;
    std::optional<cancellation_token> cancel;
    std::optional<std::string> boundary;  ///< Random when not set
};

/**
 * @brief Lazily produced multipart body
 *
 * Part headers are formatted up front (they are small); file content is
 * read from the borrowed streams only as the transport pulls it.
 */
class multipart_body : public body_source {
public:
    struct segment {
        std::string text;
        std::istream* stream = nullptr;
        uint64_t length = 0;
    };

    multipart_body(std::vector<segment> segments,
                   progress_callback on_progress,
                   std::optional<cancellation_token> cancel);

    [[nodiscard]] auto read(std::span<std::byte> buffer) -> result<std::size_t> override;
    [[nodiscard]] auto size() const -> uint64_t override { return total_; }

    [[nodiscard]] auto bytes_emitted() const noexcept -> uint64_t { return emitted_; }

private:
    std::vector<segment> segments_;
    progress_callback on_progress_;
    std::optional<cancellation_token> cancel_;
    uint64_t total_ = 0;
    uint64_t emitted_ = 0;
    std::size_t index_ = 0;
    uint64_t offset_ = 0;
};

/**
 * @brief Result of encoding a form
 */
struct encoded_multipart {
    std::unique_ptr<multipart_body> body;
    std::string boundary;
    std::string content_type;          ///< multipart/form-data; boundary=...
    uint64_t content_length = 0;       ///< Exact size of the whole body
    std::vector<uint64_t> part_sizes;  ///< Declared size of each part's content
};

/**
 * @brief Builds multipart/form-data bodies without buffering file content
 *
 * All text fields are emitted before the file parts, each part carries a
 * Content-Disposition header, and the body ends with the closing boundary.
 *
 * @code
 * std::ifstream file("pkg.tar.bz2", std::ios::binary);
 * auto encoded = multipart_encoder::encode(
 *     {{"key", "uploads/pkg.tar.bz2"}},
 *     {file_part{"file", "pkg.tar.bz2", &file, file_size}},
 *     multipart_options{.on_progress = [](uint64_t sent, uint64_t total) {}});
 * @endcode
 */
class multipart_encoder {
public:
    /**
     * @brief Length of a generated boundary in characters
     */
    static constexpr std::size_t boundary_length = 32;

    /**
     * @brief Encode fields and files into a lazily produced body
     * @return Encoded body, or unsupported_stream if a file part has no stream
     */
    [[nodiscard]] static auto encode(const form_fields& fields,
                                     const std::vector<file_part>& files,
                                     multipart_options options = {})
        -> result<encoded_multipart>;

    /**
     * @brief Generate a random boundary token
     */
    [[nodiscard]] static auto generate_boundary() -> std::string;
};

}  // namespace kcenon::package_client

#endif  // KCENON_PACKAGE_CLIENT_CORE_MULTIPART_ENCODER_H
