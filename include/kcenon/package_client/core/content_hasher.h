/**
 * @file content_hasher.h
 * @brief Incremental MD5 content digest for distribution streams
 */

#ifndef KCENON_PACKAGE_CLIENT_CORE_CONTENT_HASHER_H
#define KCENON_PACKAGE_CLIENT_CORE_CONTENT_HASHER_H

#include <kcenon/package_client/core/types.h>

#include <cstddef>
#include <cstdint>
#include <istream>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace kcenon::package_client {

/**
 * @brief Default read chunk size for hashing and streaming (256KB)
 */
constexpr std::size_t default_read_chunk_size = 256 * 1024;

/**
 * @brief Smallest accepted read chunk size (4KB)
 */
constexpr std::size_t min_read_chunk_size = 4 * 1024;

/**
 * @brief Largest accepted read chunk size (4MB)
 */
constexpr std::size_t max_read_chunk_size = 4 * 1024 * 1024;

/**
 * @brief Fingerprint and length of a distribution file
 */
struct content_digest {
    std::string hex;     ///< Lowercase hex MD5, used as ETag validator
    std::string base64;  ///< Base64 MD5, sent as Content-MD5
    uint64_t size = 0;   ///< Byte length

    [[nodiscard]] auto operator==(const content_digest&) const -> bool = default;
};

/**
 * @brief Incremental MD5 accumulator
 *
 * Wraps an OpenSSL EVP digest context. Bytes are fed in any number of
 * update() calls and finish() produces the digest once.
 */
class md5_accumulator {
public:
    md5_accumulator();
    ~md5_accumulator();

    md5_accumulator(const md5_accumulator&) = delete;
    auto operator=(const md5_accumulator&) -> md5_accumulator& = delete;
    md5_accumulator(md5_accumulator&&) noexcept;
    auto operator=(md5_accumulator&&) noexcept -> md5_accumulator&;

    /**
     * @brief Feed bytes into the digest
     */
    [[nodiscard]] auto update(std::span<const std::byte> data) -> result<void>;

    /**
     * @brief Finalize the digest
     *
     * The accumulator cannot be updated after finish().
     */
    [[nodiscard]] auto finish() -> result<content_digest>;

    [[nodiscard]] auto bytes_processed() const noexcept -> uint64_t;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

/**
 * @brief Computes a content digest from a readable stream
 *
 * The stream is read in fixed-size chunks, never loaded whole.
 *
 * @code
 * content_hasher hasher;
 * std::ifstream file("pkg.tar.bz2", std::ios::binary);
 * auto digest = hasher.hash(file);
 * if (digest) {
 *     std::cout << digest.value().hex << " " << digest.value().size << "\n";
 * }
 * @endcode
 */
class content_hasher {
public:
    explicit content_hasher(std::size_t chunk_size = default_read_chunk_size);

    /**
     * @brief Hash a stream from its current position
     * @param stream Source stream, its read position is advanced
     * @param declared_size Upper bound on bytes to read. Not validated, the
     *        reported size is always the number of bytes actually read.
     * @return Digest, or file_read_error if the stream goes bad
     */
    [[nodiscard]] auto hash(std::istream& stream,
                            std::optional<uint64_t> declared_size = std::nullopt) const
        -> result<content_digest>;

    /**
     * @brief Hash an in-memory buffer
     */
    [[nodiscard]] static auto hash(std::span<const std::byte> data) -> result<content_digest>;

    /**
     * @brief Build a digest from a caller-supplied MD5 hex string
     * @return Digest, or invalid_digest unless md5_hex is 32 hex characters
     */
    [[nodiscard]] static auto from_hex(std::string_view md5_hex, uint64_t size)
        -> result<content_digest>;

    /**
     * @brief Measure the bytes remaining in a stream by seeking
     *
     * Seeks to the end and back to the starting position.
     *
     * @return Remaining size, or unsupported_stream if the stream cannot seek
     */
    [[nodiscard]] static auto measure(std::istream& stream) -> result<uint64_t>;

    /**
     * @brief Produce the digest for an upload
     *
     * - digest and size supplied: nothing is read
     * - digest only: size comes from measure()
     * - no digest: the stream is hashed and size is the bytes read
     */
    [[nodiscard]] auto resolve(std::istream& stream,
                               const std::optional<std::string>& md5_hex,
                               std::optional<uint64_t> size) const
        -> result<content_digest>;

    [[nodiscard]] auto chunk_size() const noexcept -> std::size_t { return chunk_size_; }

private:
    std::size_t chunk_size_;
};

}  // namespace kcenon::package_client

#endif  // KCENON_PACKAGE_CLIENT_CORE_CONTENT_HASHER_H
