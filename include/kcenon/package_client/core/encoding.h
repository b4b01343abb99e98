/**
 * @file encoding.h
 * @brief Text encoding helpers shared by the hasher, encoder and API layer
 */

#ifndef KCENON_PACKAGE_CLIENT_CORE_ENCODING_H
#define KCENON_PACKAGE_CLIENT_CORE_ENCODING_H

#include <kcenon/package_client/core/types.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::package_client::encoding {

/**
 * @brief Convert bytes to a lowercase hexadecimal string
 */
auto bytes_to_hex(std::span<const uint8_t> bytes) -> std::string;

/**
 * @brief Decode a hexadecimal string (either case)
 * @return Decoded bytes, or invalid_digest if the input is not hex
 */
auto hex_to_bytes(std::string_view hex) -> result<std::vector<uint8_t>>;

/**
 * @brief Base64 encode bytes
 */
auto base64_encode(std::span<const uint8_t> data) -> std::string;

/**
 * @brief Base64 encode string
 */
auto base64_encode(std::string_view data) -> std::string;

/**
 * @brief Base64 decode string, skipping characters outside the alphabet
 */
auto base64_decode(std::string_view encoded) -> std::vector<uint8_t>;

/**
 * @brief Percent-encode a URL component (RFC 3986 unreserved set kept)
 * @param keep_slash Leave '/' unescaped, for values that span path segments
 */
auto url_encode(std::string_view value, bool keep_slash = false) -> std::string;

/**
 * @brief Generate random bytes
 */
auto generate_random_bytes(std::size_t count) -> std::vector<uint8_t>;

/**
 * @brief Generate random hex string
 * @param byte_count Number of random bytes (result will be 2x this length)
 */
auto generate_random_hex(std::size_t byte_count) -> std::string;

}  // namespace kcenon::package_client::encoding

#endif  // KCENON_PACKAGE_CLIENT_CORE_ENCODING_H
