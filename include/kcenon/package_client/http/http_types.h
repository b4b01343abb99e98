/**
 * @file http_types.h
 * @brief HTTP request and response types shared by transports
 */

#ifndef KCENON_PACKAGE_CLIENT_HTTP_HTTP_TYPES_H
#define KCENON_PACKAGE_CLIENT_HTTP_HTTP_TYPES_H

#include <kcenon/package_client/core/body_source.h>
#include <kcenon/package_client/core/types.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::package_client {

/**
 * @brief HTTP methods used by the package hosting API
 */
enum class http_method {
    get,
    post,
    put,
    del,
    head
};

[[nodiscard]] constexpr auto to_string(http_method method) -> const char* {
    switch (method) {
        case http_method::get: return "GET";
        case http_method::post: return "POST";
        case http_method::put: return "PUT";
        case http_method::del: return "DELETE";
        case http_method::head: return "HEAD";
        default: return "GET";
    }
}

/**
 * @brief Case-insensitive ordering for header names
 */
struct header_name_less {
    auto operator()(const std::string& a, const std::string& b) const -> bool {
        return std::lexicographical_compare(
            a.begin(), a.end(), b.begin(), b.end(), [](char x, char y) {
                return std::tolower(static_cast<unsigned char>(x)) <
                       std::tolower(static_cast<unsigned char>(y));
            });
    }
};

using http_headers = std::map<std::string, std::string, header_name_less>;

/**
 * @brief Basic authentication credentials
 */
struct basic_auth {
    std::string username;
    std::string password;
};

/**
 * @brief HTTP request description
 *
 * Either `body` (buffered) or `body_stream` (pulled on demand) carries the
 * payload. body_stream is borrowed and must outlive the request.
 */
struct http_request {
    http_method method = http_method::get;
    std::string url;
    http_headers headers;
    std::string body;
    body_source* body_stream = nullptr;
    std::optional<basic_auth> auth;
    bool follow_redirects = true;
    std::chrono::milliseconds timeout{30000};
    bool verify_tls = true;

    [[nodiscard]] auto content_length() const -> uint64_t {
        return body_stream ? body_stream->size() : body.size();
    }
};

/**
 * @brief HTTP response
 *
 * Header lookup is case-insensitive. For streaming requests the body
 * stays empty and content is delivered to the sink instead.
 */
struct http_response {
    int status_code = 0;
    http_headers headers;
    std::string body;

    [[nodiscard]] auto get_header(std::string_view name) const -> std::optional<std::string> {
        auto it = headers.find(std::string(name));
        if (it == headers.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    [[nodiscard]] auto is_success() const -> bool {
        return status_code >= 200 && status_code < 300;
    }
};

/**
 * @brief Receiver for streamed response bodies
 *
 * Returning an error aborts the transfer and is propagated to the caller.
 */
using body_sink = std::function<result<void>(std::span<const std::byte>)>;

}  // namespace kcenon::package_client

#endif  // KCENON_PACKAGE_CLIENT_HTTP_HTTP_TYPES_H
