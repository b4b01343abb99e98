/**
 * @file network_transport.h
 * @brief HTTP transport backed by network_system with a libcurl fallback
 *
 * Buffered API requests that follow redirects go through the
 * network_system HTTP client when the library is built with it. Streaming
 * requests, redirect-suppressed requests and requests that need basic
 * authentication are always delegated to libcurl.
 */

#ifndef KCENON_PACKAGE_CLIENT_HTTP_NETWORK_TRANSPORT_H
#define KCENON_PACKAGE_CLIENT_HTTP_NETWORK_TRANSPORT_H

#include <kcenon/package_client/http/curl_transport.h>
#include <kcenon/package_client/http/http_transport.h>

#include <chrono>
#include <memory>

// Forward declaration for network_system HTTP client
namespace kcenon::network::core {
class http_client;
}

namespace kcenon::package_client {

class network_transport : public http_transport {
public:
    /**
     * @brief Construct transport
     * @param timeout Request timeout for the network_system client
     * @param fallback Transport used for requests network_system cannot serve
     */
    explicit network_transport(
        std::chrono::milliseconds timeout = std::chrono::milliseconds(30000),
        std::shared_ptr<http_transport> fallback = std::make_shared<curl_transport>());

    ~network_transport() override;

    network_transport(const network_transport&) = delete;
    auto operator=(const network_transport&) -> network_transport& = delete;
    network_transport(network_transport&&) noexcept;
    auto operator=(network_transport&&) noexcept -> network_transport&;

    [[nodiscard]] auto perform(const http_request& request)
        -> result<http_response> override;

    [[nodiscard]] auto perform_streaming(const http_request& request,
                                         const body_sink& sink)
        -> result<http_response> override;

    /**
     * @brief Check if network_system is compiled in
     */
    [[nodiscard]] auto is_network_system_available() const -> bool;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

/**
 * @brief Create the default transport for this build
 */
[[nodiscard]] auto make_default_transport(std::chrono::milliseconds timeout,
                                          const std::string& user_agent)
    -> std::shared_ptr<http_transport>;

}  // namespace kcenon::package_client

#endif  // KCENON_PACKAGE_CLIENT_HTTP_NETWORK_TRANSPORT_H
