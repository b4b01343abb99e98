/**
 * @file curl_transport.h
 * @brief libcurl-based HTTP transport
 */

#ifndef KCENON_PACKAGE_CLIENT_HTTP_CURL_TRANSPORT_H
#define KCENON_PACKAGE_CLIENT_HTTP_CURL_TRANSPORT_H

#include <kcenon/package_client/http/http_transport.h>

#include <chrono>
#include <memory>
#include <string>

namespace kcenon::package_client {

/**
 * @brief libcurl transport settings
 */
struct curl_transport_config {
    std::string user_agent = "package-client/0.1";
    std::chrono::milliseconds connect_timeout{10000};
    long max_redirects = 10;
};

/**
 * @brief HTTP transport built on libcurl
 *
 * Each request runs on its own easy handle. Connections, DNS results and
 * TLS sessions are cached in a share handle guarded by mutexes, so one
 * instance can be used from many threads at once.
 *
 * Request bodies given as a body_source are pulled through the read
 * callback, so multipart uploads are never buffered in memory.
 */
class curl_transport : public http_transport {
public:
    explicit curl_transport(curl_transport_config config = {});
    ~curl_transport() override;

    curl_transport(const curl_transport&) = delete;
    auto operator=(const curl_transport&) -> curl_transport& = delete;
    curl_transport(curl_transport&&) noexcept;
    auto operator=(curl_transport&&) noexcept -> curl_transport&;

    [[nodiscard]] auto perform(const http_request& request)
        -> result<http_response> override;

    [[nodiscard]] auto perform_streaming(const http_request& request,
                                         const body_sink& sink)
        -> result<http_response> override;

    [[nodiscard]] auto config() const -> const curl_transport_config&;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::package_client

#endif  // KCENON_PACKAGE_CLIENT_HTTP_CURL_TRANSPORT_H
