/**
 * @file http_transport.h
 * @brief Abstract HTTP transport interface
 */

#ifndef KCENON_PACKAGE_CLIENT_HTTP_HTTP_TRANSPORT_H
#define KCENON_PACKAGE_CLIENT_HTTP_HTTP_TRANSPORT_H

#include <kcenon/package_client/http/http_types.h>

#include <memory>

namespace kcenon::package_client {

/**
 * @brief HTTP session used by the API layer and the transfer coordinator
 *
 * Implementations must be safe to share between coordinators running on
 * different threads. Any HTTP status is a successful perform(); only
 * transport failures (DNS, connect, TLS, timeout, body source or sink
 * errors) are reported as errors.
 */
class http_transport {
public:
    virtual ~http_transport() = default;

    /**
     * @brief Perform a request and buffer the response body
     */
    [[nodiscard]] virtual auto perform(const http_request& request)
        -> result<http_response> = 0;

    /**
     * @brief Perform a request and push the response body to a sink
     *
     * The returned response has status and headers but an empty body.
     */
    [[nodiscard]] virtual auto perform_streaming(const http_request& request,
                                                 const body_sink& sink)
        -> result<http_response> = 0;
};

}  // namespace kcenon::package_client

#endif  // KCENON_PACKAGE_CLIENT_HTTP_HTTP_TRANSPORT_H
