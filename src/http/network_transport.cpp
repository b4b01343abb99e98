/**
 * @file network_transport.cpp
 * @brief network_system transport implementation
 */

#include "kcenon/package_client/http/network_transport.h"

#include "kcenon/package_client/config/feature_flags.h"
#include "kcenon/package_client/core/logging.h"

#include <map>
#include <string>

#if KCENON_WITH_NETWORK_SYSTEM
#include <kcenon/network/core/http_client.h>
#endif

namespace kcenon::package_client {

// ============================================================================
// Implementation
// ============================================================================

struct network_transport::impl {
#if KCENON_WITH_NETWORK_SYSTEM
    std::shared_ptr<kcenon::network::core::http_client> client;
#endif
    std::shared_ptr<http_transport> fallback;
    bool available = false;

    impl(std::chrono::milliseconds timeout, std::shared_ptr<http_transport> fb)
        : fallback(std::move(fb)) {
#if KCENON_WITH_NETWORK_SYSTEM
        client = std::make_shared<kcenon::network::core::http_client>(timeout);
        available = true;
#else
        (void)timeout;
        available = false;
#endif
    }

    // network_system has no redirect, TLS or basic-auth switches and buffers bodies
    [[nodiscard]] auto can_serve(const http_request& request) const -> bool {
        return available && request.follow_redirects && request.verify_tls && !request.auth &&
               request.body_stream == nullptr && request.method != http_method::head;
    }

#if KCENON_WITH_NETWORK_SYSTEM
    static auto to_header_map(const http_headers& headers)
        -> std::map<std::string, std::string> {
        std::map<std::string, std::string> out;
        for (const auto& [name, value] : headers) {
            out[name] = value;
        }
        return out;
    }

    static auto convert_response(const kcenon::network::internal::http_response& resp)
        -> http_response {
        http_response result;
        result.status_code = resp.status_code;
        for (const auto& [name, value] : resp.headers) {
            result.headers[name] = value;
        }
        result.body = std::string(resp.body.begin(), resp.body.end());
        return result;
    }

    auto execute(const http_request& request) -> result<http_response> {
        auto headers = to_header_map(request.headers);
        switch (request.method) {
            case http_method::get: {
                auto response = client->get(request.url, {}, headers);
                if (response.is_err()) break;
                return convert_response(response.value());
            }
            case http_method::post: {
                auto response = client->post(request.url, request.body, headers);
                if (response.is_err()) break;
                return convert_response(response.value());
            }
            case http_method::put: {
                auto response = client->put(request.url, request.body, headers);
                if (response.is_err()) break;
                return convert_response(response.value());
            }
            case http_method::del: {
                auto response = client->del(request.url, headers);
                if (response.is_err()) break;
                return convert_response(response.value());
            }
            default:
                break;
        }

        std::string message = std::string("HTTP ") + to_string(request.method) +
                              " request failed: " + request.url;
        PC_LOG_ERROR(log_category::http, message);
        return unexpected{error{error_code::connection_failed, message}};
    }
#endif
};

// ============================================================================
// Constructor / Destructor
// ============================================================================

network_transport::network_transport(std::chrono::milliseconds timeout,
                                     std::shared_ptr<http_transport> fallback)
    : impl_(std::make_unique<impl>(timeout, std::move(fallback))) {}

network_transport::~network_transport() = default;

network_transport::network_transport(network_transport&&) noexcept = default;
auto network_transport::operator=(network_transport&&) noexcept
    -> network_transport& = default;

// ============================================================================
// HTTP Operations
// ============================================================================

auto network_transport::perform(const http_request& request) -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    if (impl_->client && impl_->can_serve(request)) {
        return impl_->execute(request);
    }
#endif
    if (!impl_->fallback) {
        return unexpected{error{error_code::transport_unavailable,
            "no transport can serve " + std::string(to_string(request.method)) + " " +
                request.url}};
    }
    return impl_->fallback->perform(request);
}

auto network_transport::perform_streaming(const http_request& request,
                                          const body_sink& sink)
    -> result<http_response> {
    if (!impl_->fallback) {
        return unexpected{error{error_code::transport_unavailable,
            "streaming requires the libcurl transport"}};
    }
    return impl_->fallback->perform_streaming(request, sink);
}

auto network_transport::is_network_system_available() const -> bool {
    return impl_->available;
}

auto make_default_transport(std::chrono::milliseconds timeout,
                            const std::string& user_agent)
    -> std::shared_ptr<http_transport> {
    curl_transport_config curl_config;
    curl_config.user_agent = user_agent;
    auto curl = std::make_shared<curl_transport>(std::move(curl_config));
#if KCENON_WITH_NETWORK_SYSTEM
    return std::make_shared<network_transport>(timeout, std::move(curl));
#else
    (void)timeout;
    return curl;
#endif
}

}  // namespace kcenon::package_client
