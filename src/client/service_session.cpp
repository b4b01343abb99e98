/**
 * @file service_session.cpp
 * @brief Implementation of the shared service session
 */

#include "kcenon/package_client/client/service_session.h"

#include "kcenon/package_client/core/encoding.h"
#include "kcenon/package_client/core/logging.h"

namespace kcenon::package_client {

service_session::service_session(client_config config,
                                 std::shared_ptr<http_transport> transport)
    : config_(std::move(config)),
      transport_(std::move(transport)),
      classifier_(config_.client_version, config_.version_header) {}

auto service_session::config() const -> client_config {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_;
}

void service_session::set_token(std::optional<std::string> token) {
    std::lock_guard<std::mutex> lock(config_mutex_);
    config_.token = std::move(token);
}

auto service_session::make_request(http_method method, const std::string& path) const
    -> http_request {
    auto cfg = config();

    http_request request;
    request.method = method;
    request.url = cfg.url(path);
    request.headers = cfg.default_headers();
    request.timeout = cfg.request_timeout;
    request.verify_tls = cfg.verify_tls;
    return request;
}

auto service_session::send(const http_request& request, const std::vector<int>& allowed) const
    -> result<http_response> {
    if (!transport_) {
        return unexpected{error{error_code::transport_unavailable,
                                "session has no HTTP transport"}};
    }

    auto response = transport_->perform(request);
    if (!response) {
        return response;
    }

    auto checked = classifier_.check(response.value(), allowed);
    if (!checked) {
        PC_LOG_DEBUG(log_category::api,
                     std::string(to_string(request.method)) + " " + request.url +
                         " rejected: " + checked.error().message);
        return unexpected{checked.error()};
    }
    return response;
}

auto service_session::send_json(const http_request& request,
                                const std::vector<int>& allowed) const
    -> result<nlohmann::json> {
    auto response = send(request, allowed);
    if (!response) {
        return unexpected{response.error()};
    }
    return parse_json(response.value());
}

auto service_session::encode_payload(const nlohmann::json& payload) -> std::string {
    return encoding::base64_encode(payload.dump());
}

auto service_session::parse_json(const http_response& response) -> result<nlohmann::json> {
    try {
        return nlohmann::json::parse(response.body);
    } catch (const nlohmann::json::exception& e) {
        return unexpected{error{error_code::malformed_response,
                                std::string("response is not valid JSON: ") + e.what(),
                                response.status_code}};
    }
}

}  // namespace kcenon::package_client
