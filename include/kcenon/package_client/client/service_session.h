/**
 * @file service_session.h
 * @brief Shared HTTP session bound to one service configuration
 */

#ifndef KCENON_PACKAGE_CLIENT_CLIENT_SERVICE_SESSION_H
#define KCENON_PACKAGE_CLIENT_CLIENT_SERVICE_SESSION_H

#include <kcenon/package_client/client/client_config.h>
#include <kcenon/package_client/http/http_transport.h>
#include <kcenon/package_client/http/response_classifier.h>

#include <nlohmann/json.hpp>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::package_client {

/**
 * @brief Configuration, transport and classifier shared by API calls
 *
 * Owned through std::shared_ptr by the metadata API and every transfer
 * coordinator of a client. Thread-safe: the token may be replaced while
 * other threads build requests.
 */
class service_session {
public:
    service_session(client_config config, std::shared_ptr<http_transport> transport);

    service_session(const service_session&) = delete;
    auto operator=(const service_session&) -> service_session& = delete;

    /**
     * @brief Snapshot of the current configuration
     */
    [[nodiscard]] auto config() const -> client_config;

    /**
     * @brief Replace the token used for subsequent requests
     */
    void set_token(std::optional<std::string> token);

    [[nodiscard]] auto transport() const -> std::shared_ptr<http_transport> { return transport_; }

    [[nodiscard]] auto classifier() -> response_classifier& { return classifier_; }
    [[nodiscard]] auto classifier() const -> const response_classifier& { return classifier_; }

    /**
     * @brief Build a service request with the default headers applied
     * @param path Path below the domain, beginning with '/'
     */
    [[nodiscard]] auto make_request(http_method method, const std::string& path) const
        -> http_request;

    /**
     * @brief Perform a request and check its status
     */
    [[nodiscard]] auto send(const http_request& request,
                            const std::vector<int>& allowed = {200}) const
        -> result<http_response>;

    /**
     * @brief Perform a request, check its status and parse the JSON body
     */
    [[nodiscard]] auto send_json(const http_request& request,
                                 const std::vector<int>& allowed = {200}) const
        -> result<nlohmann::json>;

    /**
     * @brief Encode a payload the way the service expects: base64 of the JSON text
     */
    [[nodiscard]] static auto encode_payload(const nlohmann::json& payload) -> std::string;

    /**
     * @brief Parse a JSON response body
     * @return Parsed value, or malformed_response
     */
    [[nodiscard]] static auto parse_json(const http_response& response)
        -> result<nlohmann::json>;

private:
    mutable std::mutex config_mutex_;
    client_config config_;
    std::shared_ptr<http_transport> transport_;
    response_classifier classifier_;
};

}  // namespace kcenon::package_client

#endif  // KCENON_PACKAGE_CLIENT_CLIENT_SERVICE_SESSION_H
