/**
 * @file response_classifier.h
 * @brief Maps service responses to typed outcomes
 */

#ifndef KCENON_PACKAGE_CLIENT_HTTP_RESPONSE_CLASSIFIER_H
#define KCENON_PACKAGE_CLIENT_HTTP_RESPONSE_CLASSIFIER_H

#include <kcenon/package_client/http/http_types.h>

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace kcenon::package_client {

/**
 * @brief Protocol version this client speaks
 */
inline constexpr const char* client_protocol_version = "0.4.2";

/**
 * @brief Response header carrying the server protocol version
 */
inline constexpr const char* protocol_version_header = "x-binstar-api-version";

/**
 * @brief Version assumed when a server does not send the header
 */
inline constexpr const char* default_server_protocol_version = "0.2.1";

/**
 * @brief Callback for server-newer version skew: (server version, client version)
 */
using version_warning_callback =
    std::function<void(const std::string&, const std::string&)>;

/**
 * @brief Compare two dotted version strings
 * @return Negative if a < b, zero if equal, positive if a > b
 */
[[nodiscard]] auto compare_versions(std::string_view a, std::string_view b) -> int;

/**
 * @brief Short and long description of an HTTP status code
 */
struct status_description {
    const char* short_text;
    const char* long_text;
};

/**
 * @brief Classifies HTTP responses from the package hosting service
 *
 * Every checked response first has its protocol version compared with the
 * client's. A newer server produces a warning, never an error. A status
 * outside the allowed set then becomes a typed error:
 * 401 -> unauthorized, 404 -> not_found, 409 -> conflict, anything else
 * -> service_error. The message is the JSON body's "error" field when
 * present, otherwise "Short: Long (status code: N)".
 */
class response_classifier {
public:
    explicit response_classifier(std::string client_version = client_protocol_version,
                                 std::string version_header = protocol_version_header);

    /**
     * @brief Check a response against the allowed status codes
     */
    [[nodiscard]] auto check(const http_response& response,
                             const std::vector<int>& allowed = {200}) const
        -> result<void>;

    /**
     * @brief Compare the server protocol version with the client's
     * @return true if the server is newer and a warning was emitted
     */
    auto check_version(const http_response& response) const -> bool;

    /**
     * @brief Install a callback for version skew warnings
     */
    void set_warning_callback(version_warning_callback callback);

    [[nodiscard]] auto client_version() const -> const std::string& { return client_version_; }

    /**
     * @brief Look up the description of a status code
     */
    [[nodiscard]] static auto describe(int status) -> status_description;

    /**
     * @brief Build the error message for a rejected response
     */
    [[nodiscard]] static auto error_message(const http_response& response) -> std::string;

    /**
     * @brief Map a rejected status code to an error code
     */
    [[nodiscard]] static auto code_for_status(int status) -> error_code;

private:
    std::string client_version_;
    std::string version_header_;
    std::shared_ptr<std::mutex> callback_mutex_;
    version_warning_callback warning_callback_;
};

}  // namespace kcenon::package_client

#endif  // KCENON_PACKAGE_CLIENT_HTTP_RESPONSE_CLASSIFIER_H
