/**
 * @file client_config.h
 * @brief Session configuration for the package hosting client
 */

#ifndef KCENON_PACKAGE_CLIENT_CLIENT_CLIENT_CONFIG_H
#define KCENON_PACKAGE_CLIENT_CLIENT_CLIENT_CONFIG_H

#include <kcenon/package_client/core/content_hasher.h>
#include <kcenon/package_client/core/types.h>
#include <kcenon/package_client/http/http_types.h>
#include <kcenon/package_client/http/response_classifier.h>

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace kcenon::package_client {

/**
 * @brief Default service endpoint
 */
inline constexpr const char* default_domain = "https://api.anaconda.org";

/**
 * @brief Explicit session configuration
 *
 * Replaces process-wide session state: the base URL, token and protocol
 * version header are carried here and applied to every request built from
 * this configuration.
 */
struct client_config {
    std::string domain = default_domain;
    std::optional<std::string> token;

    std::string version_header = protocol_version_header;
    std::string client_version = client_protocol_version;

    /// Timeout for stage, commit, download and metadata requests
    std::chrono::milliseconds request_timeout{30000};

    /// Upper bound for the store phase, large uploads can take hours
    std::chrono::seconds store_timeout{10 * 60 * 60};

    bool verify_tls = true;
    std::size_t read_chunk_size = default_read_chunk_size;
    std::string user_agent = "package-client/0.1.0";

    /**
     * @brief Validate the configuration
     * @return invalid_configuration describing the first bad field
     */
    [[nodiscard]] auto validate() const -> result<void>;

    /**
     * @brief Overlay environment variables on a base configuration
     *
     * Reads PACKAGE_CLIENT_DOMAIN, PACKAGE_CLIENT_TOKEN and
     * PACKAGE_CLIENT_STORE_TIMEOUT_SECONDS. Unset variables keep the base value.
     */
    [[nodiscard]] static auto from_environment(client_config base)
        -> result<client_config>;

    /**
     * @brief Overlay environment variables on a default configuration
     */
    [[nodiscard]] static auto from_environment() -> result<client_config>;

    /**
     * @brief Build an absolute URL from a path beginning with '/'
     */
    [[nodiscard]] auto url(const std::string& path) const -> std::string;

    /**
     * @brief Default headers for authenticated service requests
     */
    [[nodiscard]] auto default_headers() const -> http_headers;
};

}  // namespace kcenon::package_client

#endif  // KCENON_PACKAGE_CLIENT_CLIENT_CLIENT_CONFIG_H
