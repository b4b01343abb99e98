/**
 * @file hub_client.h
 * @brief Package hosting client facade
 */

#ifndef KCENON_PACKAGE_CLIENT_CLIENT_HUB_CLIENT_H
#define KCENON_PACKAGE_CLIENT_CLIENT_HUB_CLIENT_H

#include <chrono>
#include <filesystem>
#include <istream>
#include <memory>
#include <optional>
#include <string>

#include "kcenon/package_client/client/client_config.h"
#include "kcenon/package_client/client/client_types.h"
#include "kcenon/package_client/client/distribution_stream.h"
#include "kcenon/package_client/client/package_api.h"
#include "kcenon/package_client/client/transfer_coordinator.h"
#include "kcenon/package_client/core/types.h"
#include "kcenon/package_client/http/http_transport.h"

namespace kcenon::package_client {

/**
 * @brief Client for a package hosting service
 *
 * Owns one session (configuration and HTTP transport) shared by the
 * metadata API and the transfer coordinator.
 *
 * @code
 * auto client_result = hub_client::builder()
 *     .with_domain("https://api.anaconda.org")
 *     .with_token(token)
 *     .build();
 *
 * if (client_result.has_value()) {
 *     auto& client = client_result.value();
 *     auto outcome = client.download({"owner", "pkg", "1.0", "pkg-1.0.tar.bz2"});
 * }
 * @endcode
 */
class hub_client {
public:
    /**
     * @brief Builder for hub_client
     */
    class builder {
    public:
        builder();

        /**
         * @brief Start from an existing configuration
         */
        auto with_config(client_config config) -> builder&;

        /**
         * @brief Overlay PACKAGE_CLIENT_* environment variables at build()
         */
        auto with_environment(bool enable = true) -> builder&;

        /**
         * @brief Set service base URL (default: https://api.anaconda.org)
         */
        auto with_domain(std::string domain) -> builder&;

        /**
         * @brief Set the authentication token
         */
        auto with_token(std::string token) -> builder&;

        /**
         * @brief Set timeout for stage, commit and metadata requests (default: 30s)
         */
        auto with_request_timeout(std::chrono::milliseconds timeout) -> builder&;

        /**
         * @brief Set upper bound for the store phase and content downloads (default: 10h)
         */
        auto with_store_timeout(std::chrono::seconds timeout) -> builder&;

        /**
         * @brief Enable or disable TLS certificate verification (default: on)
         */
        auto with_verify_tls(bool verify) -> builder&;

        /**
         * @brief Set read chunk size for hashing and uploads (default: 256KB)
         */
        auto with_read_chunk_size(std::size_t size) -> builder&;

        auto with_user_agent(std::string user_agent) -> builder&;

        /**
         * @brief Use a specific transport instead of the default one
         */
        auto with_transport(std::shared_ptr<http_transport> transport) -> builder&;

        /**
         * @brief Build the client instance
         * @return Result containing the client or invalid_configuration
         */
        [[nodiscard]] auto build() -> result<hub_client>;

    private:
        client_config config_;
        bool use_environment_ = false;
        std::shared_ptr<http_transport> transport_;
    };

    // Non-copyable, movable
    hub_client(const hub_client&) = delete;
    auto operator=(const hub_client&) -> hub_client& = delete;
    hub_client(hub_client&&) noexcept;
    auto operator=(hub_client&&) noexcept -> hub_client&;
    ~hub_client();

    /**
     * @brief Metadata requests (users, packages, releases, search)
     */
    [[nodiscard]] auto api() -> package_api&;

    /**
     * @brief Upload and download protocol
     */
    [[nodiscard]] auto transfers() -> transfer_coordinator&;

    /**
     * @brief Current configuration, including a token set by authenticate()
     */
    [[nodiscard]] auto config() const -> client_config;

    /**
     * @brief Create a token and use it for subsequent requests
     */
    [[nodiscard]] auto authenticate(const std::string& username,
                                    const std::string& password,
                                    const authentication_options& options)
        -> result<std::string>;

    /**
     * @brief Upload a distribution from a stream
     */
    [[nodiscard]] auto upload(const transfer_target& target,
                              std::istream& stream,
                              const upload_options& options) -> result<nlohmann::json>;

    /**
     * @brief Upload a distribution from a file
     */
    [[nodiscard]] auto upload_file(const transfer_target& target,
                                   const std::filesystem::path& path,
                                   const upload_options& options) -> result<nlohmann::json>;

    /**
     * @brief Conditionally download a distribution
     */
    [[nodiscard]] auto download(const transfer_target& target,
                                const std::optional<std::string>& known_md5 = std::nullopt)
        -> result<download_outcome>;

    /**
     * @brief Be told when the server speaks a newer protocol than this client
     */
    void on_version_warning(version_warning_callback callback);

private:
    explicit hub_client(std::shared_ptr<service_session> session);

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::package_client

#endif  // KCENON_PACKAGE_CLIENT_CLIENT_HUB_CLIENT_H
