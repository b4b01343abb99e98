/**
 * @file package_api.h
 * @brief Account, package, release and distribution metadata requests
 */

#ifndef KCENON_PACKAGE_CLIENT_CLIENT_PACKAGE_API_H
#define KCENON_PACKAGE_CLIENT_CLIENT_PACKAGE_API_H

#include <kcenon/package_client/client/client_types.h>
#include <kcenon/package_client/client/service_session.h>

#include <nlohmann/json.hpp>

#include <memory>
#include <optional>
#include <string>

namespace kcenon::package_client {

/**
 * @brief Thin request/response mapping over the service's REST endpoints
 *
 * Every call is one request checked by the response classifier. JSON
 * payloads are sent base64 encoded.
 */
class package_api {
public:
    explicit package_api(std::shared_ptr<service_session> session);

    // ========================================================================
    // Authentication
    // ========================================================================

    /**
     * @brief Create a token with HTTP basic authentication
     *
     * The returned token is also installed in the session so later
     * requests are authenticated.
     */
    [[nodiscard]] auto authenticate(const std::string& username,
                                    const std::string& password,
                                    const authentication_options& options)
        -> result<std::string>;

    /**
     * @brief Information about the current token
     */
    [[nodiscard]] auto authentication() -> result<nlohmann::json>;

    /**
     * @brief List tokens of the current user
     */
    [[nodiscard]] auto authentications() -> result<nlohmann::json>;

    [[nodiscard]] auto remove_authentication(const std::string& auth_id) -> result<void>;

    /**
     * @brief List the scopes a token can be limited to
     *
     * Sent without credentials.
     */
    [[nodiscard]] auto list_scopes() -> result<nlohmann::json>;

    // ========================================================================
    // Users and packages
    // ========================================================================

    /**
     * @brief User information, the authenticated user when login is empty
     */
    [[nodiscard]] auto user(const std::optional<std::string>& login = std::nullopt)
        -> result<nlohmann::json>;

    [[nodiscard]] auto user_packages(const std::optional<std::string>& login = std::nullopt)
        -> result<nlohmann::json>;

    [[nodiscard]] auto package(const std::string& owner, const std::string& name)
        -> result<nlohmann::json>;

    [[nodiscard]] auto add_package(const std::string& owner,
                                   const std::string& name,
                                   const package_options& options = {})
        -> result<nlohmann::json>;

    [[nodiscard]] auto remove_package(const std::string& owner, const std::string& name)
        -> result<void>;

    [[nodiscard]] auto package_collaborators(const std::string& owner, const std::string& name)
        -> result<nlohmann::json>;

    [[nodiscard]] auto package_add_collaborator(const std::string& owner,
                                                const std::string& name,
                                                const std::string& collaborator)
        -> result<void>;

    [[nodiscard]] auto package_remove_collaborator(const std::string& owner,
                                                   const std::string& name,
                                                   const std::string& collaborator)
        -> result<void>;

    /**
     * @brief List all packages, optionally only those modified after a time
     */
    [[nodiscard]] auto all_packages(const std::optional<std::string>& modified_after = std::nullopt)
        -> result<nlohmann::json>;

    // ========================================================================
    // Releases and distributions
    // ========================================================================

    [[nodiscard]] auto release(const std::string& owner,
                               const std::string& name,
                               const std::string& version) -> result<nlohmann::json>;

    [[nodiscard]] auto add_release(const std::string& owner,
                                   const std::string& name,
                                   const std::string& version,
                                   const nlohmann::json& requirements,
                                   const nlohmann::json& announce,
                                   const std::string& description) -> result<nlohmann::json>;

    [[nodiscard]] auto remove_release(const std::string& owner,
                                      const std::string& name,
                                      const std::string& version) -> result<nlohmann::json>;

    [[nodiscard]] auto distribution(const transfer_target& target) -> result<nlohmann::json>;

    /**
     * @brief Remove a distribution by basename or by id
     *
     * target.basename is used when set, otherwise dist_id.
     *
     * @return invalid_state if neither is given
     */
    [[nodiscard]] auto remove_dist(const transfer_target& target,
                                   const std::optional<std::string>& dist_id = std::nullopt)
        -> result<nlohmann::json>;

    // ========================================================================
    // Search
    // ========================================================================

    [[nodiscard]] auto search(const std::string& query,
                              const std::optional<std::string>& package_type = std::nullopt)
        -> result<nlohmann::json>;

private:
    std::shared_ptr<service_session> session_;
};

}  // namespace kcenon::package_client

#endif  // KCENON_PACKAGE_CLIENT_CLIENT_PACKAGE_API_H
