/**
 * @file client_types.h
 * @brief Types exchanged between callers and the transfer coordinator
 */

#ifndef KCENON_PACKAGE_CLIENT_CLIENT_CLIENT_TYPES_H
#define KCENON_PACKAGE_CLIENT_CLIENT_CLIENT_TYPES_H

#include <kcenon/package_client/core/multipart_encoder.h>
#include <kcenon/package_client/core/types.h>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::package_client {

/**
 * @brief Logical slot of a distribution: owner/package/version/basename
 *
 * The basename may contain '/' (platform subdirectories).
 */
struct transfer_target {
    std::string owner;
    std::string package;
    std::string version;
    std::string basename;

    /**
     * @brief URL path below an endpoint prefix, e.g. "/owner/pkg/1.0/file.tar.bz2"
     */
    [[nodiscard]] auto path() const -> std::string;

    [[nodiscard]] auto to_string() const -> std::string {
        return owner + "/" + package + "/" + version + "/" + basename;
    }

    [[nodiscard]] auto operator==(const transfer_target&) const -> bool = default;
};

class transfer_coordinator;

/**
 * @brief Single-use storage grant issued by the stage phase
 *
 * The form fields are opaque to the client and are forwarded to the
 * storage backend verbatim and in order. A grant backs exactly one store
 * attempt; after that attempt, successful or not, it is consumed and a
 * fresh stage is needed to try again.
 */
class staging_grant {
public:
    staging_grant(std::string storage_url, form_fields fields, std::string dist_id);

    staging_grant(const staging_grant&) = delete;
    auto operator=(const staging_grant&) -> staging_grant& = delete;
    staging_grant(staging_grant&&) noexcept = default;
    auto operator=(staging_grant&&) noexcept -> staging_grant& = default;

    [[nodiscard]] auto storage_url() const -> const std::string& { return storage_url_; }
    [[nodiscard]] auto fields() const -> const form_fields& { return fields_; }
    [[nodiscard]] auto dist_id() const -> const std::string& { return dist_id_; }

    [[nodiscard]] auto is_consumed() const noexcept -> bool { return consumed_; }
    [[nodiscard]] auto is_stored() const noexcept -> bool { return stored_; }

private:
    friend class transfer_coordinator;

    std::string storage_url_;
    form_fields fields_;
    std::string dist_id_;
    bool consumed_ = false;
    bool stored_ = false;
};

/**
 * @brief Progress of the store phase
 */
struct upload_progress {
    transfer_target target;
    uint64_t bytes_sent = 0;
    uint64_t total_bytes = 0;

    [[nodiscard]] auto percentage() const -> double {
        if (total_bytes == 0) return 0.0;
        return static_cast<double>(bytes_sent) / static_cast<double>(total_bytes) * 100.0;
    }
};

/**
 * @brief Options for uploading one distribution
 */
struct upload_options {
    std::string distribution_type;
    std::string description;

    /// Extra attributes, must be a JSON object; null is treated as empty
    nlohmann::json attrs = nullptr;

    /// Pre-computed MD5 as 32 hex characters, skips hashing
    std::optional<std::string> md5;

    /// Byte length; with md5 it skips sizing, without it caps the hash read
    std::optional<uint64_t> size;

    std::function<void(const upload_progress&)> on_progress;
    std::optional<cancellation_token> cancel;
};

/**
 * @brief Options for registering a package
 */
struct package_options {
    std::optional<std::string> summary;
    std::optional<std::string> license;
    std::optional<std::string> license_url;
    bool public_access = true;
    bool publish = true;
    nlohmann::json attrs = nlohmann::json::object();
};

/**
 * @brief Options for creating an authentication token
 */
struct authentication_options {
    std::string application;
    std::optional<std::string> application_url;
    std::optional<std::string> for_user;
    std::vector<std::string> scopes;
    std::optional<int64_t> max_age;
    std::optional<std::string> created_with;
    std::string strength = "strong";
};

}  // namespace kcenon::package_client

#endif  // KCENON_PACKAGE_CLIENT_CLIENT_CLIENT_TYPES_H
