/**
 * @file transfer_coordinator.h
 * @brief Distribution upload and conditional download protocol
 */

#ifndef KCENON_PACKAGE_CLIENT_CLIENT_TRANSFER_COORDINATOR_H
#define KCENON_PACKAGE_CLIENT_CLIENT_TRANSFER_COORDINATOR_H

#include <kcenon/package_client/client/client_types.h>
#include <kcenon/package_client/client/distribution_stream.h>
#include <kcenon/package_client/client/service_session.h>
#include <kcenon/package_client/core/content_hasher.h>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <istream>
#include <memory>
#include <optional>
#include <string>

namespace kcenon::package_client {

/**
 * @brief Runs the stage -> store -> commit upload and the validated download
 *
 * Each phase runs strictly after the previous one and nothing is retried.
 * A failed store consumes the staging grant; recovering from it means
 * starting over with a fresh stage (see is_restart_required()).
 *
 * The coordinator keeps no per-transfer state, so one instance may serve
 * concurrent transfers as long as each has its own grant and stream.
 * Streams are borrowed and never closed.
 *
 * @code
 * transfer_coordinator coordinator(session);
 * std::ifstream file("pkg-1.0.tar.bz2", std::ios::binary);
 *
 * upload_options options;
 * options.distribution_type = "conda";
 * auto meta = coordinator.upload({"owner", "pkg", "1.0", "pkg-1.0.tar.bz2"}, file, options);
 * if (!meta && is_restart_required(meta.error())) {
 *     // stage again before retrying
 * }
 * @endcode
 */
class transfer_coordinator {
public:
    explicit transfer_coordinator(std::shared_ptr<service_session> session);

    // ========================================================================
    // Upload
    // ========================================================================

    /**
     * @brief Upload a distribution from a stream
     *
     * Stages first, then derives the digest (hashing only when no MD5 was
     * supplied, and rewinding afterwards), stores and commits. Without an
     * MD5 the stream must report its position, otherwise unsupported_stream
     * is returned before anything is sent.
     *
     * @return Server metadata from the commit phase
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
     * @brief Stage phase: register the upload and obtain a storage grant
     *
     * Any 2xx reply is accepted.
     *
     * @return Grant, malformed_attributes if attrs is not an object, or
     *         malformed_response if the reply lacks a grant field
     */
    [[nodiscard]] auto stage(const transfer_target& target, const upload_options& options)
        -> result<staging_grant>;

    /**
     * @brief Store phase: send the file to the storage backend
     *
     * Consumes the grant whatever the outcome. Reads exactly digest.size
     * bytes from the stream's current position.
     *
     * @return store_failed on any non-201 reply or transport failure,
     *         grant_consumed if the grant was already used,
     *         transfer_cancelled if the cancellation token fired. The
     *         grant is spent in that case too, so retrying needs a new stage.
     */
    [[nodiscard]] auto store(staging_grant& grant,
                             const transfer_target& target,
                             std::istream& stream,
                             const content_digest& digest,
                             const upload_options& options) -> result<void>;

    /**
     * @brief Commit phase: publish the stored distribution
     *
     * Any 2xx reply is accepted, an empty body yields an empty object.
     *
     * @return Server metadata, or invalid_state if the grant was not stored
     */
    [[nodiscard]] auto commit(const staging_grant& grant, const transfer_target& target)
        -> result<nlohmann::json>;

    // ========================================================================
    // Download
    // ========================================================================

    /**
     * @brief Request a distribution, validated against a known MD5
     *
     * Redirects are not followed here, so an unchanged file costs only the
     * metadata request.
     *
     * @param known_md5 Hex MD5 of the caller's copy, sent as ETag
     * @return not_modified, or redirected with a lazy stream of the content
     */
    [[nodiscard]] auto download(const transfer_target& target,
                                const std::optional<std::string>& known_md5 = std::nullopt)
        -> result<download_outcome>;

private:
    std::shared_ptr<service_session> session_;
};

}  // namespace kcenon::package_client

#endif  // KCENON_PACKAGE_CLIENT_CLIENT_TRANSFER_COORDINATOR_H
