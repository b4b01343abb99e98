/**
 * @file distribution_stream.h
 * @brief Lazy download of distribution content and the download outcome
 */

#ifndef KCENON_PACKAGE_CLIENT_CLIENT_DISTRIBUTION_STREAM_H
#define KCENON_PACKAGE_CLIENT_CLIENT_DISTRIBUTION_STREAM_H

#include <kcenon/package_client/core/content_hasher.h>
#include <kcenon/package_client/core/types.h>
#include <kcenon/package_client/http/http_transport.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace kcenon::package_client {

/**
 * @brief Download progress: cumulative bytes received
 */
using download_progress_callback = std::function<void(uint64_t)>;

/**
 * @brief Options for reading a distribution body
 */
struct stream_options {
    download_progress_callback on_progress;
    std::optional<cancellation_token> cancel;
};

/**
 * @brief Content at a storage location, fetched only when read
 *
 * Nothing is transferred until read_all() or save_to() is called. The
 * request carries no credentials and no cache validator, and follows
 * redirects. Each call performs a new request.
 */
class distribution_stream {
public:
    distribution_stream(std::shared_ptr<http_transport> transport,
                        std::string url,
                        std::chrono::milliseconds timeout,
                        bool verify_tls);

    [[nodiscard]] auto url() const -> const std::string& { return url_; }

    /**
     * @brief Stream the content to a sink chunk by chunk
     *
     * A non-2xx final status is reported as an error after the transfer,
     * the sink may already have received the error body by then.
     *
     * @return Number of bytes delivered
     */
    [[nodiscard]] auto read_all(const body_sink& sink, stream_options options = {}) const
        -> result<uint64_t>;

    /**
     * @brief Write the content to a file
     *
     * Data goes to a temporary file next to the destination, which is
     * renamed into place once the transfer succeeds. The MD5 is computed
     * while streaming.
     *
     * @return Digest of the written content
     */
    [[nodiscard]] auto save_to(const std::filesystem::path& destination,
                               stream_options options = {}) const
        -> result<content_digest>;

private:
    std::shared_ptr<http_transport> transport_;
    std::string url_;
    std::chrono::milliseconds timeout_;
    bool verify_tls_;
};

/**
 * @brief Result of a conditional download request
 */
class download_outcome {
public:
    enum class kind {
        not_modified,  ///< Caller's content is current, nothing to transfer
        redirected     ///< Content is available at location()
    };

    [[nodiscard]] static auto not_modified() -> download_outcome;
    [[nodiscard]] static auto redirected(distribution_stream stream) -> download_outcome;

    [[nodiscard]] auto status() const noexcept -> kind { return kind_; }
    [[nodiscard]] auto is_not_modified() const noexcept -> bool {
        return kind_ == kind::not_modified;
    }
    [[nodiscard]] auto is_redirected() const noexcept -> bool {
        return kind_ == kind::redirected;
    }

    /**
     * @brief Redirect target, empty when not modified
     */
    [[nodiscard]] auto location() const -> std::string;

    /**
     * @brief Lazy body, only set when redirected
     */
    [[nodiscard]] auto stream() const -> const std::optional<distribution_stream>& {
        return stream_;
    }

private:
    explicit download_outcome(kind k) : kind_(k) {}

    kind kind_;
    std::optional<distribution_stream> stream_;
};

}  // namespace kcenon::package_client

#endif  // KCENON_PACKAGE_CLIENT_CLIENT_DISTRIBUTION_STREAM_H
