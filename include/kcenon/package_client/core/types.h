/**
 * @file types.h
 * @brief Core type definitions for package_client
 */

#ifndef KCENON_PACKAGE_CLIENT_CORE_TYPES_H
#define KCENON_PACKAGE_CLIENT_CORE_TYPES_H

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::package_client {

/**
 * @brief Error codes for package hosting operations
 */
enum class error_code {
    success = 0,

    // Service status errors (-100 to -119)
    unauthorized = -100,
    not_found = -101,
    conflict = -102,
    service_error = -103,
    malformed_response = -104,

    // Transfer protocol errors (-120 to -139)
    store_failed = -120,
    grant_consumed = -121,
    invalid_state = -122,
    transfer_cancelled = -123,

    // Input errors (-140 to -159)
    unsupported_stream = -140,
    malformed_attributes = -141,
    invalid_digest = -142,
    invalid_configuration = -143,

    // File errors (-160 to -179)
    file_not_found = -160,
    file_read_error = -161,
    file_write_error = -162,

    // Transport errors (-180 to -199)
    connection_failed = -180,
    connection_timeout = -181,
    transport_unavailable = -182,

    // Internal errors (-200 to -219)
    internal_error = -200,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::unauthorized:
            return "unauthorized";
        case error_code::not_found:
            return "not found";
        case error_code::conflict:
            return "conflict";
        case error_code::service_error:
            return "service error";
        case error_code::malformed_response:
            return "malformed response";
        case error_code::store_failed:
            return "store to storage backend failed";
        case error_code::grant_consumed:
            return "staging grant already consumed";
        case error_code::invalid_state:
            return "invalid state";
        case error_code::transfer_cancelled:
            return "transfer cancelled";
        case error_code::unsupported_stream:
            return "unsupported stream";
        case error_code::malformed_attributes:
            return "malformed attributes";
        case error_code::invalid_digest:
            return "invalid digest";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::file_not_found:
            return "file not found";
        case error_code::file_read_error:
            return "file read error";
        case error_code::file_write_error:
            return "file write error";
        case error_code::connection_failed:
            return "connection failed";
        case error_code::connection_timeout:
            return "connection timeout";
        case error_code::transport_unavailable:
            return "transport unavailable";
        case error_code::internal_error:
            return "internal error";
        default:
            return "unknown error";
    }
}

/**
 * @brief Error type with code, message and the HTTP status that caused it
 *
 * http_status is 0 when the failure did not come from an HTTP response.
 */
struct error {
    error_code code;
    std::string message;
    int http_status = 0;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}
    error(error_code c, std::string msg, int status)
        : code(c), message(std::move(msg)), http_status(status) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Check whether recovering from an error needs a fresh stage
 *
 * A failed or repeated store consumes the staging grant, so the whole
 * upload has to be restarted rather than resumed. A store interrupted by
 * cancellation also spends its grant, but reports transfer_cancelled so the
 * caller can tell it apart; resuming it likewise needs a fresh stage.
 */
[[nodiscard]] inline auto is_restart_required(const error& err) noexcept -> bool {
    return err.code == error_code::store_failed ||
           err.code == error_code::grant_consumed;
}

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

/**
 * @brief Caller-driven cancellation signal for long transfers
 *
 * Copies share the same flag. Producers check it between chunks, so a
 * cancel takes effect at the next chunk boundary.
 */
class cancellation_token {
public:
    cancellation_token() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() noexcept { flag_->store(true); }

    [[nodiscard]] auto is_cancelled() const noexcept -> bool { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

}  // namespace kcenon::package_client

#endif  // KCENON_PACKAGE_CLIENT_CORE_TYPES_H
