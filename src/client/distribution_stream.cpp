/**
 * @file distribution_stream.cpp
 * @brief Implementation of lazy distribution downloads
 */

#include "kcenon/package_client/client/distribution_stream.h"

#include "kcenon/package_client/core/encoding.h"
#include "kcenon/package_client/core/logging.h"
#include "kcenon/package_client/http/response_classifier.h"

#include <fstream>
#include <system_error>

namespace kcenon::package_client {

distribution_stream::distribution_stream(std::shared_ptr<http_transport> transport,
                                         std::string url,
                                         std::chrono::milliseconds timeout,
                                         bool verify_tls)
    : transport_(std::move(transport)),
      url_(std::move(url)),
      timeout_(timeout),
      verify_tls_(verify_tls) {}

auto distribution_stream::read_all(const body_sink& sink, stream_options options) const
    -> result<uint64_t> {
    if (!transport_) {
        return unexpected{error{error_code::transport_unavailable,
                                "distribution stream has no transport"}};
    }

    http_request request;
    request.method = http_method::get;
    request.url = url_;
    request.follow_redirects = true;
    request.timeout = timeout_;
    request.verify_tls = verify_tls_;

    uint64_t received = 0;
    body_sink counting_sink = [&](std::span<const std::byte> chunk) -> result<void> {
        if (options.cancel && options.cancel->is_cancelled()) {
            return unexpected{error{error_code::transfer_cancelled,
                                    "download cancelled after " +
                                        std::to_string(received) + " bytes"}};
        }
        auto delivered = sink(chunk);
        if (!delivered) {
            return delivered;
        }
        received += chunk.size();
        if (options.on_progress) {
            options.on_progress(received);
        }
        return {};
    };

    auto start = std::chrono::steady_clock::now();
    auto response = transport_->perform_streaming(request, counting_sink);
    if (!response) {
        transfer_log_context ctx;
        ctx.url = url_;
        ctx.bytes_transferred = received;
        ctx.error_message = response.error().message;
        PC_LOG_ERROR_CTX(log_category::download, "content download failed", ctx);
        return unexpected{response.error()};
    }

    const auto& res = response.value();
    if (!res.is_success()) {
        return unexpected{error{response_classifier::code_for_status(res.status_code),
                                response_classifier::error_message(res),
                                res.status_code}};
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    transfer_log_context ctx;
    ctx.url = url_;
    ctx.bytes_transferred = received;
    ctx.http_status = res.status_code;
    ctx.duration_ms = static_cast<uint64_t>(elapsed.count());
    if (elapsed.count() > 0) {
        ctx.rate_mbps = static_cast<double>(received) / 1024.0 / 1024.0 /
                        (static_cast<double>(elapsed.count()) / 1000.0);
    }
    PC_LOG_INFO_CTX(log_category::download, "content downloaded", ctx);
    return received;
}

auto distribution_stream::save_to(const std::filesystem::path& destination,
                                  stream_options options) const
    -> result<content_digest> {
    auto temp = destination;
    temp += ".part-" + encoding::generate_random_hex(4);

    std::ofstream out(temp, std::ios::binary | std::ios::trunc);
    if (!out) {
        return unexpected{error{error_code::file_write_error,
                                "cannot open " + temp.string() + " for writing"}};
    }

    md5_accumulator digest;
    body_sink file_sink = [&](std::span<const std::byte> chunk) -> result<void> {
        out.write(reinterpret_cast<const char*>(chunk.data()),
                  static_cast<std::streamsize>(chunk.size()));
        if (!out) {
            return unexpected{error{error_code::file_write_error,
                                    "write to " + temp.string() + " failed"}};
        }
        return digest.update(chunk);
    };

    auto discard = [&temp, &out] {
        out.close();
        std::error_code ec;
        std::filesystem::remove(temp, ec);
    };

    auto received = read_all(file_sink, std::move(options));
    if (!received) {
        discard();
        return unexpected{received.error()};
    }

    out.close();
    if (!out) {
        discard();
        return unexpected{error{error_code::file_write_error,
                                "closing " + temp.string() + " failed"}};
    }

    std::error_code ec;
    std::filesystem::rename(temp, destination, ec);
    if (ec) {
        discard();
        return unexpected{error{error_code::file_write_error,
                                "cannot move download into " + destination.string() +
                                    ": " + ec.message()}};
    }

    return digest.finish();
}

// ============================================================================
// download_outcome
// ============================================================================

auto download_outcome::not_modified() -> download_outcome {
    return download_outcome(kind::not_modified);
}

auto download_outcome::redirected(distribution_stream stream) -> download_outcome {
    download_outcome outcome(kind::redirected);
    outcome.stream_ = std::move(stream);
    return outcome;
}

auto download_outcome::location() const -> std::string {
    return stream_ ? stream_->url() : std::string{};
}

}  // namespace kcenon::package_client
