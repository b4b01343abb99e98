/**
 * @file transfer_coordinator.cpp
 * @brief Implementation of the distribution transfer protocol
 */

#include "kcenon/package_client/client/transfer_coordinator.h"

#include "kcenon/package_client/core/encoding.h"
#include "kcenon/package_client/core/logging.h"
#include "kcenon/package_client/core/multipart_encoder.h"

#include <chrono>
#include <fstream>
#include <string>
#include <vector>

namespace kcenon::package_client {

namespace {

constexpr std::size_t max_logged_body = 512;

auto malformed(const std::string& message) -> unexpected {
    return unexpected{error{error_code::malformed_response, message}};
}

// Storage form values are forwarded as text, non-string values keep their JSON form
auto field_text(const nlohmann::ordered_json& value) -> std::string {
    return value.is_string() ? value.get<std::string>() : value.dump();
}

// Stage and commit accept any 2xx answer
auto success_statuses() -> const std::vector<int>& {
    static const std::vector<int> statuses = [] {
        std::vector<int> codes;
        for (int code = 200; code < 300; ++code) {
            codes.push_back(code);
        }
        return codes;
    }();
    return statuses;
}

// Storage form keys are unique, the digest fields replace values the grant already carries
void set_field(form_fields& fields, const std::string& name, std::string value) {
    for (auto& field : fields) {
        if (field.first == name) {
            field.second = std::move(value);
            return;
        }
    }
    fields.emplace_back(name, std::move(value));
}

auto elapsed_ms(std::chrono::steady_clock::time_point start) -> uint64_t {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count());
}

}  // namespace

// ============================================================================
// transfer_target / staging_grant
// ============================================================================

auto transfer_target::path() const -> std::string {
    return "/" + encoding::url_encode(owner) + "/" + encoding::url_encode(package) + "/" +
           encoding::url_encode(version) + "/" + encoding::url_encode(basename, true);
}

staging_grant::staging_grant(std::string storage_url, form_fields fields, std::string dist_id)
    : storage_url_(std::move(storage_url)),
      fields_(std::move(fields)),
      dist_id_(std::move(dist_id)) {}

// ============================================================================
// transfer_coordinator
// ============================================================================

transfer_coordinator::transfer_coordinator(std::shared_ptr<service_session> session)
    : session_(std::move(session)) {}

auto transfer_coordinator::upload(const transfer_target& target,
                                  std::istream& stream,
                                  const upload_options& options) -> result<nlohmann::json> {
    // Hashing reads the stream once, it has to be rewound before the store.
    // Checked before staging so a local failure leaves nothing on the server.
    std::istream::pos_type start_pos(-1);
    if (!options.md5) {
        start_pos = stream.tellg();
        if (start_pos == std::istream::pos_type(-1)) {
            return unexpected{error{error_code::unsupported_stream,
                "stream cannot be rewound after hashing, supply md5 and size "
                "to upload from a non-seekable stream"}};
        }
    }

    auto grant = stage(target, options);
    if (!grant) {
        return unexpected{grant.error()};
    }

    // Hash only now, staging must not wait on reading a large file
    content_hasher hasher(session_->config().read_chunk_size);
    auto digest = hasher.resolve(stream, options.md5, options.size);
    if (!digest) {
        return unexpected{digest.error()};
    }

    if (!options.md5) {
        stream.clear();
        stream.seekg(start_pos);
        if (!stream) {
            return unexpected{error{error_code::unsupported_stream,
                                    "stream could not be rewound after hashing"}};
        }
    }

    auto stored = store(grant.value(), target, stream, digest.value(), options);
    if (!stored) {
        return unexpected{stored.error()};
    }

    return commit(grant.value(), target);
}

auto transfer_coordinator::upload_file(const transfer_target& target,
                                       const std::filesystem::path& path,
                                       const upload_options& options)
    -> result<nlohmann::json> {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return unexpected{error{error_code::file_not_found,
                                "not a regular file: " + path.string()}};
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return unexpected{error{error_code::file_read_error,
                                "cannot open " + path.string()}};
    }
    return upload(target, file, options);
}

auto transfer_coordinator::stage(const transfer_target& target,
                                 const upload_options& options) -> result<staging_grant> {
    nlohmann::json attrs = options.attrs;
    if (attrs.is_null()) {
        attrs = nlohmann::json::object();
    }
    if (!attrs.is_object()) {
        return unexpected{error{error_code::malformed_attributes,
            std::string("attrs must be a JSON object, got ") + attrs.type_name()}};
    }

    nlohmann::json payload = {
        {"distribution_type", options.distribution_type},
        {"description", options.description},
        {"attrs", attrs},
    };

    auto request = session_->make_request(http_method::post, "/stage" + target.path());
    request.body = service_session::encode_payload(payload);

    transfer_log_context ctx;
    ctx.target = target.to_string();

    auto response = session_->send(request, success_statuses());
    if (!response) {
        ctx.http_status = response.error().http_status;
        ctx.error_message = response.error().message;
        PC_LOG_ERROR_CTX(log_category::stage, "stage rejected", ctx);
        return unexpected{response.error()};
    }

    nlohmann::ordered_json body;
    try {
        body = nlohmann::ordered_json::parse(response.value().body);
    } catch (const nlohmann::json::exception& e) {
        return malformed(std::string("stage response is not valid JSON: ") + e.what());
    }

    if (!body.is_object()) {
        return malformed("stage response is not a JSON object");
    }
    auto url = body.find("s3_url");
    if (url == body.end() || !url->is_string()) {
        return malformed("stage response has no storage URL (s3_url)");
    }
    auto form = body.find("s3form_data");
    if (form == body.end() || !form->is_object()) {
        return malformed("stage response has no storage form fields (s3form_data)");
    }
    auto dist = body.find("dist_id");
    if (dist == body.end() || dist->is_null()) {
        return malformed("stage response has no distribution id (dist_id)");
    }

    form_fields fields;
    for (auto it = form->begin(); it != form->end(); ++it) {
        fields.emplace_back(it.key(), field_text(it.value()));
    }

    staging_grant grant(url->get<std::string>(), std::move(fields), field_text(*dist));
    ctx.dist_id = grant.dist_id();
    PC_LOG_INFO_CTX(log_category::stage, "distribution staged", ctx);
    return grant;
}

auto transfer_coordinator::store(staging_grant& grant,
                                 const transfer_target& target,
                                 std::istream& stream,
                                 const content_digest& digest,
                                 const upload_options& options) -> result<void> {
    transfer_log_context ctx;
    ctx.target = target.to_string();
    ctx.dist_id = grant.dist_id();
    ctx.total_bytes = digest.size;

    if (grant.consumed_) {
        PC_LOG_ERROR_CTX(log_category::store, "staging grant already used", ctx);
        return unexpected{error{error_code::grant_consumed,
            "staging grant for dist " + grant.dist_id() +
                " was already used, stage the upload again"}};
    }
    grant.consumed_ = true;

    auto cfg = session_->config();

    form_fields fields = grant.fields();
    set_field(fields, "Content-Length", std::to_string(digest.size));
    set_field(fields, "Content-MD5", digest.base64);

    multipart_options encode_options;
    encode_options.cancel = options.cancel;
    if (options.on_progress) {
        encode_options.on_progress = [&options, &target](uint64_t sent, uint64_t total) {
            options.on_progress(upload_progress{target, sent, total});
        };
    }

    auto encoded = multipart_encoder::encode(
        fields, {file_part{"file", target.basename, &stream, digest.size}},
        std::move(encode_options));
    if (!encoded) {
        return unexpected{encoded.error()};
    }

    // Storage backend is a different host: no service token, no version header
    http_request request;
    request.method = http_method::post;
    request.url = grant.storage_url();
    request.headers["Content-Type"] = encoded.value().content_type;
    request.body_stream = encoded.value().body.get();
    request.follow_redirects = false;
    request.timeout = std::chrono::duration_cast<std::chrono::milliseconds>(cfg.store_timeout);
    request.verify_tls = cfg.verify_tls;

    ctx.url = grant.storage_url();
    PC_LOG_INFO_CTX(log_category::store, "storing distribution", ctx);

    auto start = std::chrono::steady_clock::now();
    auto transport = session_->transport();
    if (!transport) {
        return unexpected{error{error_code::transport_unavailable,
                                "session has no HTTP transport"}};
    }
    auto response = transport->perform(request);
    ctx.duration_ms = elapsed_ms(start);
    ctx.bytes_transferred = encoded.value().body->bytes_emitted();

    if (!response) {
        ctx.error_message = response.error().message;
        if (response.error().code == error_code::transfer_cancelled) {
            PC_LOG_WARN_CTX(log_category::store,
                            "store cancelled, a fresh stage is required to retry", ctx);
            return unexpected{response.error()};
        }
        PC_LOG_ERROR_CTX(log_category::store,
                         "store failed, a fresh stage is required to retry", ctx);
        return unexpected{error{error_code::store_failed,
                                "error uploading to storage: " + response.error().message}};
    }

    const auto& res = response.value();
    ctx.http_status = res.status_code;
    if (res.status_code != 201) {
        auto body = res.body.substr(0, max_logged_body);
        ctx.error_message = body;
        PC_LOG_ERROR_CTX(log_category::store,
                         "store rejected, a fresh stage is required to retry", ctx);

        auto description = response_classifier::describe(res.status_code);
        std::string message = "error uploading to storage: " +
                              std::string(description.short_text) + " (status code: " +
                              std::to_string(res.status_code) + ")";
        if (!body.empty()) {
            message += ": " + body;
        }
        return unexpected{error{error_code::store_failed, message, res.status_code}};
    }

    grant.stored_ = true;
    if (ctx.duration_ms && *ctx.duration_ms > 0) {
        ctx.rate_mbps = static_cast<double>(digest.size) / 1024.0 / 1024.0 /
                        (static_cast<double>(*ctx.duration_ms) / 1000.0);
    }
    PC_LOG_INFO_CTX(log_category::store, "distribution stored", ctx);
    return {};
}

auto transfer_coordinator::commit(const staging_grant& grant, const transfer_target& target)
    -> result<nlohmann::json> {
    if (!grant.is_stored()) {
        return unexpected{error{error_code::invalid_state,
            "distribution " + grant.dist_id() + " has not been stored, cannot commit"}};
    }

    auto request = session_->make_request(http_method::post, "/commit" + target.path());
    request.body = service_session::encode_payload({{"dist_id", grant.dist_id()}});

    transfer_log_context ctx;
    ctx.target = target.to_string();
    ctx.dist_id = grant.dist_id();

    auto response = session_->send(request, success_statuses());
    if (!response) {
        ctx.http_status = response.error().http_status;
        ctx.error_message = response.error().message;
        PC_LOG_ERROR_CTX(log_category::commit, "commit rejected", ctx);
        return unexpected{response.error()};
    }
    ctx.http_status = response.value().status_code;

    // 204 and friends publish the distribution without describing it
    if (response.value().body.empty()) {
        PC_LOG_INFO_CTX(log_category::commit, "distribution committed", ctx);
        return nlohmann::json::object();
    }

    auto metadata = service_session::parse_json(response.value());
    if (!metadata) {
        ctx.error_message = metadata.error().message;
        PC_LOG_ERROR_CTX(log_category::commit, "commit response is not valid JSON", ctx);
        return metadata;
    }

    PC_LOG_INFO_CTX(log_category::commit, "distribution committed", ctx);
    return metadata;
}

auto transfer_coordinator::download(const transfer_target& target,
                                    const std::optional<std::string>& known_md5)
    -> result<download_outcome> {
    auto request = session_->make_request(http_method::get, "/download" + target.path());
    request.follow_redirects = false;
    if (known_md5) {
        request.headers["ETag"] = *known_md5;
    }

    transfer_log_context ctx;
    ctx.target = target.to_string();

    auto response = session_->send(request, {302, 304});
    if (!response) {
        ctx.http_status = response.error().http_status;
        ctx.error_message = response.error().message;
        PC_LOG_ERROR_CTX(log_category::download, "download rejected", ctx);
        return unexpected{response.error()};
    }

    const auto& res = response.value();
    ctx.http_status = res.status_code;
    if (res.status_code == 304) {
        PC_LOG_DEBUG_CTX(log_category::download, "distribution not modified", ctx);
        return download_outcome::not_modified();
    }

    auto location = res.get_header("Location");
    if (!location || location->empty()) {
        return malformed("download redirect has no Location header");
    }

    auto cfg = session_->config();
    ctx.url = *location;
    PC_LOG_DEBUG_CTX(log_category::download, "distribution redirected", ctx);
    return download_outcome::redirected(distribution_stream(
        session_->transport(), *location,
        std::chrono::duration_cast<std::chrono::milliseconds>(cfg.store_timeout),
        cfg.verify_tls));
}

}  // namespace kcenon::package_client
