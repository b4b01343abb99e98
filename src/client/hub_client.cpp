/**
 * @file hub_client.cpp
 * @brief Implementation of the package hosting client facade
 */

#include "kcenon/package_client/client/hub_client.h"

#include "kcenon/package_client/core/logging.h"
#include "kcenon/package_client/http/network_transport.h"

namespace kcenon::package_client {

struct hub_client::impl {
    std::shared_ptr<service_session> session;
    package_api api;
    transfer_coordinator transfers;

    explicit impl(std::shared_ptr<service_session> s)
        : session(std::move(s)), api(session), transfers(session) {}
};

// ============================================================================
// builder
// ============================================================================

hub_client::builder::builder() = default;

auto hub_client::builder::with_config(client_config config) -> builder& {
    config_ = std::move(config);
    return *this;
}

auto hub_client::builder::with_environment(bool enable) -> builder& {
    use_environment_ = enable;
    return *this;
}

auto hub_client::builder::with_domain(std::string domain) -> builder& {
    config_.domain = std::move(domain);
    return *this;
}

auto hub_client::builder::with_token(std::string token) -> builder& {
    config_.token = std::move(token);
    return *this;
}

auto hub_client::builder::with_request_timeout(std::chrono::milliseconds timeout) -> builder& {
    config_.request_timeout = timeout;
    return *this;
}

auto hub_client::builder::with_store_timeout(std::chrono::seconds timeout) -> builder& {
    config_.store_timeout = timeout;
    return *this;
}

auto hub_client::builder::with_verify_tls(bool verify) -> builder& {
    config_.verify_tls = verify;
    return *this;
}

auto hub_client::builder::with_read_chunk_size(std::size_t size) -> builder& {
    config_.read_chunk_size = size;
    return *this;
}

auto hub_client::builder::with_user_agent(std::string user_agent) -> builder& {
    config_.user_agent = std::move(user_agent);
    return *this;
}

auto hub_client::builder::with_transport(std::shared_ptr<http_transport> transport)
    -> builder& {
    transport_ = std::move(transport);
    return *this;
}

auto hub_client::builder::build() -> result<hub_client> {
    client_config config = config_;
    if (use_environment_) {
        auto overlaid = client_config::from_environment(std::move(config));
        if (!overlaid) {
            return unexpected{overlaid.error()};
        }
        config = std::move(overlaid.value());
    }

    auto valid = config.validate();
    if (!valid) {
        return unexpected{valid.error()};
    }

    auto transport = transport_;
    if (!transport) {
        transport = make_default_transport(config.request_timeout, config.user_agent);
    }

    return hub_client{std::make_shared<service_session>(std::move(config),
                                                        std::move(transport))};
}

// ============================================================================
// hub_client
// ============================================================================

hub_client::hub_client(std::shared_ptr<service_session> session)
    : impl_(std::make_unique<impl>(std::move(session))) {
    // Initialize logger (safe to call multiple times)
    get_logger().initialize();
}

hub_client::hub_client(hub_client&&) noexcept = default;
auto hub_client::operator=(hub_client&&) noexcept -> hub_client& = default;
hub_client::~hub_client() = default;

auto hub_client::api() -> package_api& {
    return impl_->api;
}

auto hub_client::transfers() -> transfer_coordinator& {
    return impl_->transfers;
}

auto hub_client::config() const -> client_config {
    return impl_->session->config();
}

auto hub_client::authenticate(const std::string& username,
                              const std::string& password,
                              const authentication_options& options)
    -> result<std::string> {
    return impl_->api.authenticate(username, password, options);
}

auto hub_client::upload(const transfer_target& target,
                        std::istream& stream,
                        const upload_options& options) -> result<nlohmann::json> {
    return impl_->transfers.upload(target, stream, options);
}

auto hub_client::upload_file(const transfer_target& target,
                             const std::filesystem::path& path,
                             const upload_options& options) -> result<nlohmann::json> {
    return impl_->transfers.upload_file(target, path, options);
}

auto hub_client::download(const transfer_target& target,
                          const std::optional<std::string>& known_md5)
    -> result<download_outcome> {
    return impl_->transfers.download(target, known_md5);
}

void hub_client::on_version_warning(version_warning_callback callback) {
    impl_->session->classifier().set_warning_callback(std::move(callback));
}

}  // namespace kcenon::package_client
