/**
 * @file client_config.cpp
 * @brief Implementation of client configuration
 */

#include "kcenon/package_client/client/client_config.h"

#include <charconv>
#include <cstdlib>

namespace kcenon::package_client {

namespace {

auto env(const char* name) -> std::optional<std::string> {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

auto invalid(const std::string& message) -> unexpected {
    return unexpected{error{error_code::invalid_configuration, message}};
}

}  // namespace

auto client_config::validate() const -> result<void> {
    if (domain.rfind("http://", 0) != 0 && domain.rfind("https://", 0) != 0) {
        return invalid("domain must be an http:// or https:// URL: '" + domain + "'");
    }
    if (request_timeout.count() <= 0) {
        return invalid("request_timeout must be positive");
    }
    if (store_timeout.count() <= 0) {
        return invalid("store_timeout must be positive");
    }
    if (read_chunk_size < min_read_chunk_size || read_chunk_size > max_read_chunk_size) {
        return invalid("read_chunk_size must be between " +
                       std::to_string(min_read_chunk_size) + " and " +
                       std::to_string(max_read_chunk_size) + " bytes");
    }
    if (version_header.empty() || client_version.empty()) {
        return invalid("protocol version header and version must be set");
    }
    if (token && token->empty()) {
        return invalid("token must not be empty when set");
    }
    return {};
}

auto client_config::from_environment() -> result<client_config> {
    return from_environment(client_config{});
}

auto client_config::from_environment(client_config base) -> result<client_config> {
    if (auto domain = env("PACKAGE_CLIENT_DOMAIN")) {
        base.domain = *domain;
    }
    if (auto token = env("PACKAGE_CLIENT_TOKEN")) {
        base.token = *token;
    }
    if (auto timeout = env("PACKAGE_CLIENT_STORE_TIMEOUT_SECONDS")) {
        long long seconds = 0;
        auto [ptr, ec] = std::from_chars(timeout->data(), timeout->data() + timeout->size(),
                                         seconds);
        if (ec != std::errc{} || ptr != timeout->data() + timeout->size() || seconds <= 0) {
            return invalid("PACKAGE_CLIENT_STORE_TIMEOUT_SECONDS is not a positive "
                           "integer: '" + *timeout + "'");
        }
        base.store_timeout = std::chrono::seconds(seconds);
    }

    auto valid = base.validate();
    if (!valid) {
        return unexpected{valid.error()};
    }
    return base;
}

auto client_config::url(const std::string& path) const -> std::string {
    auto base = domain;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    return base + path;
}

auto client_config::default_headers() const -> http_headers {
    http_headers headers;
    headers[version_header] = client_version;
    if (token) {
        headers["Authorization"] = "token " + *token;
    }
    return headers;
}

}  // namespace kcenon::package_client
