/**
 * @file package_api.cpp
 * @brief Implementation of the metadata requests
 */

#include "kcenon/package_client/client/package_api.h"

#include "kcenon/package_client/core/encoding.h"
#include "kcenon/package_client/core/logging.h"

#include <cstdlib>

#if defined(_WIN32)
#else
#include <unistd.h>
#endif

namespace kcenon::package_client {

namespace {

auto local_hostname() -> std::string {
#if defined(_WIN32)
    if (const char* name = std::getenv("COMPUTERNAME")) {
        return name;
    }
#else
    char buffer[256] = {};
    if (gethostname(buffer, sizeof(buffer) - 1) == 0 && buffer[0] != '\0') {
        return buffer;
    }
#endif
    return "unknown";
}

auto optional_json(const std::optional<std::string>& value) -> nlohmann::json {
    return value ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

auto segment(const std::string& value) -> std::string {
    return encoding::url_encode(value);
}

auto discard_body(result<http_response> response) -> result<void> {
    if (!response) {
        return unexpected{response.error()};
    }
    return {};
}

}  // namespace

package_api::package_api(std::shared_ptr<service_session> session)
    : session_(std::move(session)) {}

// ============================================================================
// Authentication
// ============================================================================

auto package_api::authenticate(const std::string& username,
                               const std::string& password,
                               const authentication_options& options)
    -> result<std::string> {
    nlohmann::json payload = {
        {"scopes", options.scopes.empty() ? nlohmann::json(nullptr)
                                          : nlohmann::json(options.scopes)},
        {"note", options.application},
        {"note_url", optional_json(options.application_url)},
        {"hostname", local_hostname()},
        {"user", optional_json(options.for_user)},
        {"max-age", options.max_age ? nlohmann::json(*options.max_age)
                                    : nlohmann::json(nullptr)},
        {"created_with", optional_json(options.created_with)},
        {"strength", options.strength},
    };

    auto request = session_->make_request(http_method::post, "/authentications");
    request.headers.erase("Authorization");
    request.auth = basic_auth{username, password};
    request.body = service_session::encode_payload(payload);

    auto body = session_->send_json(request);
    if (!body) {
        PC_LOG_WARN(log_category::api, "authentication failed for user " + username + ": " +
                                           body.error().message);
        return unexpected{body.error()};
    }

    auto token = body.value().find("token");
    if (!body.value().is_object() || token == body.value().end() || !token->is_string()) {
        return unexpected{error{error_code::malformed_response,
                                "authentication response has no token"}};
    }

    auto value = token->get<std::string>();
    session_->set_token(value);
    PC_LOG_INFO(log_category::api, "authenticated as " + username);
    return value;
}

auto package_api::authentication() -> result<nlohmann::json> {
    return session_->send_json(session_->make_request(http_method::get, "/authentication"));
}

auto package_api::authentications() -> result<nlohmann::json> {
    return session_->send_json(session_->make_request(http_method::get, "/authentications"));
}

auto package_api::remove_authentication(const std::string& auth_id) -> result<void> {
    return discard_body(session_->send(
        session_->make_request(http_method::del, "/authentications/" + segment(auth_id)),
        {201}));
}

auto package_api::list_scopes() -> result<nlohmann::json> {
    auto request = session_->make_request(http_method::get, "/scopes");
    request.headers.erase("Authorization");
    return session_->send_json(request);
}

// ============================================================================
// Users and packages
// ============================================================================

auto package_api::user(const std::optional<std::string>& login) -> result<nlohmann::json> {
    std::string path = login && !login->empty() ? "/user/" + segment(*login) : "/user";
    return session_->send_json(session_->make_request(http_method::get, path));
}

auto package_api::user_packages(const std::optional<std::string>& login)
    -> result<nlohmann::json> {
    std::string path = login && !login->empty() ? "/packages/" + segment(*login) : "/packages";
    return session_->send_json(session_->make_request(http_method::get, path));
}

auto package_api::package(const std::string& owner, const std::string& name)
    -> result<nlohmann::json> {
    return session_->send_json(session_->make_request(
        http_method::get, "/package/" + segment(owner) + "/" + segment(name)));
}

auto package_api::add_package(const std::string& owner,
                              const std::string& name,
                              const package_options& options) -> result<nlohmann::json> {
    nlohmann::json attrs = options.attrs.is_null() ? nlohmann::json::object() : options.attrs;
    if (!attrs.is_object()) {
        return unexpected{error{error_code::malformed_attributes,
            std::string("package attrs must be a JSON object, got ") + attrs.type_name()}};
    }
    attrs["summary"] = optional_json(options.summary);
    attrs["license"] = {
        {"name", optional_json(options.license)},
        {"url", optional_json(options.license_url)},
    };

    nlohmann::json payload = {
        {"public", options.public_access},
        {"publish", options.publish},
        {"public_attrs", attrs},
    };

    auto request = session_->make_request(
        http_method::post, "/package/" + segment(owner) + "/" + segment(name));
    request.body = service_session::encode_payload(payload);
    return session_->send_json(request);
}

auto package_api::remove_package(const std::string& owner, const std::string& name)
    -> result<void> {
    return discard_body(session_->send(
        session_->make_request(http_method::del,
                               "/package/" + segment(owner) + "/" + segment(name)),
        {201}));
}

auto package_api::package_collaborators(const std::string& owner, const std::string& name)
    -> result<nlohmann::json> {
    return session_->send_json(session_->make_request(
        http_method::get,
        "/packages/" + segment(owner) + "/" + segment(name) + "/collaborators"));
}

auto package_api::package_add_collaborator(const std::string& owner,
                                           const std::string& name,
                                           const std::string& collaborator)
    -> result<void> {
    return discard_body(session_->send(
        session_->make_request(http_method::put, "/packages/" + segment(owner) + "/" +
                                                     segment(name) + "/collaborators/" +
                                                     segment(collaborator)),
        {201}));
}

auto package_api::package_remove_collaborator(const std::string& owner,
                                              const std::string& name,
                                              const std::string& collaborator)
    -> result<void> {
    return discard_body(session_->send(
        session_->make_request(http_method::del, "/packages/" + segment(owner) + "/" +
                                                     segment(name) + "/collaborators/" +
                                                     segment(collaborator)),
        {201}));
}

auto package_api::all_packages(const std::optional<std::string>& modified_after)
    -> result<nlohmann::json> {
    return session_->send_json(session_->make_request(
        http_method::get,
        "/package_listing?modified_after=" + segment(modified_after.value_or(""))));
}

// ============================================================================
// Releases and distributions
// ============================================================================

auto package_api::release(const std::string& owner,
                          const std::string& name,
                          const std::string& version) -> result<nlohmann::json> {
    return session_->send_json(session_->make_request(
        http_method::get,
        "/release/" + segment(owner) + "/" + segment(name) + "/" + segment(version)));
}

auto package_api::add_release(const std::string& owner,
                              const std::string& name,
                              const std::string& version,
                              const nlohmann::json& requirements,
                              const nlohmann::json& announce,
                              const std::string& description) -> result<nlohmann::json> {
    nlohmann::json payload = {
        {"requirements", requirements},
        {"announce", announce},
        {"description", description},
    };

    auto request = session_->make_request(
        http_method::post,
        "/release/" + segment(owner) + "/" + segment(name) + "/" + segment(version));
    request.body = service_session::encode_payload(payload);
    return session_->send_json(request);
}

auto package_api::remove_release(const std::string& owner,
                                 const std::string& name,
                                 const std::string& version) -> result<nlohmann::json> {
    return session_->send_json(
        session_->make_request(
            http_method::del,
            "/release/" + segment(owner) + "/" + segment(name) + "/" + segment(version)),
        {201});
}

auto package_api::distribution(const transfer_target& target) -> result<nlohmann::json> {
    return session_->send_json(
        session_->make_request(http_method::get, "/dist" + target.path()));
}

auto package_api::remove_dist(const transfer_target& target,
                              const std::optional<std::string>& dist_id)
    -> result<nlohmann::json> {
    std::string path;
    if (!target.basename.empty()) {
        path = "/dist" + target.path();
    } else if (dist_id && !dist_id->empty()) {
        path = "/dist/" + segment(target.owner) + "/" + segment(target.package) + "/" +
               segment(target.version) + "/-/" + segment(*dist_id);
    } else {
        return unexpected{error{error_code::invalid_state,
                                "remove_dist needs either a basename or a dist id"}};
    }
    return session_->send_json(session_->make_request(http_method::del, path));
}

// ============================================================================
// Search
// ============================================================================

auto package_api::search(const std::string& query,
                         const std::optional<std::string>& package_type)
    -> result<nlohmann::json> {
    std::string path = "/search?name=" + segment(query);
    if (package_type) {
        path += "&type=" + segment(*package_type);
    }
    return session_->send_json(session_->make_request(http_method::get, path));
}

}  // namespace kcenon::package_client
