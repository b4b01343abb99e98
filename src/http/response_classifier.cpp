/**
 * @file response_classifier.cpp
 * @brief Implementation of the response classifier
 */

#include "kcenon/package_client/http/response_classifier.h"

#include "kcenon/package_client/core/logging.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>

namespace kcenon::package_client {

namespace {

struct status_entry {
    int code;
    status_description description;
};

constexpr status_entry STATUS_TABLE[] = {
    {100, {"Continue", "Request received, please continue"}},
    {101, {"Switching Protocols", "Switching to new protocol; obey Upgrade header"}},
    {200, {"OK", "Request fulfilled, document follows"}},
    {201, {"Created", "Document created, URL follows"}},
    {202, {"Accepted", "Request accepted, processing continues off-line"}},
    {203, {"Non-Authoritative Information", "Request fulfilled from cache"}},
    {204, {"No Content", "Request fulfilled, nothing follows"}},
    {205, {"Reset Content", "Clear input form for further input."}},
    {206, {"Partial Content", "Partial content follows."}},
    {300, {"Multiple Choices", "Object has several resources -- see URI list"}},
    {301, {"Moved Permanently", "Object moved permanently -- see URI list"}},
    {302, {"Found", "Object moved temporarily -- see URI list"}},
    {303, {"See Other", "Object moved -- see Method and URL list"}},
    {304, {"Not Modified", "Document has not changed since given time"}},
    {305, {"Use Proxy", "You must use proxy specified in Location to access this resource."}},
    {307, {"Temporary Redirect", "Object moved temporarily -- see URI list"}},
    {400, {"Bad Request", "Bad request syntax or unsupported method"}},
    {401, {"Unauthorized", "No permission -- see authorization schemes"}},
    {402, {"Payment Required", "No payment -- see charging schemes"}},
    {403, {"Forbidden", "Request forbidden -- authorization will not help"}},
    {404, {"Not Found", "Nothing matches the given URI"}},
    {405, {"Method Not Allowed", "Specified method is invalid for this resource."}},
    {406, {"Not Acceptable", "URI not available in preferred format."}},
    {407, {"Proxy Authentication Required",
           "You must authenticate with this proxy before proceeding."}},
    {408, {"Request Timeout", "Request timed out; try again later."}},
    {409, {"Conflict", "Request conflict."}},
    {410, {"Gone", "URI no longer exists and has been permanently removed."}},
    {411, {"Length Required", "Client must specify Content-Length."}},
    {412, {"Precondition Failed", "Precondition in headers is false."}},
    {413, {"Request Entity Too Large", "Entity is too large."}},
    {414, {"Request-URI Too Long", "URI is too long."}},
    {415, {"Unsupported Media Type", "Entity body in unsupported format."}},
    {416, {"Requested Range Not Satisfiable", "Cannot satisfy request range."}},
    {417, {"Expectation Failed", "Expect condition could not be satisfied."}},
    {500, {"Internal Server Error", "Server got itself in trouble"}},
    {501, {"Not Implemented", "Server does not support this operation"}},
    {502, {"Bad Gateway", "Invalid responses from another server/proxy."}},
    {503, {"Service Unavailable", "The server cannot process the request due to a high load"}},
    {504, {"Gateway Timeout", "The gateway server did not receive a timely response"}},
    {505, {"HTTP Version Not Supported", "Cannot fulfill request."}},
};

// Leading digits of a version component, or -1 when there are none
auto numeric_prefix(std::string_view part) -> long {
    long value = 0;
    std::size_t i = 0;
    while (i < part.size() && std::isdigit(static_cast<unsigned char>(part[i]))) {
        value = value * 10 + (part[i] - '0');
        ++i;
    }
    return i == 0 ? -1 : value;
}

auto split_version(std::string_view version) -> std::vector<std::string_view> {
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (start <= version.size()) {
        auto dot = version.find('.', start);
        if (dot == std::string_view::npos) {
            parts.push_back(version.substr(start));
            break;
        }
        parts.push_back(version.substr(start, dot - start));
        start = dot + 1;
    }
    return parts;
}

}  // namespace

auto compare_versions(std::string_view a, std::string_view b) -> int {
    auto lhs = split_version(a);
    auto rhs = split_version(b);
    auto count = std::max(lhs.size(), rhs.size());

    for (std::size_t i = 0; i < count; ++i) {
        std::string_view l = i < lhs.size() ? lhs[i] : "0";
        std::string_view r = i < rhs.size() ? rhs[i] : "0";

        auto ln = numeric_prefix(l);
        auto rn = numeric_prefix(r);
        if (ln != rn) {
            return ln < rn ? -1 : 1;
        }
        if (l != r) {
            return l < r ? -1 : 1;
        }
    }
    return 0;
}

response_classifier::response_classifier(std::string client_version,
                                         std::string version_header)
    : client_version_(std::move(client_version)),
      version_header_(std::move(version_header)),
      callback_mutex_(std::make_shared<std::mutex>()) {}

auto response_classifier::check(const http_response& response,
                                const std::vector<int>& allowed) const -> result<void> {
    check_version(response);

    if (std::find(allowed.begin(), allowed.end(), response.status_code) != allowed.end()) {
        return {};
    }

    return unexpected{error{code_for_status(response.status_code),
                            error_message(response), response.status_code}};
}

auto response_classifier::check_version(const http_response& response) const -> bool {
    auto server_version =
        response.get_header(version_header_).value_or(default_server_protocol_version);

    if (compare_versions(server_version, client_version_) <= 0) {
        return false;
    }

    PC_LOG_WARN(log_category::http,
                "The api server is running protocol version " + server_version +
                    ", this client uses " + client_version_ +
                    ". Please update the client.");

    version_warning_callback callback;
    {
        std::lock_guard<std::mutex> lock(*callback_mutex_);
        callback = warning_callback_;
    }
    if (callback) {
        callback(server_version, client_version_);
    }
    return true;
}

void response_classifier::set_warning_callback(version_warning_callback callback) {
    std::lock_guard<std::mutex> lock(*callback_mutex_);
    warning_callback_ = std::move(callback);
}

auto response_classifier::describe(int status) -> status_description {
    for (const auto& entry : STATUS_TABLE) {
        if (entry.code == status) {
            return entry.description;
        }
    }
    return {"?", "Undefined error"};
}

auto response_classifier::error_message(const http_response& response) -> std::string {
    auto description = describe(response.status_code);
    std::string message = std::string(description.short_text) + ": " +
                          description.long_text + " (status code: " +
                          std::to_string(response.status_code) + ")";

    auto body = nlohmann::json::parse(response.body, nullptr, false);
    if (body.is_discarded() || !body.is_object()) {
        return message;
    }

    auto it = body.find("error");
    if (it == body.end()) {
        return message;
    }
    return it->is_string() ? it->get<std::string>() : it->dump();
}

auto response_classifier::code_for_status(int status) -> error_code {
    switch (status) {
        case 401: return error_code::unauthorized;
        case 404: return error_code::not_found;
        case 409: return error_code::conflict;
        default: return error_code::service_error;
    }
}

}  // namespace kcenon::package_client
