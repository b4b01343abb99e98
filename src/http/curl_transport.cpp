/**
 * @file curl_transport.cpp
 * @brief Implementation of the libcurl HTTP transport
 */

#include "kcenon/package_client/http/curl_transport.h"

#include "kcenon/package_client/core/logging.h"

#include <curl/curl.h>

#include <array>
#include <mutex>
#include <optional>

namespace kcenon::package_client {

namespace {

std::once_flag curl_global_once;

void ensure_curl_global_init() {
    std::call_once(curl_global_once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

/**
 * @brief RAII wrapper for a curl easy handle
 */
class curl_easy_handle {
public:
    curl_easy_handle() : handle_(curl_easy_init()) {}

    ~curl_easy_handle() {
        if (handle_) {
            curl_easy_cleanup(handle_);
        }
    }

    curl_easy_handle(const curl_easy_handle&) = delete;
    auto operator=(const curl_easy_handle&) -> curl_easy_handle& = delete;

    [[nodiscard]] auto get() const -> CURL* { return handle_; }
    [[nodiscard]] explicit operator bool() const { return handle_ != nullptr; }

private:
    CURL* handle_;
};

/**
 * @brief RAII wrapper for a curl header list
 */
class curl_header_list {
public:
    curl_header_list() = default;

    ~curl_header_list() {
        if (list_) {
            curl_slist_free_all(list_);
        }
    }

    curl_header_list(const curl_header_list&) = delete;
    auto operator=(const curl_header_list&) -> curl_header_list& = delete;

    void append(const std::string& line) { list_ = curl_slist_append(list_, line.c_str()); }

    [[nodiscard]] auto get() const -> curl_slist* { return list_; }

private:
    curl_slist* list_ = nullptr;
};

/**
 * @brief Per-request state shared with the libcurl callbacks
 */
struct transfer_state {
    http_response response;
    body_source* source = nullptr;
    const body_sink* sink = nullptr;
    std::optional<error> source_error;
    std::optional<error> sink_error;
};

auto trim(const std::string& s) -> std::string {
    const char* ws = " \t\r\n";
    auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) {
        return {};
    }
    auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}

auto header_callback(char* buffer, size_t size, size_t nitems, void* userdata) -> size_t {
    auto* state = static_cast<transfer_state*>(userdata);
    auto total = size * nitems;
    std::string line(buffer, total);

    // Each new status line starts a new response (redirect hops, 100 Continue)
    if (line.rfind("HTTP/", 0) == 0) {
        state->response.headers.clear();
        return total;
    }

    auto colon = line.find(':');
    if (colon != std::string::npos) {
        state->response.headers[trim(line.substr(0, colon))] = trim(line.substr(colon + 1));
    }
    return total;
}

auto buffer_write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) -> size_t {
    auto* state = static_cast<transfer_state*>(userdata);
    state->response.body.append(ptr, size * nmemb);
    return size * nmemb;
}

auto sink_write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) -> size_t {
    auto* state = static_cast<transfer_state*>(userdata);
    auto total = size * nmemb;
    auto delivered = (*state->sink)(
        std::span<const std::byte>(reinterpret_cast<const std::byte*>(ptr), total));
    if (!delivered) {
        state->sink_error = delivered.error();
        return 0;
    }
    return total;
}

auto read_callback(char* buffer, size_t size, size_t nitems, void* userdata) -> size_t {
    auto* state = static_cast<transfer_state*>(userdata);
    auto produced = state->source->read(
        std::span<std::byte>(reinterpret_cast<std::byte*>(buffer), size * nitems));
    if (!produced) {
        state->source_error = produced.error();
        return CURL_READFUNC_ABORT;
    }
    return produced.value();
}

}  // namespace

// ============================================================================
// Implementation
// ============================================================================

struct curl_transport::impl {
    curl_transport_config config;
    CURLSH* share = nullptr;
    std::array<std::mutex, CURL_LOCK_DATA_LAST> locks;

    explicit impl(curl_transport_config cfg) : config(std::move(cfg)) {
        ensure_curl_global_init();
        share = curl_share_init();
        if (share) {
            curl_share_setopt(share, CURLSHOPT_LOCKFUNC, &impl::lock);
            curl_share_setopt(share, CURLSHOPT_UNLOCKFUNC, &impl::unlock);
            curl_share_setopt(share, CURLSHOPT_USERDATA, this);
            curl_share_setopt(share, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
            curl_share_setopt(share, CURLSHOPT_SHARE, CURL_LOCK_DATA_SSL_SESSION);
            curl_share_setopt(share, CURLSHOPT_SHARE, CURL_LOCK_DATA_CONNECT);
        }
    }

    ~impl() {
        if (share) {
            curl_share_cleanup(share);
        }
    }

    impl(const impl&) = delete;
    auto operator=(const impl&) -> impl& = delete;

    static void lock(CURL*, curl_lock_data data, curl_lock_access, void* userptr) {
        static_cast<impl*>(userptr)->locks[static_cast<std::size_t>(data)].lock();
    }

    static void unlock(CURL*, curl_lock_data data, void* userptr) {
        static_cast<impl*>(userptr)->locks[static_cast<std::size_t>(data)].unlock();
    }

    auto execute(const http_request& request, const body_sink* sink)
        -> result<http_response> {
        curl_easy_handle easy;
        if (!easy) {
            return unexpected{error{error_code::internal_error,
                                    "failed to create curl handle"}};
        }
        CURL* h = easy.get();

        transfer_state state;
        state.source = request.body_stream;
        state.sink = sink;

        curl_easy_setopt(h, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(h, CURLOPT_NOSIGNAL, 1L);
        if (share) {
            curl_easy_setopt(h, CURLOPT_SHARE, share);
        }
        curl_easy_setopt(h, CURLOPT_USERAGENT, config.user_agent.c_str());
        curl_easy_setopt(h, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(config.connect_timeout.count()));
        curl_easy_setopt(h, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
        curl_easy_setopt(h, CURLOPT_FOLLOWLOCATION, request.follow_redirects ? 1L : 0L);
        curl_easy_setopt(h, CURLOPT_MAXREDIRS, config.max_redirects);
        curl_easy_setopt(h, CURLOPT_SSL_VERIFYPEER, request.verify_tls ? 1L : 0L);
        curl_easy_setopt(h, CURLOPT_SSL_VERIFYHOST, request.verify_tls ? 2L : 0L);

        if (request.auth) {
            curl_easy_setopt(h, CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
            curl_easy_setopt(h, CURLOPT_USERNAME, request.auth->username.c_str());
            curl_easy_setopt(h, CURLOPT_PASSWORD, request.auth->password.c_str());
        }

        curl_header_list header_list;
        for (const auto& [name, value] : request.headers) {
            header_list.append(name + ": " + value);
        }

        switch (request.method) {
            case http_method::get:
                curl_easy_setopt(h, CURLOPT_HTTPGET, 1L);
                break;
            case http_method::head:
                curl_easy_setopt(h, CURLOPT_NOBODY, 1L);
                break;
            case http_method::post:
                curl_easy_setopt(h, CURLOPT_POST, 1L);
                break;
            case http_method::put:
                curl_easy_setopt(h, CURLOPT_POST, 1L);
                curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, "PUT");
                break;
            case http_method::del:
                curl_easy_setopt(h, CURLOPT_CUSTOMREQUEST, "DELETE");
                break;
        }

        bool has_body = request.method == http_method::post ||
                        request.method == http_method::put ||
                        !request.body.empty() || request.body_stream != nullptr;
        if (has_body) {
            if (request.body_stream) {
                curl_easy_setopt(h, CURLOPT_POST, 1L);
                curl_easy_setopt(h, CURLOPT_READFUNCTION, &read_callback);
                curl_easy_setopt(h, CURLOPT_READDATA, &state);
                curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE,
                                 static_cast<curl_off_t>(request.body_stream->size()));
                // Storage backends reject chunked multipart, length is exact
                header_list.append("Expect:");
            } else {
                curl_easy_setopt(h, CURLOPT_POSTFIELDS, request.body.data());
                curl_easy_setopt(h, CURLOPT_POSTFIELDSIZE_LARGE,
                                 static_cast<curl_off_t>(request.body.size()));
            }
        }

        curl_easy_setopt(h, CURLOPT_HTTPHEADER, header_list.get());
        curl_easy_setopt(h, CURLOPT_HEADERFUNCTION, &header_callback);
        curl_easy_setopt(h, CURLOPT_HEADERDATA, &state);
        if (sink) {
            curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, &sink_write_callback);
        } else {
            curl_easy_setopt(h, CURLOPT_WRITEFUNCTION, &buffer_write_callback);
        }
        curl_easy_setopt(h, CURLOPT_WRITEDATA, &state);

        PC_LOG_TRACE(log_category::http,
                     std::string(to_string(request.method)) + " " + request.url);

        CURLcode rc = curl_easy_perform(h);

        if (state.source_error) {
            return unexpected{*state.source_error};
        }
        if (state.sink_error) {
            return unexpected{*state.sink_error};
        }
        if (rc != CURLE_OK) {
            auto code = rc == CURLE_OPERATION_TIMEDOUT ? error_code::connection_timeout
                                                       : error_code::connection_failed;
            std::string message = std::string(to_string(request.method)) + " " +
                                  request.url + ": " + curl_easy_strerror(rc);
            PC_LOG_ERROR(log_category::http, message);
            return unexpected{error{code, message}};
        }

        long status = 0;
        curl_easy_getinfo(h, CURLINFO_RESPONSE_CODE, &status);
        state.response.status_code = static_cast<int>(status);

        PC_LOG_DEBUG(log_category::http,
                     std::string(to_string(request.method)) + " " + request.url + " -> " +
                         std::to_string(status));
        return std::move(state.response);
    }
};

curl_transport::curl_transport(curl_transport_config config)
    : impl_(std::make_unique<impl>(std::move(config))) {}

curl_transport::~curl_transport() = default;

curl_transport::curl_transport(curl_transport&&) noexcept = default;

auto curl_transport::operator=(curl_transport&&) noexcept -> curl_transport& = default;

auto curl_transport::perform(const http_request& request) -> result<http_response> {
    return impl_->execute(request, nullptr);
}

auto curl_transport::perform_streaming(const http_request& request, const body_sink& sink)
    -> result<http_response> {
    return impl_->execute(request, &sink);
}

auto curl_transport::config() const -> const curl_transport_config& {
    return impl_->config;
}

}  // namespace kcenon::package_client
