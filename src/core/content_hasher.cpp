/**
 * @file content_hasher.cpp
 * @brief Implementation of the incremental MD5 content digest
 */

#include "kcenon/package_client/core/content_hasher.h"

#include "kcenon/package_client/core/encoding.h"
#include "kcenon/package_client/core/logging.h"

#include <openssl/evp.h>

#include <algorithm>
#include <array>
#include <vector>

namespace kcenon::package_client {

namespace {

constexpr std::size_t md5_hex_length = 32;

/**
 * @brief RAII wrapper for EVP_MD_CTX
 */
class evp_md_ctx_wrapper {
public:
    evp_md_ctx_wrapper() : ctx_(EVP_MD_CTX_new()) {}

    ~evp_md_ctx_wrapper() {
        if (ctx_) {
            EVP_MD_CTX_free(ctx_);
        }
    }

    evp_md_ctx_wrapper(const evp_md_ctx_wrapper&) = delete;
    auto operator=(const evp_md_ctx_wrapper&) -> evp_md_ctx_wrapper& = delete;

    [[nodiscard]] auto get() const -> EVP_MD_CTX* { return ctx_; }
    [[nodiscard]] explicit operator bool() const { return ctx_ != nullptr; }

private:
    EVP_MD_CTX* ctx_;
};

}  // namespace

// ============================================================================
// md5_accumulator
// ============================================================================

struct md5_accumulator::impl {
    evp_md_ctx_wrapper ctx;
    bool initialized = false;
    bool finished = false;
    uint64_t bytes = 0;

    impl() {
        if (ctx) {
            initialized = EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) == 1;
        }
    }
};

md5_accumulator::md5_accumulator() : impl_(std::make_unique<impl>()) {}

md5_accumulator::~md5_accumulator() = default;

md5_accumulator::md5_accumulator(md5_accumulator&&) noexcept = default;

auto md5_accumulator::operator=(md5_accumulator&&) noexcept -> md5_accumulator& = default;

auto md5_accumulator::update(std::span<const std::byte> data) -> result<void> {
    if (!impl_->initialized) {
        return unexpected{error{error_code::internal_error,
                                "MD5 digest context could not be initialized"}};
    }
    if (impl_->finished) {
        return unexpected{error{error_code::invalid_state,
                                "digest already finished"}};
    }
    if (data.empty()) {
        return {};
    }
    if (EVP_DigestUpdate(impl_->ctx.get(), data.data(), data.size()) != 1) {
        return unexpected{error{error_code::internal_error, "MD5 update failed"}};
    }
    impl_->bytes += data.size();
    return {};
}

auto md5_accumulator::finish() -> result<content_digest> {
    if (!impl_->initialized) {
        return unexpected{error{error_code::internal_error,
                                "MD5 digest context could not be initialized"}};
    }
    if (impl_->finished) {
        return unexpected{error{error_code::invalid_state,
                                "digest already finished"}};
    }

    std::array<uint8_t, EVP_MAX_MD_SIZE> md{};
    unsigned int md_len = 0;
    if (EVP_DigestFinal_ex(impl_->ctx.get(), md.data(), &md_len) != 1) {
        return unexpected{error{error_code::internal_error, "MD5 finalize failed"}};
    }
    impl_->finished = true;

    std::span<const uint8_t> raw(md.data(), md_len);
    content_digest digest;
    digest.hex = encoding::bytes_to_hex(raw);
    digest.base64 = encoding::base64_encode(raw);
    digest.size = impl_->bytes;
    return digest;
}

auto md5_accumulator::bytes_processed() const noexcept -> uint64_t {
    return impl_->bytes;
}

// ============================================================================
// content_hasher
// ============================================================================

content_hasher::content_hasher(std::size_t chunk_size)
    : chunk_size_(std::clamp(chunk_size, min_read_chunk_size, max_read_chunk_size)) {}

auto content_hasher::hash(std::istream& stream,
                          std::optional<uint64_t> declared_size) const
    -> result<content_digest> {
    md5_accumulator acc;
    std::vector<char> buffer(chunk_size_);

    uint64_t remaining = declared_size.value_or(UINT64_MAX);
    while (remaining > 0 && stream.good()) {
        auto want = static_cast<std::size_t>(
            std::min<uint64_t>(remaining, buffer.size()));
        stream.read(buffer.data(), static_cast<std::streamsize>(want));
        auto got = static_cast<std::size_t>(stream.gcount());
        if (got == 0) {
            break;
        }

        auto update = acc.update(std::as_bytes(std::span(buffer.data(), got)));
        if (!update) {
            return unexpected{update.error()};
        }
        remaining -= got;
    }

    if (stream.bad()) {
        PC_LOG_ERROR(log_category::hasher, "stream failed while hashing");
        return unexpected{error{error_code::file_read_error,
                                "stream failed while hashing"}};
    }

    // A short final read sets failbit alongside eofbit
    if (stream.eof()) {
        stream.clear(stream.rdstate() & ~std::ios::failbit);
    }

    auto digest = acc.finish();
    if (digest) {
        PC_LOG_DEBUG(log_category::hasher,
                     "hashed " + std::to_string(digest.value().size) + " bytes, md5=" +
                         digest.value().hex);
    }
    return digest;
}

auto content_hasher::hash(std::span<const std::byte> data) -> result<content_digest> {
    md5_accumulator acc;
    auto update = acc.update(data);
    if (!update) {
        return unexpected{update.error()};
    }
    return acc.finish();
}

auto content_hasher::from_hex(std::string_view md5_hex, uint64_t size)
    -> result<content_digest> {
    if (md5_hex.size() != md5_hex_length) {
        return unexpected{error{error_code::invalid_digest,
            "MD5 digest must be 32 hex characters, got " +
                std::to_string(md5_hex.size())}};
    }

    auto raw = encoding::hex_to_bytes(md5_hex);
    if (!raw) {
        return unexpected{raw.error()};
    }

    content_digest digest;
    digest.hex = encoding::bytes_to_hex(raw.value());
    digest.base64 = encoding::base64_encode(std::span<const uint8_t>(raw.value()));
    digest.size = size;
    return digest;
}

auto content_hasher::measure(std::istream& stream) -> result<uint64_t> {
    auto start = stream.tellg();
    if (start == std::istream::pos_type(-1)) {
        stream.clear();
        return unexpected{error{error_code::unsupported_stream,
            "stream does not support seeking, size cannot be derived"}};
    }

    stream.seekg(0, std::ios::end);
    auto end = stream.tellg();
    stream.seekg(start);
    if (!stream || end == std::istream::pos_type(-1)) {
        stream.clear();
        return unexpected{error{error_code::unsupported_stream,
            "stream does not support seeking, size cannot be derived"}};
    }

    return static_cast<uint64_t>(end - start);
}

auto content_hasher::resolve(std::istream& stream,
                             const std::optional<std::string>& md5_hex,
                             std::optional<uint64_t> size) const
    -> result<content_digest> {
    if (md5_hex) {
        if (size) {
            return from_hex(*md5_hex, *size);
        }
        auto measured = measure(stream);
        if (!measured) {
            return unexpected{measured.error()};
        }
        return from_hex(*md5_hex, measured.value());
    }

    return hash(stream, size);
}

}  // namespace kcenon::package_client
