/**
 * @file multipart_encoder.cpp
 * @brief Implementation of the streaming multipart/form-data encoder
 */

#include "kcenon/package_client/core/multipart_encoder.h"

#include "kcenon/package_client/core/encoding.h"

#include <algorithm>
#include <cstring>

namespace kcenon::package_client {

namespace {

constexpr const char* CRLF = "\r\n";

// Header parameters cannot carry raw quotes or line breaks
auto quote_param(const std::string& value) -> std::string {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        if (c == '"') {
            out += "%22";
        } else if (c == '\r') {
            out += "%0D";
        } else if (c == '\n') {
            out += "%0A";
        } else {
            out += c;
        }
    }
    return out;
}

auto field_header(const std::string& boundary, const std::string& name) -> std::string {
    std::string header = "--" + boundary + CRLF;
    header += "Content-Disposition: form-data; name=\"" + quote_param(name) + "\"";
    header += CRLF;
    header += CRLF;
    return header;
}

auto file_header(const std::string& boundary, const file_part& part) -> std::string {
    std::string header = "--" + boundary + CRLF;
    header += "Content-Disposition: form-data; name=\"" + quote_param(part.name) +
              "\"; filename=\"" + quote_param(part.filename) + "\"";
    header += CRLF;
    header += "Content-Type: " + part.content_type + CRLF;
    header += CRLF;
    return header;
}

}  // namespace

// ============================================================================
// multipart_body
// ============================================================================

multipart_body::multipart_body(std::vector<segment> segments,
                               progress_callback on_progress,
                               std::optional<cancellation_token> cancel)
    : segments_(std::move(segments)),
      on_progress_(std::move(on_progress)),
      cancel_(std::move(cancel)) {
    for (const auto& seg : segments_) {
        total_ += seg.stream ? seg.length : seg.text.size();
    }
}

auto multipart_body::read(std::span<std::byte> buffer) -> result<std::size_t> {
    if (cancel_ && cancel_->is_cancelled()) {
        return unexpected{error{error_code::transfer_cancelled,
                                "upload cancelled after " + std::to_string(emitted_) +
                                    " bytes"}};
    }

    std::size_t written = 0;
    while (written < buffer.size() && index_ < segments_.size()) {
        auto& seg = segments_[index_];
        auto space = buffer.size() - written;

        if (!seg.stream) {
            auto left = seg.text.size() - static_cast<std::size_t>(offset_);
            auto n = std::min(space, left);
            std::memcpy(buffer.data() + written, seg.text.data() + offset_, n);
            written += n;
            offset_ += n;
            if (offset_ == seg.text.size()) {
                ++index_;
                offset_ = 0;
            }
            continue;
        }

        auto left = seg.length - offset_;
        if (left == 0) {
            ++index_;
            offset_ = 0;
            continue;
        }

        auto want = static_cast<std::size_t>(std::min<uint64_t>(space, left));
        seg.stream->read(reinterpret_cast<char*>(buffer.data() + written),
                         static_cast<std::streamsize>(want));
        auto got = static_cast<std::size_t>(seg.stream->gcount());
        if (got == 0) {
            return unexpected{error{error_code::file_read_error,
                "file part ended after " + std::to_string(offset_) + " of " +
                    std::to_string(seg.length) + " declared bytes"}};
        }
        written += got;
        offset_ += got;
    }

    if (written > 0) {
        emitted_ += written;
        if (on_progress_) {
            on_progress_(emitted_, total_);
        }
    }
    return written;
}

// ============================================================================
// multipart_encoder
// ============================================================================

auto multipart_encoder::encode(const form_fields& fields,
                               const std::vector<file_part>& files,
                               multipart_options options)
    -> result<encoded_multipart> {
    encoded_multipart encoded;
    encoded.boundary = options.boundary ? *options.boundary : generate_boundary();
    encoded.content_type = "multipart/form-data; boundary=" + encoded.boundary;

    std::vector<multipart_body::segment> segments;
    segments.reserve(fields.size() + files.size() * 3 + 1);

    for (const auto& [name, value] : fields) {
        multipart_body::segment seg;
        seg.text = field_header(encoded.boundary, name) + value + CRLF;
        segments.push_back(std::move(seg));
        encoded.part_sizes.push_back(value.size());
    }

    for (const auto& part : files) {
        if (part.stream == nullptr) {
            return unexpected{error{error_code::unsupported_stream,
                                    "file part '" + part.name + "' has no stream"}};
        }

        multipart_body::segment header;
        header.text = file_header(encoded.boundary, part);
        segments.push_back(std::move(header));

        multipart_body::segment content;
        content.stream = part.stream;
        content.length = part.size;
        segments.push_back(std::move(content));

        multipart_body::segment trailer;
        trailer.text = CRLF;
        segments.push_back(std::move(trailer));

        encoded.part_sizes.push_back(part.size);
    }

    multipart_body::segment closing;
    closing.text = "--" + encoded.boundary + "--" + CRLF;
    segments.push_back(std::move(closing));

    encoded.body = std::make_unique<multipart_body>(
        std::move(segments), std::move(options.on_progress), std::move(options.cancel));
    encoded.content_length = encoded.body->size();
    return encoded;
}

auto multipart_encoder::generate_boundary() -> std::string {
    return encoding::generate_random_hex(boundary_length / 2);
}

}  // namespace kcenon::package_client
