/**
 * @file multipart_parser.h
 * @brief Minimal multipart/form-data parser for inspecting encoded bodies
 */

#ifndef KCENON_PACKAGE_CLIENT_TEST_MULTIPART_PARSER_H
#define KCENON_PACKAGE_CLIENT_TEST_MULTIPART_PARSER_H

#include <optional>
#include <string>
#include <vector>

namespace kcenon::package_client::test {

struct parsed_part {
    std::string name;
    std::optional<std::string> filename;
    std::optional<std::string> content_type;
    std::string data;
};

namespace detail {

inline auto header_param(const std::string& header, const std::string& key)
    -> std::optional<std::string> {
    auto token = "; " + key + "=\"";
    auto pos = header.find(token);
    if (pos == std::string::npos) {
        return std::nullopt;
    }
    pos += token.size();
    auto end = header.find('"', pos);
    if (end == std::string::npos) {
        return std::nullopt;
    }
    return header.substr(pos, end - pos);
}

}  // namespace detail

/**
 * @brief Split a multipart body into parts
 * @return Parts in order, or nullopt if the framing is broken
 */
inline auto parse_multipart(const std::string& body, const std::string& boundary)
    -> std::optional<std::vector<parsed_part>> {
    const std::string delimiter = "--" + boundary;
    const std::string closing = delimiter + "--\r\n";

    if (body.size() < closing.size() ||
        body.compare(body.size() - closing.size(), closing.size(), closing) != 0) {
        return std::nullopt;
    }

    std::vector<parsed_part> parts;
    std::size_t pos = 0;
    while (true) {
        if (body.compare(pos, delimiter.size(), delimiter) != 0) {
            return std::nullopt;
        }
        pos += delimiter.size();
        if (body.compare(pos, 2, "--") == 0) {
            break;
        }
        if (body.compare(pos, 2, "\r\n") != 0) {
            return std::nullopt;
        }
        pos += 2;

        auto headers_end = body.find("\r\n\r\n", pos);
        if (headers_end == std::string::npos) {
            return std::nullopt;
        }

        parsed_part part;
        std::size_t line_start = pos;
        while (line_start < headers_end) {
            auto line_end = body.find("\r\n", line_start);
            if (line_end == std::string::npos || line_end > headers_end) {
                line_end = headers_end;
            }
            auto line = body.substr(line_start, line_end - line_start);
            if (line.rfind("Content-Disposition: form-data", 0) == 0) {
                auto name = detail::header_param(line, "name");
                if (!name) {
                    return std::nullopt;
                }
                part.name = *name;
                part.filename = detail::header_param(line, "filename");
            } else if (line.rfind("Content-Type: ", 0) == 0) {
                part.content_type = line.substr(14);
            }
            line_start = line_end + 2;
        }

        auto data_start = headers_end + 4;
        auto next = body.find("\r\n" + delimiter, data_start);
        if (next == std::string::npos) {
            return std::nullopt;
        }
        part.data = body.substr(data_start, next - data_start);
        parts.push_back(std::move(part));
        pos = next + 2;
    }

    return parts;
}

}  // namespace kcenon::package_client::test

#endif  // KCENON_PACKAGE_CLIENT_TEST_MULTIPART_PARSER_H
