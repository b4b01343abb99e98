/**
 * @file package_client.h
 * @brief Main header for the package_client library
 * @version 0.1.0
 *
 * Include this header to access the package hosting client, the
 * distribution transfer protocol and the metadata API.
 *
 * @code
 * #include <kcenon/package_client/package_client.h>
 *
 * using namespace kcenon::package_client;
 *
 * auto client = hub_client::builder()
 *     .with_environment()
 *     .build();
 *
 * upload_options options;
 * options.distribution_type = "conda";
 * auto meta = client.value().upload_file(
 *     {"owner", "pkg", "1.0", "linux-64/pkg-1.0-0.tar.bz2"}, "pkg-1.0-0.tar.bz2", options);
 * @endcode
 */

#ifndef KCENON_PACKAGE_CLIENT_PACKAGE_CLIENT_H
#define KCENON_PACKAGE_CLIENT_PACKAGE_CLIENT_H

#include <cstdint>
#include <string>

// Core types
#include "kcenon/package_client/core/types.h"
#include "kcenon/package_client/core/content_hasher.h"
#include "kcenon/package_client/core/multipart_encoder.h"

// HTTP
#include "kcenon/package_client/http/http_transport.h"
#include "kcenon/package_client/http/response_classifier.h"

// Client
#include "kcenon/package_client/client/client_config.h"
#include "kcenon/package_client/client/client_types.h"
#include "kcenon/package_client/client/hub_client.h"

namespace kcenon::package_client {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::package_client

#endif  // KCENON_PACKAGE_CLIENT_PACKAGE_CLIENT_H
