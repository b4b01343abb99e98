/**
 * @file body_source.h
 * @brief Pull-based request body abstraction
 */

#ifndef KCENON_PACKAGE_CLIENT_CORE_BODY_SOURCE_H
#define KCENON_PACKAGE_CLIENT_CORE_BODY_SOURCE_H

#include <kcenon/package_client/core/types.h>

#include <cstddef>
#include <cstdint>
#include <span>

namespace kcenon::package_client {

/**
 * @brief Request body produced on demand, chunk by chunk
 *
 * The transport pulls bytes with read() until it returns 0. The total
 * size is known before the first read so an exact Content-Length can
 * be sent.
 */
class body_source {
public:
    virtual ~body_source() = default;

    /**
     * @brief Fill buffer with the next bytes of the body
     * @return Number of bytes written, 0 at end of body
     */
    [[nodiscard]] virtual auto read(std::span<std::byte> buffer) -> result<std::size_t> = 0;

    /**
     * @brief Total body size in bytes
     */
    [[nodiscard]] virtual auto size() const -> uint64_t = 0;
};

}  // namespace kcenon::package_client

#endif  // KCENON_PACKAGE_CLIENT_CORE_BODY_SOURCE_H
