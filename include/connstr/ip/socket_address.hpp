#pragma once

/**
 * @file
 * @brief IP address and port pair produced by endpoint resolution.
 */

#include "connstr/core/result.hpp"
#include "connstr/ip/address.hpp"

#include <cstdint>
#include <string>
#include <sys/socket.h>

namespace connstr::ip {

/**
 * @brief Concrete socket address (`ip:port`).
 */
struct socket_address {
    /// IPv4 or IPv6 address.
    ip::address address{};
    /// Port in host byte order.
    std::uint16_t port{};

    /**
     * @brief POSIX representation ready for `connect`/`bind`.
     */
    struct native {
        sockaddr_storage storage{};
        socklen_t length{};
    };

    /// @return `a.b.c.d:port` or `[v6]:port`.
    [[nodiscard]] std::string to_string() const;
    /// @return `sockaddr_in` or `sockaddr_in6` in a `sockaddr_storage`.
    [[nodiscard]] native to_sockaddr() const noexcept;

    /**
     * @brief Convert from a POSIX socket address.
     * @param addr Address pointer.
     * @param length Size of the structure behind `addr`.
     * @return `errc::invalid_address` for families other than
     *         `AF_INET`/`AF_INET6` or truncated input.
     */
    [[nodiscard]] static result<socket_address>
    from_sockaddr(const sockaddr* addr, socklen_t length);

    friend bool operator==(const socket_address&,
                           const socket_address&) = default;
};

} // namespace connstr::ip
