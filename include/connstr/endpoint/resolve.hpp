#pragma once

/**
 * @file
 * @brief Blocking resolution of endpoints into socket addresses.
 */

#include "connstr/core/result.hpp"
#include "connstr/endpoint/endpoint.hpp"
#include "connstr/ip/socket_address.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace connstr {

/**
 * @brief Resolve an endpoint into concrete socket addresses.
 *
 * IP hosts map to a single address without any lookup. Domain hosts are
 * looked up with `resolve_host` on the calling thread. Path endpoints always
 * fail with `errc::invalid_address`.
 *
 * @param value Endpoint to resolve.
 * @return Addresses in resolver order.
 */
[[nodiscard]] result<std::vector<ip::socket_address>>
resolve_endpoint(const endpoint& value);

/**
 * @brief Look up a domain name via `getaddrinfo`.
 * @param domain Host name.
 * @param port Port attached to every returned address.
 * @return Every IPv4/IPv6 address in resolver order, or
 *         `errc::invalid_address` carrying `domain`.
 */
[[nodiscard]] result<std::vector<ip::socket_address>>
resolve_host(const std::string& domain, std::uint16_t port);

} // namespace connstr
