#pragma once

/**
 * @file
 * @brief Canonical string form of endpoints.
 */

#include "connstr/endpoint/endpoint.hpp"

#include <ostream>
#include <string>

namespace connstr {

/**
 * @brief Render an endpoint as `scheme://host:port` or `scheme://path`.
 *
 * IPv6 hosts are bracketed. The port is always written, so
 * `parse_endpoint(format_endpoint(e)) == e` for every parsed `e`.
 */
[[nodiscard]] std::string format_endpoint(const endpoint& value);

/// Stream `format_endpoint(value)`.
std::ostream& operator<<(std::ostream& out, const endpoint& value);

/// Stream `value.to_string()`.
std::ostream& operator<<(std::ostream& out, const host_addr& value);

} // namespace connstr
