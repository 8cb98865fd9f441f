#pragma once

/**
 * @file
 * @brief Connection-string parsing.
 */

#include "connstr/core/result.hpp"
#include "connstr/endpoint/endpoint.hpp"

#include <string_view>

namespace connstr {

/**
 * @brief Parse a connection string into an endpoint.
 *
 * `unix://` and `file://` prefixes take the remainder verbatim as a path.
 * Anything else must be `scheme://[userinfo@]host[:port][/...]`; a missing
 * port is filled from the scheme's default port.
 *
 * @param text Connection string, e.g. `tcp://127.0.0.1:9000`.
 * @return `errc::invalid_address` carrying `text` for malformed input, a
 *         missing host, or a missing port on a scheme without default;
 *         `errc::invalid_scheme` for an unsupported scheme.
 */
[[nodiscard]] result<endpoint> parse_endpoint(std::string_view text);

} // namespace connstr
