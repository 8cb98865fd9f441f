#pragma once

#include "connstr/core/result.hpp"

#include <cstdint>
#include <optional>
#include <string_view>

namespace connstr::detail {

/**
 * @brief Scheme, host and port extracted from `scheme://authority/...`.
 *
 * Views point into the input passed to `split_url`.
 */
struct url_parts {
    std::string_view scheme;
    /// Host without IPv6 brackets; never empty.
    std::string_view host;
    std::optional<std::uint16_t> port;
};

/**
 * @brief Split a generic URL into scheme, host and port.
 *
 * Userinfo is skipped; path, query and fragment are ignored.
 *
 * @return `errc::invalid_address` carrying `text` for malformed input or a
 *         missing host.
 */
[[nodiscard]] result<url_parts> split_url(std::string_view text);

} // namespace connstr::detail
