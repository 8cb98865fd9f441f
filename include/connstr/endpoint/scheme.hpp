#pragma once

/**
 * @file
 * @brief Supported endpoint schemes and their default ports.
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>

namespace connstr {

/**
 * @brief Closed set of endpoint schemes.
 *
 * The first thirteen are network schemes (host and port); `unix_socket` and
 * `file` carry a filesystem path.
 */
enum class scheme : std::uint8_t {
    http,
    https,
    tcp,
    udp,
    mqtt,
    mqtts,
    ws,
    wss,
    coap,
    coaps,
    redis,
    amqp,
    ftp,
    unix_socket,
    file,
};

/// Number of `scheme` enumerators.
inline constexpr std::size_t scheme_count = 15;

/// Default port of the plain-text network schemes.
inline constexpr std::uint16_t plain_default_port = 80;
/// Default port of the TLS network schemes.
inline constexpr std::uint16_t secure_default_port = 443;

/**
 * @brief One row of the scheme table.
 */
struct scheme_info {
    scheme id;
    /// Name as written before `://`.
    std::string_view name;
    /// Port used when the string omits one; empty means the port is required.
    std::optional<std::uint16_t> default_port;
    /// `true` for host/port schemes, `false` for path schemes.
    bool network;
};

/// @return All rows, in enumerator order.
[[nodiscard]] std::span<const scheme_info> scheme_table() noexcept;

/// @return Row describing `value`.
[[nodiscard]] const scheme_info& describe(scheme value) noexcept;

/// @return Scheme name, e.g. `"mqtts"` or `"unix"`.
[[nodiscard]] std::string_view to_string(scheme value) noexcept;

/// @return Default port, or empty when the scheme has none.
[[nodiscard]] std::optional<std::uint16_t> default_port(scheme value) noexcept;

[[nodiscard]] bool is_network_scheme(scheme value) noexcept;

/**
 * @brief Look up a scheme by exact, case-sensitive name.
 * @param name Scheme name without `://`.
 */
[[nodiscard]] std::optional<scheme>
scheme_from_string(std::string_view name) noexcept;

/// Same as `scheme_from_string` restricted to network schemes.
[[nodiscard]] std::optional<scheme>
network_scheme_from_string(std::string_view name) noexcept;

} // namespace connstr
