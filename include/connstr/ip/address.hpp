#pragma once

/**
 * @file
 * @brief IPv4/IPv6 address value type.
 */

#include "connstr/core/result.hpp"

#include <array>
#include <compare>
#include <cstdint>
#include <string>
#include <string_view>

namespace connstr::ip {

/**
 * @brief IP address family.
 */
enum class family : std::uint8_t {
    v4,
    v6,
};

/**
 * @brief IPv4 or IPv6 address stored in network byte order.
 */
class address {
public:
    using v4_bytes = std::array<std::uint8_t, 4>;
    using v6_bytes = std::array<std::uint8_t, 16>;

    /// Construct the IPv4 unspecified address (`0.0.0.0`).
    address() noexcept = default;

    /// Build an IPv4 address from its four octets.
    [[nodiscard]] static address from_v4(const v4_bytes& bytes) noexcept;
    /// Build an IPv6 address from its sixteen octets.
    [[nodiscard]] static address from_v6(const v6_bytes& bytes) noexcept;

    /// @return `127.0.0.1`.
    [[nodiscard]] static address loopback_v4() noexcept;
    /// @return `::1`.
    [[nodiscard]] static address loopback_v6() noexcept;

    /**
     * @brief Parse a textual IP literal.
     *
     * Accepts dotted-quad IPv4 or standard IPv6 text. Brackets and zone ids
     * are rejected.
     *
     * @param text Address text.
     * @return Parsed address, or `errc::invalid_address` carrying `text`.
     */
    [[nodiscard]] static result<address> parse(std::string_view text);

    /// @return Address family.
    [[nodiscard]] ip::family family() const noexcept;
    [[nodiscard]] bool is_v4() const noexcept;
    [[nodiscard]] bool is_v6() const noexcept;

    /// @return The four octets. Only meaningful when `is_v4()`.
    [[nodiscard]] v4_bytes to_v4_bytes() const noexcept;
    /// @return The sixteen octets. Only meaningful when `is_v6()`.
    [[nodiscard]] v6_bytes to_v6_bytes() const noexcept;

    /// @return Standard textual form, without brackets for IPv6.
    [[nodiscard]] std::string to_string() const;

    friend bool operator==(const address&, const address&) = default;
    friend auto operator<=>(const address&, const address&) = default;

private:
    ip::family family_{ip::family::v4};
    // IPv4 uses the first four bytes; the rest stay zero.
    v6_bytes bytes_{};
};

} // namespace connstr::ip
