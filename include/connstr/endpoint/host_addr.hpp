#pragma once

/**
 * @file
 * @brief Host part of a network endpoint: IP literal or domain name.
 */

#include "connstr/core/result.hpp"
#include "connstr/ip/address.hpp"

#include <string>
#include <string_view>
#include <variant>

namespace connstr {

/**
 * @brief Literal IP address or non-empty domain name.
 *
 * Domains are opaque: no syntax checks beyond non-emptiness.
 */
class host_addr {
public:
    /// Wrap an IP literal.
    host_addr(ip::address address) noexcept;

    /**
     * @brief Build a domain host.
     * @param name Domain name, kept verbatim.
     * @return `errc::invalid_address` when `name` is empty.
     */
    [[nodiscard]] static result<host_addr> from_domain(std::string name);

    /**
     * @brief Classify host text.
     *
     * Text that parses as an IP literal yields an IP host; anything else
     * becomes a domain.
     *
     * @param text Host text without brackets.
     * @return `errc::invalid_address` when `text` is empty.
     */
    [[nodiscard]] static result<host_addr> from_string(std::string_view text);

    [[nodiscard]] bool is_ip() const noexcept;
    [[nodiscard]] bool is_domain() const noexcept;

    /// @return IP literal, or `nullptr` for a domain.
    [[nodiscard]] const ip::address* ip() const noexcept;
    /// @return Domain name, or `nullptr` for an IP literal.
    [[nodiscard]] const std::string* domain() const noexcept;

    /// @return IP standard text or the domain verbatim.
    [[nodiscard]] std::string to_string() const;

    friend bool operator==(const host_addr&, const host_addr&) = default;

private:
    explicit host_addr(std::string name) noexcept;

    std::variant<ip::address, std::string> value_;
};

} // namespace connstr
