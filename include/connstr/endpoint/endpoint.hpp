#pragma once

/**
 * @file
 * @brief Typed network or filesystem endpoint.
 */

#include "connstr/core/result.hpp"
#include "connstr/endpoint/host_addr.hpp"
#include "connstr/endpoint/scheme.hpp"

#include <cstdint>
#include <filesystem>
#include <variant>

namespace connstr {

/**
 * @brief Host and port of a network endpoint.
 */
struct network_location {
    /// IP literal or domain name.
    host_addr host;
    /// Port in host byte order.
    std::uint16_t port{};

    friend bool operator==(const network_location&,
                           const network_location&) = default;
};

/**
 * @brief Immutable endpoint: a network scheme with host and port, or a
 *        `unix`/`file` scheme with a path.
 *
 * Values are only produced whole, by `parse_endpoint` or by the factories
 * below, and expose no mutators.
 */
class endpoint {
public:
    /**
     * @brief Build a network endpoint from validated parts.
     * @param kind One of the thirteen network schemes.
     * @param host Host address.
     * @param port Port in host byte order.
     * @return `errc::invalid_scheme` when `kind` is a path scheme.
     */
    [[nodiscard]] static result<endpoint> network(scheme kind, host_addr host,
                                                  std::uint16_t port);
    /**
     * @brief Build a path endpoint.
     * @param kind `scheme::unix_socket` or `scheme::file`.
     * @param path Filesystem path, kept verbatim.
     * @return `errc::invalid_scheme` when `kind` is a network scheme.
     */
    [[nodiscard]] static result<endpoint> local(scheme kind,
                                                std::filesystem::path path);

    /// Unix-domain socket endpoint.
    [[nodiscard]] static endpoint unix_socket(std::filesystem::path path);
    /// File endpoint.
    [[nodiscard]] static endpoint file(std::filesystem::path path);

    /// @return Scheme discriminant.
    [[nodiscard]] scheme kind() const noexcept;
    [[nodiscard]] bool is_network() const noexcept;
    [[nodiscard]] bool is_path() const noexcept;

    /// @return Host and port, or `nullptr` for path endpoints.
    [[nodiscard]] const network_location* location() const noexcept;
    /// @return Path, or `nullptr` for network endpoints.
    [[nodiscard]] const std::filesystem::path* path() const noexcept;

    friend bool operator==(const endpoint&, const endpoint&) = default;

private:
    endpoint(scheme kind, network_location location);
    endpoint(scheme kind, std::filesystem::path path);

    scheme kind_;
    std::variant<network_location, std::filesystem::path> target_;
};

} // namespace connstr
