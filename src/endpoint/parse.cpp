#include "connstr/endpoint/parse.hpp"

#include "url_split.hpp"

#include <optional>
#include <string>
#include <utility>

namespace connstr {

namespace {

constexpr std::string_view unix_prefix = "unix://";
constexpr std::string_view file_prefix = "file://";

} // namespace

result<endpoint> parse_endpoint(std::string_view text) {
    if (text.starts_with(unix_prefix)) {
        return endpoint::unix_socket(
            std::filesystem::path{std::string{text.substr(unix_prefix.size())}});
    }
    if (text.starts_with(file_prefix)) {
        return endpoint::file(
            std::filesystem::path{std::string{text.substr(file_prefix.size())}});
    }

    const auto parts = detail::split_url(text);
    if (!parts.has_value()) {
        return err<endpoint>(parts.error());
    }

    auto host = host_addr::from_string(parts->host);
    if (!host.has_value()) {
        return err<endpoint>(errc::invalid_address, std::string{text});
    }

    // Default ports are looked up before the scheme is validated, so an
    // unknown scheme without a port reports a missing port.
    std::optional<std::uint16_t> port = parts->port;
    if (!port.has_value()) {
        if (const auto known = scheme_from_string(parts->scheme)) {
            port = default_port(*known);
        }
    }
    if (!port.has_value()) {
        return err<endpoint>(errc::invalid_address, std::string{text});
    }

    const auto kind = network_scheme_from_string(parts->scheme);
    if (!kind.has_value()) {
        return err<endpoint>(error::invalid_scheme());
    }

    return endpoint::network(*kind, std::move(host.value()), *port);
}

} // namespace connstr
