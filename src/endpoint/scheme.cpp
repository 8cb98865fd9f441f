#include "connstr/endpoint/scheme.hpp"

#include <array>

namespace connstr {

namespace {

constexpr std::array<scheme_info, scheme_count> table{{
    {scheme::http, "http", plain_default_port, true},
    {scheme::https, "https", secure_default_port, true},
    {scheme::tcp, "tcp", std::nullopt, true},
    {scheme::udp, "udp", std::nullopt, true},
    {scheme::mqtt, "mqtt", plain_default_port, true},
    {scheme::mqtts, "mqtts", secure_default_port, true},
    {scheme::ws, "ws", plain_default_port, true},
    {scheme::wss, "wss", secure_default_port, true},
    {scheme::coap, "coap", plain_default_port, true},
    {scheme::coaps, "coaps", secure_default_port, true},
    {scheme::redis, "redis", plain_default_port, true},
    {scheme::amqp, "amqp", plain_default_port, true},
    {scheme::ftp, "ftp", plain_default_port, true},
    {scheme::unix_socket, "unix", std::nullopt, false},
    {scheme::file, "file", std::nullopt, false},
}};

constexpr bool table_matches_enum() {
    for (std::size_t i = 0; i < table.size(); ++i) {
        if (static_cast<std::size_t>(table[i].id) != i ||
            table[i].name.empty()) {
            return false;
        }
    }
    return static_cast<std::size_t>(scheme::file) + 1 == table.size();
}

static_assert(table_matches_enum(),
              "scheme table must list every scheme in enumerator order");

} // namespace

std::span<const scheme_info> scheme_table() noexcept {
    return table;
}

const scheme_info& describe(scheme value) noexcept {
    return table[static_cast<std::size_t>(value)];
}

std::string_view to_string(scheme value) noexcept {
    return describe(value).name;
}

std::optional<std::uint16_t> default_port(scheme value) noexcept {
    return describe(value).default_port;
}

bool is_network_scheme(scheme value) noexcept {
    return describe(value).network;
}

std::optional<scheme> scheme_from_string(std::string_view name) noexcept {
    for (const auto& row : table) {
        if (row.name == name) {
            return row.id;
        }
    }
    return std::nullopt;
}

std::optional<scheme>
network_scheme_from_string(std::string_view name) noexcept {
    const auto found = scheme_from_string(name);
    if (!found.has_value() || !is_network_scheme(*found)) {
        return std::nullopt;
    }
    return found;
}

} // namespace connstr
