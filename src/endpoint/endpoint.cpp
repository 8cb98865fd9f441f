#include "connstr/endpoint/endpoint.hpp"

#include <utility>

namespace connstr {

endpoint::endpoint(scheme kind, network_location location)
    : kind_(kind), target_(std::move(location)) {}

endpoint::endpoint(scheme kind, std::filesystem::path path)
    : kind_(kind), target_(std::move(path)) {}

result<endpoint> endpoint::network(scheme kind, host_addr host,
                                   std::uint16_t port) {
    if (!is_network_scheme(kind)) {
        return err<endpoint>(error::invalid_scheme());
    }
    return endpoint{kind, network_location{std::move(host), port}};
}

result<endpoint> endpoint::local(scheme kind, std::filesystem::path path) {
    if (is_network_scheme(kind)) {
        return err<endpoint>(error::invalid_scheme());
    }
    return endpoint{kind, std::move(path)};
}

endpoint endpoint::unix_socket(std::filesystem::path path) {
    return endpoint{scheme::unix_socket, std::move(path)};
}

endpoint endpoint::file(std::filesystem::path path) {
    return endpoint{scheme::file, std::move(path)};
}

scheme endpoint::kind() const noexcept {
    return kind_;
}

bool endpoint::is_network() const noexcept {
    return std::holds_alternative<network_location>(target_);
}

bool endpoint::is_path() const noexcept {
    return std::holds_alternative<std::filesystem::path>(target_);
}

const network_location* endpoint::location() const noexcept {
    return std::get_if<network_location>(&target_);
}

const std::filesystem::path* endpoint::path() const noexcept {
    return std::get_if<std::filesystem::path>(&target_);
}

} // namespace connstr
