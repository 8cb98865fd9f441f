#include "connstr/endpoint/resolve.hpp"

#include <memory>
#include <netdb.h>
#include <sys/socket.h>

namespace connstr {

namespace {

using addrinfo_ptr = std::unique_ptr<addrinfo, decltype(&::freeaddrinfo)>;

} // namespace

result<std::vector<ip::socket_address>>
resolve_endpoint(const endpoint& value) {
    const auto* location = value.location();
    if (location == nullptr) {
        return err<std::vector<ip::socket_address>>(
            errc::invalid_address, "No SocketAddr available");
    }

    if (const auto* literal = location->host.ip()) {
        return std::vector<ip::socket_address>{
            ip::socket_address{.address = *literal, .port = location->port}};
    }
    return resolve_host(*location->host.domain(), location->port);
}

result<std::vector<ip::socket_address>>
resolve_host(const std::string& domain, std::uint16_t port) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* raw_result = nullptr;
    const std::string service = std::to_string(port);
    const int resolve_status =
        ::getaddrinfo(domain.c_str(), service.c_str(), &hints, &raw_result);
    if (resolve_status != 0) {
        return err<std::vector<ip::socket_address>>(errc::invalid_address,
                                                    domain);
    }
    const addrinfo_ptr owned{raw_result, &::freeaddrinfo};

    std::vector<ip::socket_address> addresses;
    for (const addrinfo* cursor = owned.get(); cursor != nullptr;
         cursor = cursor->ai_next) {
        if (cursor->ai_addr == nullptr) {
            continue;
        }

        auto converted = ip::socket_address::from_sockaddr(
            cursor->ai_addr, cursor->ai_addrlen);
        if (!converted.has_value()) {
            continue;
        }
        addresses.push_back(converted.value());
    }

    return addresses;
}

} // namespace connstr
