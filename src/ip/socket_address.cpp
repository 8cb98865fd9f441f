#include "connstr/ip/socket_address.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <cstring>
#include <netinet/in.h>

namespace connstr::ip {

std::string socket_address::to_string() const {
    if (address.is_v6()) {
        return "[" + address.to_string() + "]:" + std::to_string(port);
    }
    return address.to_string() + ":" + std::to_string(port);
}

socket_address::native socket_address::to_sockaddr() const noexcept {
    native out{};
    if (address.is_v4()) {
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(port);
        const auto bytes = address.to_v4_bytes();
        std::memcpy(&addr.sin_addr, bytes.data(), bytes.size());
        std::memcpy(&out.storage, &addr, sizeof(addr));
        out.length = sizeof(addr);
        return out;
    }

    sockaddr_in6 addr{};
    addr.sin6_family = AF_INET6;
    addr.sin6_port = htons(port);
    const auto bytes = address.to_v6_bytes();
    std::memcpy(&addr.sin6_addr, bytes.data(), bytes.size());
    std::memcpy(&out.storage, &addr, sizeof(addr));
    out.length = sizeof(addr);
    return out;
}

result<socket_address> socket_address::from_sockaddr(const sockaddr* addr,
                                                     socklen_t length) {
    if (addr == nullptr) {
        return err<socket_address>(errc::invalid_address, "null sockaddr");
    }

    if (addr->sa_family == AF_INET &&
        length >= static_cast<socklen_t>(sizeof(sockaddr_in))) {
        sockaddr_in v4{};
        std::memcpy(&v4, addr, sizeof(v4));
        ip::address::v4_bytes bytes{};
        std::memcpy(bytes.data(), &v4.sin_addr, bytes.size());
        return socket_address{.address = ip::address::from_v4(bytes),
                              .port = ntohs(v4.sin_port)};
    }

    if (addr->sa_family == AF_INET6 &&
        length >= static_cast<socklen_t>(sizeof(sockaddr_in6))) {
        sockaddr_in6 v6{};
        std::memcpy(&v6, addr, sizeof(v6));
        ip::address::v6_bytes bytes{};
        std::memcpy(bytes.data(), &v6.sin6_addr, bytes.size());
        return socket_address{.address = ip::address::from_v6(bytes),
                              .port = ntohs(v6.sin6_port)};
    }

    return err<socket_address>(errc::invalid_address,
                               "unsupported address family " +
                                   std::to_string(addr->sa_family));
}

} // namespace connstr::ip
