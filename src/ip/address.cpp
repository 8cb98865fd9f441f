#include "connstr/ip/address.hpp"

#include <algorithm>
#include <arpa/inet.h>
#include <netinet/in.h>

namespace connstr::ip {

address address::from_v4(const v4_bytes& bytes) noexcept {
    address value;
    value.family_ = ip::family::v4;
    std::copy(bytes.begin(), bytes.end(), value.bytes_.begin());
    return value;
}

address address::from_v6(const v6_bytes& bytes) noexcept {
    address value;
    value.family_ = ip::family::v6;
    value.bytes_ = bytes;
    return value;
}

address address::loopback_v4() noexcept {
    return from_v4({127, 0, 0, 1});
}

address address::loopback_v6() noexcept {
    v6_bytes bytes{};
    bytes[15] = 1;
    return from_v6(bytes);
}

result<address> address::parse(std::string_view text) {
    // inet_pton needs a terminated buffer.
    const std::string owned{text};

    in_addr v4{};
    if (::inet_pton(AF_INET, owned.c_str(), &v4) == 1) {
        v4_bytes bytes{};
        std::copy_n(reinterpret_cast<const std::uint8_t*>(&v4.s_addr),
                    bytes.size(), bytes.begin());
        return from_v4(bytes);
    }

    in6_addr v6{};
    if (::inet_pton(AF_INET6, owned.c_str(), &v6) == 1) {
        v6_bytes bytes{};
        std::copy_n(v6.s6_addr, bytes.size(), bytes.begin());
        return from_v6(bytes);
    }

    return err<address>(errc::invalid_address, owned);
}

ip::family address::family() const noexcept {
    return family_;
}

bool address::is_v4() const noexcept {
    return family_ == ip::family::v4;
}

bool address::is_v6() const noexcept {
    return family_ == ip::family::v6;
}

address::v4_bytes address::to_v4_bytes() const noexcept {
    v4_bytes bytes{};
    std::copy_n(bytes_.begin(), bytes.size(), bytes.begin());
    return bytes;
}

address::v6_bytes address::to_v6_bytes() const noexcept {
    return bytes_;
}

std::string address::to_string() const {
    std::array<char, INET6_ADDRSTRLEN> buffer{};
    const int af = is_v4() ? AF_INET : AF_INET6;
    const char* converted =
        ::inet_ntop(af, bytes_.data(), buffer.data(), buffer.size());
    if (converted == nullptr) {
        return {};
    }
    return std::string{converted};
}

} // namespace connstr::ip
