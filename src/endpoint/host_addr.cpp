#include "connstr/endpoint/host_addr.hpp"

#include <utility>

namespace connstr {

host_addr::host_addr(ip::address address) noexcept : value_(address) {}

host_addr::host_addr(std::string name) noexcept : value_(std::move(name)) {}

result<host_addr> host_addr::from_domain(std::string name) {
    if (name.empty()) {
        return err<host_addr>(errc::invalid_address, "empty host");
    }
    return host_addr{std::move(name)};
}

result<host_addr> host_addr::from_string(std::string_view text) {
    if (text.empty()) {
        return err<host_addr>(errc::invalid_address, "empty host");
    }

    auto literal = ip::address::parse(text);
    if (literal.has_value()) {
        return host_addr{literal.value()};
    }
    return host_addr{std::string{text}};
}

bool host_addr::is_ip() const noexcept {
    return std::holds_alternative<ip::address>(value_);
}

bool host_addr::is_domain() const noexcept {
    return std::holds_alternative<std::string>(value_);
}

const ip::address* host_addr::ip() const noexcept {
    return std::get_if<ip::address>(&value_);
}

const std::string* host_addr::domain() const noexcept {
    return std::get_if<std::string>(&value_);
}

std::string host_addr::to_string() const {
    if (const auto* literal = ip()) {
        return literal->to_string();
    }
    return std::get<std::string>(value_);
}

} // namespace connstr
