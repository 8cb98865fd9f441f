#include "connstr/endpoint/format.hpp"

namespace connstr {

namespace {

std::string format_host(const host_addr& host) {
    const auto* literal = host.ip();
    if (literal != nullptr && literal->is_v6()) {
        return "[" + literal->to_string() + "]";
    }
    return host.to_string();
}

} // namespace

std::string format_endpoint(const endpoint& value) {
    std::string out{to_string(value.kind())};
    out += "://";

    if (const auto* location = value.location()) {
        out += format_host(location->host);
        out += ':';
        out += std::to_string(location->port);
        return out;
    }

    out += value.path()->string();
    return out;
}

std::ostream& operator<<(std::ostream& out, const endpoint& value) {
    return out << format_endpoint(value);
}

std::ostream& operator<<(std::ostream& out, const host_addr& value) {
    return out << value.to_string();
}

} // namespace connstr
