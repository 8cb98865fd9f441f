#include "connstr/connstr.hpp"

#include <boost/asio.hpp>

#include <iostream>
#include <string>
#include <vector>

namespace {

using tcp = boost::asio::ip::tcp;

std::vector<std::string> resolve_with_asio(const connstr::endpoint& value,
                                           std::string& error_message) {
    std::vector<std::string> out;
    const auto* location = value.location();
    if (location == nullptr) {
        error_message = "path endpoints have no socket address";
        return out;
    }

    boost::asio::io_context context;
    tcp::resolver resolver{context};
    boost::system::error_code ec;
    const auto results = resolver.resolve(
        location->host.to_string(), std::to_string(location->port), ec);
    if (ec) {
        error_message = ec.message();
        return out;
    }

    for (const auto& entry : results) {
        const auto ep = entry.endpoint();
        const auto address = ep.address();
        if (address.is_v6()) {
            out.push_back("[" + address.to_string() + "]:" +
                          std::to_string(ep.port()));
        } else {
            out.push_back(address.to_string() + ":" +
                          std::to_string(ep.port()));
        }
    }
    return out;
}

} // namespace

int main(int argc, char** argv) {
    if (argc != 2) {
        std::cerr << "usage: connstr_resolve_boost_asio <endpoint>\n";
        return 2;
    }

    const auto parsed = connstr::parse_endpoint(argv[1]);
    if (!parsed.has_value()) {
        std::cerr << "parse failed: " << parsed.error().message() << '\n';
        return 1;
    }

    int status = 0;
    std::cout << "connstr:\n";
    const auto resolved = connstr::resolve_endpoint(parsed.value());
    if (resolved.has_value()) {
        for (const auto& address : resolved.value()) {
            std::cout << "  " << address.to_string() << '\n';
        }
    } else {
        std::cerr << "  connstr resolve failed: "
                  << resolved.error().message() << '\n';
        status = 1;
    }

    std::cout << "boost::asio:\n";
    std::string asio_error;
    const auto asio_addresses = resolve_with_asio(parsed.value(), asio_error);
    if (!asio_error.empty()) {
        std::cerr << "  boost::asio resolve failed: " << asio_error << '\n';
        status = 1;
    }
    for (const auto& text : asio_addresses) {
        std::cout << "  " << text << '\n';
    }

    return status;
}
