#include "connstr/connstr.hpp"

#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace {

struct options {
    bool resolve{false};
    std::vector<std::string> inputs{};
};

bool parse_args(int argc, char** argv, options& out) {
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg{argv[i]};
        if (arg == "--resolve") {
            out.resolve = true;
            continue;
        }
        if (arg.starts_with("--")) {
            return false;
        }
        out.inputs.emplace_back(arg);
    }
    return !out.inputs.empty();
}

void print_usage() {
    std::cerr << "usage: connstr_inspect [--resolve] <endpoint>...\n";
}

bool inspect(const std::string& input, bool resolve) {
    const auto parsed = connstr::parse_endpoint(input);
    if (!parsed.has_value()) {
        std::cerr << input << ": " << parsed.error().message() << '\n';
        return false;
    }

    const auto& value = parsed.value();
    std::cout << input << " -> " << value << '\n';
    if (const auto* location = value.location()) {
        std::cout << "  scheme: " << connstr::to_string(value.kind())
                  << "\n  host:   " << location->host
                  << (location->host.is_ip() ? " (ip)" : " (domain)")
                  << "\n  port:   " << location->port << '\n';
    } else {
        std::cout << "  scheme: " << connstr::to_string(value.kind())
                  << "\n  path:   " << value.path()->string() << '\n';
    }

    if (!resolve) {
        return true;
    }

    const auto addresses = connstr::resolve_endpoint(value);
    if (!addresses.has_value()) {
        std::cerr << input << ": resolve failed: "
                  << addresses.error().message() << '\n';
        return false;
    }
    for (const auto& address : addresses.value()) {
        std::cout << "  addr:   " << address.to_string() << '\n';
    }
    return true;
}

} // namespace

int main(int argc, char** argv) {
    options opts;
    if (!parse_args(argc, argv, opts)) {
        print_usage();
        return 2;
    }

    bool all_ok = true;
    for (const auto& input : opts.inputs) {
        if (!inspect(input, opts.resolve)) {
            all_ok = false;
        }
    }
    return all_ok ? 0 : 1;
}
