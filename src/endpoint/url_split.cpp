#include "url_split.hpp"

#include "connstr/ip/address.hpp"

#include <string>

namespace connstr::detail {

namespace {

bool is_alpha(char ch) noexcept {
    return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z');
}

bool is_digit(char ch) noexcept {
    return ch >= '0' && ch <= '9';
}

bool is_scheme_char(char ch) noexcept {
    return is_alpha(ch) || is_digit(ch) || ch == '+' || ch == '-' ||
           ch == '.';
}

// Characters that may not appear in a registered host name.
bool is_forbidden_host_char(char ch) noexcept {
    const auto byte = static_cast<unsigned char>(ch);
    if (byte <= 0x20 || byte == 0x7f) {
        return true;
    }
    switch (ch) {
    case '<':
    case '>':
    case '[':
    case ']':
    case '\\':
    case '^':
    case '|':
        return true;
    default:
        return false;
    }
}

std::optional<std::uint16_t> parse_port_digits(std::string_view text) {
    std::uint32_t port = 0;
    for (const char ch : text) {
        if (!is_digit(ch)) {
            return std::nullopt;
        }
        port = port * 10U + static_cast<std::uint32_t>(ch - '0');
        if (port > 65535U) {
            return std::nullopt;
        }
    }
    return static_cast<std::uint16_t>(port);
}

} // namespace

result<url_parts> split_url(std::string_view text) {
    const auto fail = [text]() {
        return err<url_parts>(errc::invalid_address, std::string{text});
    };

    const std::size_t colon = text.find(':');
    if (colon == std::string_view::npos || colon == 0 || !is_alpha(text[0])) {
        return fail();
    }
    for (std::size_t i = 1; i < colon; ++i) {
        if (!is_scheme_char(text[i])) {
            return fail();
        }
    }

    url_parts parts{};
    parts.scheme = text.substr(0, colon);

    // Without "//" there is no authority, hence no host.
    std::string_view rest = text.substr(colon + 1);
    if (!rest.starts_with("//")) {
        return fail();
    }
    rest.remove_prefix(2);

    std::string_view authority = rest.substr(0, rest.find_first_of("/?#"));
    if (const std::size_t at = authority.rfind('@');
        at != std::string_view::npos) {
        authority.remove_prefix(at + 1);
    }

    std::string_view port_text{};
    if (authority.starts_with('[')) {
        const std::size_t close = authority.find(']');
        if (close == std::string_view::npos) {
            return fail();
        }
        parts.host = authority.substr(1, close - 1);

        const std::string_view after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after.front() != ':') {
                return fail();
            }
            port_text = after.substr(1);
        }

        const auto literal = ip::address::parse(parts.host);
        if (!literal.has_value() || !literal.value().is_v6()) {
            return fail();
        }
    } else {
        const std::size_t separator = authority.find(':');
        parts.host = authority.substr(0, separator);
        if (separator != std::string_view::npos) {
            port_text = authority.substr(separator + 1);
        }

        for (const char ch : parts.host) {
            if (is_forbidden_host_char(ch)) {
                return fail();
            }
        }
    }

    if (parts.host.empty()) {
        return fail();
    }

    // "host:" carries no port.
    if (!port_text.empty()) {
        parts.port = parse_port_digits(port_text);
        if (!parts.port.has_value()) {
            return fail();
        }
    }

    return parts;
}

} // namespace connstr::detail
