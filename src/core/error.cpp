#include "connstr/core/error.hpp"

#include <utility>

namespace {

class connstr_category_impl final : public std::error_category {
public:
    const char* name() const noexcept override {
        return "connstr";
    }

    std::string message(int value) const override {
        switch (static_cast<connstr::errc>(value)) {
        case connstr::errc::invalid_scheme:
            return "unsupported scheme";
        case connstr::errc::invalid_address:
            return "invalid address";
        }
        return "unknown connstr error";
    }
};

} // namespace

namespace connstr {

const std::error_category& connstr_category() noexcept {
    static const connstr_category_impl category;
    return category;
}

std::error_code make_error_code(errc value) noexcept {
    return std::error_code{static_cast<int>(value), connstr_category()};
}

error::error(errc kind, std::string detail)
    : kind_(kind), detail_(std::move(detail)) {}

error error::invalid_scheme() {
    return error{errc::invalid_scheme};
}

error error::invalid_address(std::string detail) {
    return error{errc::invalid_address, std::move(detail)};
}

errc error::kind() const noexcept {
    return kind_;
}

std::error_code error::code() const noexcept {
    return make_error_code(kind_);
}

int error::value() const noexcept {
    return static_cast<int>(kind_);
}

const std::string& error::detail() const noexcept {
    return detail_;
}

std::string error::message() const {
    if (kind_ == errc::invalid_address) {
        return code().message() + ": " + detail_;
    }
    return code().message();
}

} // namespace connstr
