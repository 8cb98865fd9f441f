#pragma once

/**
 * @file
 * @brief Error value shared by every fallible connstr operation.
 */

#include <string>
#include <system_error>
#include <type_traits>

namespace connstr {

/**
 * @brief Error kinds reported by parsing and resolution.
 */
enum class errc {
    /// URL syntax was valid but the scheme is not supported.
    invalid_scheme = 1,
    /// Malformed input, missing host or port, or failed resolution.
    invalid_address = 2,
};

/// @return Category used for `errc` values (name `"connstr"`).
[[nodiscard]] const std::error_category& connstr_category() noexcept;

/// Convert an `errc` into a `std::error_code` in `connstr_category()`.
[[nodiscard]] std::error_code make_error_code(errc value) noexcept;

/**
 * @brief Error value used across `result<T>`.
 *
 * Carries the error kind plus a diagnostic detail, which holds the offending
 * input or host for `errc::invalid_address`.
 */
class error {
public:
    /// Construct an `invalid_address` error with an empty detail.
    error() = default;
    /**
     * @brief Construct from a kind and detail.
     * @param kind Error kind.
     * @param detail Offending input, host, or reason.
     */
    explicit error(errc kind, std::string detail = {});

    /// @return `errc::invalid_scheme` error.
    [[nodiscard]] static error invalid_scheme();
    /**
     * @brief Build an `errc::invalid_address` error.
     * @param detail Offending input or host.
     */
    [[nodiscard]] static error invalid_address(std::string detail);

    /// @return Error kind.
    [[nodiscard]] errc kind() const noexcept;
    /// @return Kind as `std::error_code`.
    [[nodiscard]] std::error_code code() const noexcept;
    /// @return Integer value of the kind.
    [[nodiscard]] int value() const noexcept;
    /// @return Diagnostic detail (may be empty).
    [[nodiscard]] const std::string& detail() const noexcept;
    /// @return Human-readable message, e.g. `invalid address: tcp://h`.
    [[nodiscard]] std::string message() const;

    friend bool operator==(const error&, const error&) = default;

private:
    errc kind_{errc::invalid_address};
    std::string detail_{};
};

} // namespace connstr

template <>
struct std::is_error_code_enum<connstr::errc> : std::true_type {};
