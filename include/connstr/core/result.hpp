#pragma once

/**
 * @file
 * @brief Result alias and helper constructors based on `std::expected`.
 */

#include "connstr/core/error.hpp"

#include <expected>
#include <string>
#include <type_traits>
#include <utility>

namespace connstr {

/**
 * @brief Return type of every fallible connstr operation.
 * @tparam T Success value type.
 */
template <class T>
using result = std::expected<T, error>;

/**
 * @brief Construct a successful `result<T>`.
 * @tparam T Value type.
 * @param value Value to store in the success state.
 */
template <class T>
[[nodiscard]] constexpr result<std::decay_t<T>> ok(T&& value) {
    return result<std::decay_t<T>>{std::forward<T>(value)};
}

/// @brief Construct a successful `result<void>`.
[[nodiscard]] constexpr result<void> ok() {
    return result<void>{};
}

/**
 * @brief Construct an error result from an existing error value.
 * @tparam T Success value type.
 * @param e Error value.
 */
template <class T>
[[nodiscard]] result<T> err(error e) {
    return std::unexpected<error>{std::move(e)};
}

/**
 * @brief Construct an error result from a kind and detail.
 * @tparam T Success value type.
 * @param kind Error kind.
 * @param detail Offending input or host.
 */
template <class T>
[[nodiscard]] result<T> err(errc kind, std::string detail = {}) {
    return std::unexpected<error>{error{kind, std::move(detail)}};
}

} // namespace connstr
