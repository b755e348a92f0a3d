#pragma once

/**
 * @file
 * @brief `std::expected`-based return type for every fallible call.
 */

#include "streambridge/core/error.hpp"

#include <expected>
#include <type_traits>
#include <utility>

namespace streambridge {

/// Value of `T` or the `error` that prevented it.
template <class T>
using result = std::expected<T, error>;

/// @brief Wrap a value as a successful result.
template <class T>
[[nodiscard]] constexpr result<std::decay_t<T>> ok(T&& value) {
    return result<std::decay_t<T>>{std::forward<T>(value)};
}

/// @brief Successful `result<void>`.
[[nodiscard]] constexpr result<void> ok() {
    return {};
}

/**
 * @brief Failed result carrying `e`.
 *
 * Spell out `T` at the call site: `return err<chunk>(e);`.
 */
template <class T>
[[nodiscard]] constexpr result<T> err(error e) {
    return std::unexpected<error>{e};
}

/// @brief Failed result for a library condition.
template <class T>
[[nodiscard]] result<T> err(errc condition) {
    return err<T>(make_error(condition));
}

} // namespace streambridge
