#pragma once

/**
 * @file
 * @brief Error value and library error codes shared by every component.
 */

#include <cerrno>
#include <string>
#include <system_error>
#include <type_traits>

namespace streambridge {

/**
 * @brief Library-level failure conditions.
 *
 * Values belong to `bridge_category()`. OS failures keep the system category
 * and are built with `make_error_from_errno`.
 */
enum class errc {
    /// Option value rejected at construction (capacity or timeout).
    invalid_configuration = 1,
    /// Writer call issued after `close()` took effect.
    stream_closed,
    /// Downstream canceled; no further writes are possible.
    stream_terminated,
    /// Flush or close did not resolve within the configured timeout.
    timed_out,
    /// Blocking enqueue failed for a reason other than cancellation.
    enqueue_failed,
    /// Queue was poisoned during shutdown.
    queue_poisoned,
    /// Blocking dequeue was canceled through its token.
    wait_canceled,
    /// Target loop or pool no longer accepts work.
    executor_closed,
};

/// @return Category shared by all `errc` values.
[[nodiscard]] const std::error_category& bridge_category() noexcept;

/// @brief Convert `errc` into a `std::error_code` (enables implicit conversion).
[[nodiscard]] std::error_code make_error_code(errc value) noexcept;

/**
 * @brief Error value used across `result<T>`.
 *
 * This type wraps `std::error_code` while providing helper constructors
 * for errno-based and library failures.
 */
class error {
public:
    /// Construct a success-like empty error (`value() == 0`).
    error() noexcept = default;
    /// Construct from an explicit error code.
    explicit error(std::error_code code) noexcept;
    /// Construct from a library condition.
    explicit error(errc value) noexcept;

    /**
     * @brief Build an error from errno.
     * @param value errno value. Defaults to current `errno`.
     * @return Converted `error` in the system category.
     */
    [[nodiscard]] static error from_errno(int value = errno) noexcept;

    /// @return Underlying `std::error_code`.
    [[nodiscard]] std::error_code code() const noexcept;
    /// @return Integer code value.
    [[nodiscard]] int value() const noexcept;
    /// @return Human-readable message for the code.
    [[nodiscard]] std::string message() const;
    /// @return `true` when this error carries the given library condition.
    [[nodiscard]] bool is(errc value) const noexcept;

private:
    std::error_code code_;
};

/**
 * @brief Convenience helper that wraps an errno value into `error`.
 * @param value errno value to convert.
 */
[[nodiscard]] error make_error_from_errno(int value) noexcept;

/// @brief Convenience helper that wraps a library condition into `error`.
[[nodiscard]] error make_error(errc value) noexcept;

} // namespace streambridge

template <>
struct std::is_error_code_enum<streambridge::errc> : std::true_type {};
