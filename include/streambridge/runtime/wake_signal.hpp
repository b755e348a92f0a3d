#pragma once

/**
 * @file
 * @brief `eventfd`-backed wake-up signal for parking the loop thread.
 */

#include "streambridge/core/result.hpp"

#include <chrono>
#include <optional>

namespace streambridge::runtime {

/**
 * @brief Move-only owner of a non-blocking `eventfd`.
 *
 * `notify()` may be called from any thread. `wait()` and `drain()` belong to
 * the single thread that parks on the signal.
 */
class wake_signal {
public:
    /// Construct an invalid signal.
    wake_signal() noexcept = default;
    /// Close the descriptor if still owned.
    ~wake_signal() noexcept;

    wake_signal(const wake_signal&) = delete;
    wake_signal& operator=(const wake_signal&) = delete;
    wake_signal(wake_signal&& other) noexcept;
    wake_signal& operator=(wake_signal&& other) noexcept;

    /// @brief Create a new `eventfd`.
    [[nodiscard]] static result<wake_signal> create() noexcept;

    /// @brief Make the next (or current) `wait()` return.
    void notify() noexcept;
    /// @brief Reset the counter after a wake-up.
    void drain() noexcept;
    /**
     * @brief Block until notified or the timeout expires.
     * @param timeout Maximum wait; `std::nullopt` waits indefinitely.
     * @return `true` when notified, `false` on timeout.
     */
    [[nodiscard]] result<bool>
    wait(std::optional<std::chrono::milliseconds> timeout) noexcept;

    /// @return Native descriptor or `-1`.
    [[nodiscard]] int native_handle() const noexcept;
    /// @return `true` when a valid descriptor is owned.
    [[nodiscard]] bool valid() const noexcept;

private:
    explicit wake_signal(int fd) noexcept;

    int fd_{-1};
};

} // namespace streambridge::runtime
