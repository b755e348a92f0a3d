#pragma once

/**
 * @file
 * @brief Shared downstream status cell.
 */

#include <atomic>
#include <cstdint>
#include <string_view>

namespace streambridge {

/// @brief Downstream status; `open` to `canceled` is the only transition.
enum class downstream_status : std::uint8_t {
    open = 0,
    canceled = 1,
};

/// @return Lower-case name of the status.
[[nodiscard]] std::string_view to_string(downstream_status status) noexcept;

/**
 * @brief Atomic status cell read by the writer and written by the controller.
 */
class lifecycle_guard {
public:
    lifecycle_guard() noexcept = default;

    lifecycle_guard(const lifecycle_guard&) = delete;
    lifecycle_guard& operator=(const lifecycle_guard&) = delete;

    /// @return Current status.
    [[nodiscard]] downstream_status status() const noexcept {
        return status_.load(std::memory_order_acquire);
    }

    /// @return `true` once canceled.
    [[nodiscard]] bool is_canceled() const noexcept {
        return status() == downstream_status::canceled;
    }

    /**
     * @brief Move to `canceled`.
     * @return `true` for the call that performed the transition.
     */
    bool cancel() noexcept {
        auto expected = downstream_status::open;
        return status_.compare_exchange_strong(expected,
                                               downstream_status::canceled,
                                               std::memory_order_acq_rel,
                                               std::memory_order_acquire);
    }

private:
    std::atomic<downstream_status> status_{downstream_status::open};
};

} // namespace streambridge
