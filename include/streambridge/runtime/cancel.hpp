#pragma once

/**
 * @file
 * @brief Cancellation primitives for blocking and async waits.
 */

#include <atomic>
#include <memory>

namespace streambridge::runtime {

/**
 * @brief Read-only cancellation token shared with a waiting operation.
 *
 * Tokens only carry the flag. Code that parks a thread on a condition
 * variable must also be woken by its owner (see `handoff_queue::interrupt`).
 */
class cancel_token {
public:
    /// Construct a token that never cancels.
    cancel_token() = default;

    /// @return `true` when associated source has requested cancellation.
    [[nodiscard]] bool stop_requested() const noexcept {
        return state_ != nullptr && state_->load(std::memory_order_acquire);
    }

    /// @return `false` for default-constructed tokens.
    [[nodiscard]] bool stop_possible() const noexcept {
        return state_ != nullptr;
    }

private:
    friend class cancel_source;
    explicit cancel_token(std::shared_ptr<std::atomic<bool>> state)
        : state_(std::move(state)) {}

    std::shared_ptr<std::atomic<bool>> state_{};
};

/**
 * @brief Cancellation source that can signal one or more tokens.
 */
class cancel_source {
public:
    /// Construct an active source.
    cancel_source() : state_(std::make_shared<std::atomic<bool>>(false)) {}

    /// @return Token bound to this source.
    [[nodiscard]] cancel_token token() const {
        return cancel_token{state_};
    }

    /**
     * @brief Request cancellation for all tokens derived from this source.
     * @return `true` for the call that performed the transition.
     */
    bool request_stop() const noexcept {
        return !state_->exchange(true, std::memory_order_acq_rel);
    }

    /// @return `true` once `request_stop()` has been called.
    [[nodiscard]] bool stop_requested() const noexcept {
        return state_->load(std::memory_order_acquire);
    }

private:
    std::shared_ptr<std::atomic<bool>> state_{};
};

} // namespace streambridge::runtime
