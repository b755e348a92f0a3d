#pragma once

/**
 * @file
 * @brief Thread-safe handles for posting work into an event loop.
 */

#include "streambridge/core/result.hpp"

#include <functional>
#include <memory>

namespace streambridge::runtime {

namespace detail {
struct loop_inbox;
} // namespace detail

/**
 * @brief Keeps an event loop turning while held.
 *
 * `event_loop::run()` returns once no root task is alive and no guard is
 * held. Guards may be released from any thread.
 */
class work_guard {
public:
    /// Construct an empty guard.
    work_guard() noexcept = default;
    ~work_guard();

    work_guard(const work_guard&) = delete;
    work_guard& operator=(const work_guard&) = delete;
    work_guard(work_guard&& other) noexcept;
    work_guard& operator=(work_guard&& other) noexcept;

    /// @brief Release the guard early.
    void reset() noexcept;
    /// @return `true` while the guard holds the loop.
    [[nodiscard]] bool owns_work() const noexcept;

private:
    friend class loop_executor;
    explicit work_guard(std::shared_ptr<detail::loop_inbox> inbox) noexcept;

    std::shared_ptr<detail::loop_inbox> inbox_{};
};

/**
 * @brief Copyable posting handle into one event loop.
 *
 * Handles outlive the loop safely: once the loop is destroyed, `post()`
 * fails with `errc::executor_closed` and drops the callable.
 */
class loop_executor {
public:
    /// Construct a handle that rejects all work.
    loop_executor() noexcept = default;

    /**
     * @brief Run a callable on the loop thread during its next turn.
     * @param work Callable to run; destroyed unrun when rejected.
     */
    [[nodiscard]] result<void> post(std::move_only_function<void()> work) const;
    /// @return Guard that keeps the loop running until released.
    [[nodiscard]] work_guard make_work_guard() const noexcept;
    /// @return `true` when bound to a loop (which may since be closed).
    [[nodiscard]] bool valid() const noexcept;

private:
    friend class event_loop;
    explicit loop_executor(std::shared_ptr<detail::loop_inbox> inbox) noexcept;

    std::shared_ptr<detail::loop_inbox> inbox_{};
};

} // namespace streambridge::runtime
