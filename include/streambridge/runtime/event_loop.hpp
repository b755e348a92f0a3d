#pragma once

/**
 * @file
 * @brief Single-threaded cooperative scheduler driving the controller.
 */

#include "streambridge/runtime/executor.hpp"
#include "streambridge/runtime/task.hpp"

#include <atomic>
#include <coroutine>
#include <cstddef>
#include <deque>
#include <memory>
#include <optional>
#include <thread>
#include <vector>

namespace streambridge::runtime {

/**
 * @brief Coroutine scheduler that also runs callables posted from other
 * threads.
 *
 * Everything scheduled on the loop runs on the thread inside `run()`, one
 * item at a time. Other threads interact only through `loop_executor`,
 * `work_guard` and `stop()`.
 */
class event_loop final : public scheduler {
public:
    /// Construct and initialize loop resources.
    event_loop() noexcept;
    /// Reject further posts, drop pending callables and destroy root tasks.
    ~event_loop() override;

    event_loop(const event_loop&) = delete;
    event_loop& operator=(const event_loop&) = delete;
    event_loop(event_loop&&) = delete;
    event_loop& operator=(event_loop&&) = delete;

    /// @return `true` when initialization succeeded.
    [[nodiscard]] bool valid() const noexcept;
    /**
     * @brief Run until no root task is alive and no work guard is held, or
     * until `stop()` is requested.
     */
    [[nodiscard]] result<void> run() noexcept;
    /// @brief Request loop shutdown. Safe from any thread.
    void stop() noexcept;

    /**
     * @brief Spawn a root task tracked by this loop. Loop thread only (or
     * before `run()`).
     * @tparam T Task result type.
     * @param work Task object to transfer.
     */
    template <class T>
    void spawn(task<T>&& work) noexcept {
        auto handle = work.release();
        if (!handle) {
            return;
        }

        handle.promise().set_scheduler(this, true);
        ++active_task_count_;
        root_tasks_.push_back(handle);
        schedule(handle);
    }

    /// @brief Queue a coroutine for resume on the loop thread.
    void schedule(std::coroutine_handle<> handle) noexcept override;
    /// @brief Notify loop that a tracked root task has finished.
    void on_task_completed() noexcept override;

    /// @return Thread-safe posting handle bound to this loop.
    [[nodiscard]] loop_executor get_executor() const noexcept;
    /// @return `true` when called from inside `run()`.
    [[nodiscard]] bool running_in_this_thread() const noexcept;

private:
    [[nodiscard]] bool drain_inbox();
    [[nodiscard]] bool has_pending_work() const noexcept;
    void cleanup_completed_roots() noexcept;
    void destroy_all_roots() noexcept;

    std::shared_ptr<detail::loop_inbox> inbox_{};
    std::optional<error> init_error_{};

    std::deque<std::coroutine_handle<>> ready_queue_{};
    std::vector<std::coroutine_handle<>> root_tasks_{};
    std::size_t active_task_count_{0};
    std::atomic_bool stop_requested_{false};
    std::atomic<std::thread::id> loop_thread_{};
};

} // namespace streambridge::runtime
