#pragma once

/**
 * @file
 * @brief Coroutine task type and scheduler interface used by the event loop.
 */

#include <concepts>
#include <coroutine>
#include <exception>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace streambridge::runtime {

/**
 * @brief Scheduling interface implemented by the event loop.
 *
 * Both members are only called from the loop thread.
 */
class scheduler {
public:
    virtual ~scheduler() = default;

    /// @brief Queue a coroutine for execution/resume.
    virtual void schedule(std::coroutine_handle<> handle) noexcept = 0;
    /// @brief Notify scheduler when a tracked root task reaches final suspend.
    virtual void on_task_completed() noexcept = 0;
};

template <class T>
class task;

namespace detail {

class task_promise_base {
public:
    [[nodiscard]] scheduler *scheduler_ptr() const noexcept {
        return scheduler_;
    }

    void set_scheduler(scheduler *value, bool tracked) noexcept {
        scheduler_ = value;
        tracked_ = tracked;
    }

    void set_continuation(std::coroutine_handle<> continuation) noexcept {
        continuation_ = continuation;
    }

    [[nodiscard]] std::coroutine_handle<> continuation() const noexcept {
        return continuation_;
    }

    [[nodiscard]] bool tracked() const noexcept {
        return tracked_;
    }

    [[nodiscard]] std::suspend_always initial_suspend() const noexcept {
        return {};
    }

    /// @brief Store the active exception for later rethrow.
    void unhandled_exception() noexcept {
        exception_ = std::current_exception();
    }

protected:
    void rethrow_if_failed() const {
        if (exception_ != nullptr) {
            std::rethrow_exception(exception_);
        }
    }

private:
    scheduler *scheduler_{nullptr};
    std::coroutine_handle<> continuation_{};
    std::exception_ptr exception_{};
    bool tracked_{false};
};

struct task_final_awaiter {
    [[nodiscard]] bool await_ready() const noexcept {
        return false;
    }

    template <class Promise>
    void await_suspend(std::coroutine_handle<Promise> handle) noexcept {
        auto& promise = handle.promise();
        auto *scheduler = promise.scheduler_ptr();

        if (promise.tracked() && scheduler != nullptr) {
            scheduler->on_task_completed();
        }

        const auto continuation = promise.continuation();
        if (!continuation) {
            return;
        }

        if (scheduler != nullptr) {
            scheduler->schedule(continuation);
            return;
        }

        continuation.resume();
    }

    void await_resume() const noexcept {}
};

template <class T>
class task_promise : public task_promise_base {
public:
    [[nodiscard]] task<T> get_return_object() noexcept {
        return task<T>{
            std::coroutine_handle<task_promise>::from_promise(*this)};
    }

    [[nodiscard]] task_final_awaiter final_suspend() const noexcept {
        return {};
    }

    template <class U>
        requires std::convertible_to<U, T>
    void return_value(U&& value) noexcept(
        std::is_nothrow_constructible_v<T, U&&>) {
        value_.emplace(std::forward<U>(value));
    }

    /// @brief Consume and move the coroutine result.
    [[nodiscard]] T consume_result() {
        rethrow_if_failed();
        if (!value_.has_value()) {
            throw std::logic_error("task result is not available");
        }
        return std::move(*value_);
    }

private:
    std::optional<T> value_{};
};

template <>
class task_promise<void> : public task_promise_base {
public:
    [[nodiscard]] task<void> get_return_object() noexcept;

    [[nodiscard]] task_final_awaiter final_suspend() const noexcept {
        return {};
    }

    void return_void() const noexcept {}

    void consume_result() {
        rethrow_if_failed();
    }
};

} // namespace detail

/**
 * @brief Lazily started coroutine owning its frame.
 *
 * A task starts when spawned on an event loop or when awaited from another
 * task, and inherits the awaiting task's scheduler.
 * @tparam T Result type (`void` allowed).
 */
template <class T>
class task {
public:
    using promise_type = detail::task_promise<T>;
    using handle_type = std::coroutine_handle<promise_type>;

    task() noexcept = default;
    explicit task(handle_type handle) noexcept : handle_(handle) {}

    task(const task&) = delete;
    task& operator=(const task&) = delete;

    task(task&& other) noexcept : handle_(std::exchange(other.handle_, {})) {}

    task& operator=(task&& other) noexcept {
        if (this != &other) {
            reset();
            handle_ = std::exchange(other.handle_, {});
        }
        return *this;
    }

    ~task() {
        reset();
    }

    /// @return `true` when a coroutine handle is owned.
    [[nodiscard]] bool valid() const noexcept {
        return static_cast<bool>(handle_);
    }

    /// @return `true` when task has completed or is empty.
    [[nodiscard]] bool done() const noexcept {
        return !handle_ || handle_.done();
    }

    /// @brief Release the coroutine handle to caller ownership.
    [[nodiscard]] handle_type release() noexcept {
        return std::exchange(handle_, {});
    }

    struct awaiter {
        handle_type handle_{};

        [[nodiscard]] bool await_ready() const noexcept {
            return !handle_ || handle_.done();
        }

        template <class Promise>
        bool await_suspend(std::coroutine_handle<Promise> awaiting) noexcept {
            auto& child = handle_.promise();
            child.set_continuation(awaiting);

            if constexpr (requires(Promise& p) { p.scheduler_ptr(); }) {
                if (child.scheduler_ptr() == nullptr) {
                    child.set_scheduler(awaiting.promise().scheduler_ptr(),
                                        false);
                }
            }

            auto *scheduler = child.scheduler_ptr();
            if (scheduler != nullptr) {
                scheduler->schedule(handle_);
                return true;
            }

            handle_.resume();
            return false;
        }

        /// @brief Return child result or rethrow child exception.
        T await_resume() {
            if (!handle_) {
                throw std::logic_error("awaited task has no coroutine handle");
            }

            struct frame_release {
                handle_type& handle;
                ~frame_release() {
                    handle.destroy();
                    handle = {};
                }
            } release{handle_};
            return handle_.promise().consume_result();
        }

        ~awaiter() {
            if (handle_) {
                handle_.destroy();
            }
        }
    };

    /// @brief Await this task, transferring ownership to awaiter.
    [[nodiscard]] awaiter operator co_await() && noexcept {
        return awaiter{std::exchange(handle_, {})};
    }

private:
    void reset() noexcept {
        if (handle_) {
            handle_.destroy();
            handle_ = {};
        }
    }

    handle_type handle_{};
};

namespace detail {

inline task<void> task_promise<void>::get_return_object() noexcept {
    return task<void>{
        std::coroutine_handle<task_promise>::from_promise(*this)};
}

} // namespace detail

} // namespace streambridge::runtime
