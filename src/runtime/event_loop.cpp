#include "streambridge/runtime/event_loop.hpp"

#include "loop_inbox.hpp"

#include <cerrno>
#include <functional>
#include <mutex>
#include <new>
#include <spdlog/spdlog.h>
#include <utility>

namespace streambridge::runtime {

event_loop::event_loop() noexcept {
    root_tasks_.reserve(16);

    auto signal_result = wake_signal::create();
    if (!signal_result.has_value()) {
        init_error_ = signal_result.error();
        return;
    }

    try {
        inbox_ = std::make_shared<detail::loop_inbox>(
            std::move(signal_result.value()));
    } catch (const std::bad_alloc&) {
        init_error_ = make_error_from_errno(ENOMEM);
    }
}

event_loop::~event_loop() {
    if (inbox_ != nullptr) {
        std::deque<std::move_only_function<void()>> dropped;
        {
            std::lock_guard<std::mutex> lock(inbox_->mutex);
            inbox_->closed = true;
            dropped.swap(inbox_->callbacks);
        }
        if (!dropped.empty()) {
            spdlog::debug("event loop closed with {} unprocessed callbacks",
                          dropped.size());
        }
    }
    destroy_all_roots();
}

bool event_loop::valid() const noexcept {
    return !init_error_.has_value() && inbox_ != nullptr &&
           inbox_->signal.valid();
}

result<void> event_loop::run() noexcept {
    if (!valid()) {
        return err<void>(init_error_.value_or(make_error_from_errno(EINVAL)));
    }

    loop_thread_.store(std::this_thread::get_id(), std::memory_order_release);
    struct thread_marker {
        std::atomic<std::thread::id>& id;
        ~thread_marker() {
            id.store(std::thread::id{}, std::memory_order_release);
        }
    } marker{loop_thread_};

    result<void> status = ok();
    while (!stop_requested_.load(std::memory_order_acquire)) {
        bool ran_callbacks = false;
        try {
            ran_callbacks = drain_inbox();
        } catch (const std::exception& ex) {
            spdlog::error("event loop callback failed: {}", ex.what());
            status = err<void>(make_error_from_errno(EPROTO));
            break;
        }

        while (!ready_queue_.empty() &&
               !stop_requested_.load(std::memory_order_acquire)) {
            const auto handle = ready_queue_.front();
            ready_queue_.pop_front();

            if (!handle || handle.done()) {
                continue;
            }

            handle.resume();
            cleanup_completed_roots();
        }

        if (stop_requested_.load(std::memory_order_acquire)) {
            break;
        }
        if (ran_callbacks || !ready_queue_.empty()) {
            continue;
        }

        if (!has_pending_work()) {
            break;
        }

        const auto wait_result = inbox_->signal.wait(std::nullopt);
        if (!wait_result.has_value()) {
            status = err<void>(wait_result.error());
            break;
        }
    }

    stop_requested_.store(false, std::memory_order_release);
    cleanup_completed_roots();
    return status;
}

void event_loop::stop() noexcept {
    stop_requested_.store(true, std::memory_order_release);
    if (inbox_ != nullptr) {
        inbox_->signal.notify();
    }
}

void event_loop::schedule(std::coroutine_handle<> handle) noexcept {
    if (!handle) {
        return;
    }
    ready_queue_.push_back(handle);
}

void event_loop::on_task_completed() noexcept {
    if (active_task_count_ > 0) {
        --active_task_count_;
    }
}

loop_executor event_loop::get_executor() const noexcept {
    return loop_executor{inbox_};
}

bool event_loop::running_in_this_thread() const noexcept {
    return loop_thread_.load(std::memory_order_acquire) ==
           std::this_thread::get_id();
}

bool event_loop::drain_inbox() {
    // Reset the counter before taking the batch so a post racing with this
    // drain leaves the signal raised for the next wait.
    inbox_->signal.drain();

    std::deque<std::move_only_function<void()>> batch;
    {
        std::lock_guard<std::mutex> lock(inbox_->mutex);
        batch.swap(inbox_->callbacks);
    }

    for (auto& callback : batch) {
        callback();
    }
    return !batch.empty();
}

bool event_loop::has_pending_work() const noexcept {
    return active_task_count_ > 0 ||
           inbox_->work_count.load(std::memory_order_acquire) > 0;
}

void event_loop::cleanup_completed_roots() noexcept {
    for (auto it = root_tasks_.begin(); it != root_tasks_.end();) {
        if (it->done()) {
            it->destroy();
            it = root_tasks_.erase(it);
        } else {
            ++it;
        }
    }
}

void event_loop::destroy_all_roots() noexcept {
    for (auto handle : root_tasks_) {
        if (handle) {
            handle.destroy();
        }
    }
    root_tasks_.clear();
    active_task_count_ = 0;
}

} // namespace streambridge::runtime
