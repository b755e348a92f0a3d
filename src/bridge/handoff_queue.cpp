#include "streambridge/bridge/handoff_queue.hpp"

#include <utility>

namespace streambridge {

handoff_queue::handoff_queue(std::size_t capacity) noexcept
    : capacity_(capacity) {}

result<std::shared_ptr<handoff_queue>>
handoff_queue::create(std::size_t capacity) {
    if (capacity == 0) {
        return err<std::shared_ptr<handoff_queue>>(errc::invalid_configuration);
    }
    return std::shared_ptr<handoff_queue>(new handoff_queue(capacity));
}

result<void> handoff_queue::put(chunk value) {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this]() {
            return poisoned_ || items_.size() < capacity_;
        });

        if (poisoned_) {
            return err<void>(errc::queue_poisoned);
        }
        items_.push_back(std::move(value));
    }
    not_empty_.notify_one();
    return ok();
}

result<chunk> handoff_queue::take(const runtime::cancel_token& token) {
    chunk value;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this, &token]() {
            return !items_.empty() || poisoned_ || token.stop_requested();
        });

        if (items_.empty()) {
            if (poisoned_) {
                return chunk{};
            }
            return err<chunk>(errc::wait_canceled);
        }

        value = std::move(items_.front());
        items_.pop_front();
    }
    not_full_.notify_one();
    return value;
}

void handoff_queue::clear() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        items_.clear();
    }
    not_full_.notify_all();
}

void handoff_queue::poison() noexcept {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        items_.clear();
        poisoned_ = true;
        items_.emplace_back();
    }
    not_empty_.notify_all();
    not_full_.notify_all();
}

void handoff_queue::interrupt() noexcept {
    // Taking the lock orders the token store before any waiter's predicate
    // check, so the notification cannot be lost.
    { std::lock_guard<std::mutex> lock(mutex_); }
    not_empty_.notify_all();
}

bool handoff_queue::empty() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.empty();
}

std::size_t handoff_queue::size() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return items_.size();
}

std::size_t handoff_queue::capacity() const noexcept {
    return capacity_;
}

bool handoff_queue::poisoned() const noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    return poisoned_;
}

} // namespace streambridge
