#include "streambridge/runtime/executor.hpp"

#include "loop_inbox.hpp"

#include <utility>

namespace streambridge::runtime {

work_guard::work_guard(std::shared_ptr<detail::loop_inbox> inbox) noexcept
    : inbox_(std::move(inbox)) {
    if (inbox_ != nullptr) {
        inbox_->work_count.fetch_add(1, std::memory_order_acq_rel);
    }
}

work_guard::~work_guard() {
    reset();
}

work_guard::work_guard(work_guard&& other) noexcept
    : inbox_(std::exchange(other.inbox_, {})) {}

work_guard& work_guard::operator=(work_guard&& other) noexcept {
    if (this != &other) {
        reset();
        inbox_ = std::exchange(other.inbox_, {});
    }
    return *this;
}

void work_guard::reset() noexcept {
    auto inbox = std::exchange(inbox_, {});
    if (inbox == nullptr) {
        return;
    }

    // The loop re-evaluates its exit condition on every wake-up.
    inbox->work_count.fetch_sub(1, std::memory_order_acq_rel);
    inbox->signal.notify();
}

bool work_guard::owns_work() const noexcept {
    return inbox_ != nullptr;
}

loop_executor::loop_executor(std::shared_ptr<detail::loop_inbox> inbox) noexcept
    : inbox_(std::move(inbox)) {}

result<void> loop_executor::post(std::move_only_function<void()> work) const {
    if (inbox_ == nullptr || !work) {
        return err<void>(errc::executor_closed);
    }

    {
        std::lock_guard<std::mutex> lock(inbox_->mutex);
        if (inbox_->closed) {
            return err<void>(errc::executor_closed);
        }
        inbox_->callbacks.push_back(std::move(work));
    }
    inbox_->signal.notify();
    return ok();
}

work_guard loop_executor::make_work_guard() const noexcept {
    return work_guard{inbox_};
}

bool loop_executor::valid() const noexcept {
    return inbox_ != nullptr;
}

} // namespace streambridge::runtime
