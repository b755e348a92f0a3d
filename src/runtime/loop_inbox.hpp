#pragma once

#include "streambridge/runtime/wake_signal.hpp"

#include <atomic>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>

namespace streambridge::runtime::detail {

/// Cross-thread state shared by an event loop and its executors.
struct loop_inbox {
    explicit loop_inbox(wake_signal wake) noexcept : signal(std::move(wake)) {}

    std::mutex mutex{};
    std::deque<std::move_only_function<void()>> callbacks{};
    bool closed{false};
    std::atomic<std::size_t> work_count{0};
    wake_signal signal;
};

} // namespace streambridge::runtime::detail
