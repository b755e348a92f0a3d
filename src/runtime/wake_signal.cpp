#include "streambridge/runtime/wake_signal.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <limits>
#include <poll.h>
#include <sys/eventfd.h>
#include <unistd.h>
#include <utility>

namespace streambridge::runtime {

wake_signal::wake_signal(int fd) noexcept : fd_(fd) {}

wake_signal::~wake_signal() noexcept {
    if (valid()) {
        (void)::close(fd_);
    }
}

wake_signal::wake_signal(wake_signal&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)) {}

wake_signal& wake_signal::operator=(wake_signal&& other) noexcept {
    if (this != &other) {
        if (valid()) {
            (void)::close(fd_);
        }
        fd_ = std::exchange(other.fd_, -1);
    }
    return *this;
}

result<wake_signal> wake_signal::create() noexcept {
    const int fd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (fd < 0) {
        return err<wake_signal>(error::from_errno());
    }
    return wake_signal{fd};
}

void wake_signal::notify() noexcept {
    if (!valid()) {
        return;
    }

    // EAGAIN means the counter is saturated, which is still a pending wake-up.
    const std::uint64_t signal = 1;
    while (::write(fd_, &signal, sizeof(signal)) < 0 && errno == EINTR) {}
}

void wake_signal::drain() noexcept {
    if (!valid()) {
        return;
    }

    std::uint64_t signal = 0;
    while (::read(fd_, &signal, sizeof(signal)) < 0 && errno == EINTR) {}
}

result<bool>
wake_signal::wait(std::optional<std::chrono::milliseconds> timeout) noexcept {
    if (!valid()) {
        return err<bool>(make_error_from_errno(EBADF));
    }

    int timeout_ms = -1;
    if (timeout.has_value()) {
        const auto clamped = std::clamp<long long>(
            timeout->count(), 0,
            static_cast<long long>(std::numeric_limits<int>::max()));
        timeout_ms = static_cast<int>(clamped);
    }

    pollfd entry{};
    entry.fd = fd_;
    entry.events = POLLIN;

    while (true) {
        const int ready = ::poll(&entry, 1, timeout_ms);
        if (ready > 0) {
            return true;
        }
        if (ready == 0) {
            return false;
        }
        if (errno != EINTR) {
            return err<bool>(error::from_errno());
        }
    }
}

int wake_signal::native_handle() const noexcept {
    return fd_;
}

bool wake_signal::valid() const noexcept {
    return fd_ >= 0;
}

} // namespace streambridge::runtime
