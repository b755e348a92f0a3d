#include "streambridge/bridge/blocking_writer.hpp"

#include <cerrno>
#include <future>
#include <spdlog/spdlog.h>
#include <utility>

namespace streambridge {

blocking_writer::blocking_writer(std::string name,
                                 std::shared_ptr<handoff_queue> queue,
                                 std::shared_ptr<lifecycle_guard> guard,
                                 control_channel channel,
                                 std::chrono::milliseconds timeout) noexcept
    : name_(std::move(name)),
      queue_(std::move(queue)),
      guard_(std::move(guard)),
      channel_(std::move(channel)),
      timeout_(timeout) {}

blocking_writer::~blocking_writer() {
    if (queue_ == nullptr || !open_) {
        return;
    }
    const auto closed = close();
    if (!closed.has_value()) {
        spdlog::warn("[{}] implicit close failed: {}", name_,
                     closed.error().message());
    }
}

blocking_writer::blocking_writer(blocking_writer&& other) noexcept
    : name_(std::move(other.name_)),
      queue_(std::move(other.queue_)),
      guard_(std::move(other.guard_)),
      channel_(std::move(other.channel_)),
      timeout_(other.timeout_),
      enqueued_(other.enqueued_),
      open_(std::exchange(other.open_, false)),
      downstream_alive_(other.downstream_alive_) {}

result<void> blocking_writer::write(std::span<const std::byte> bytes) {
    if (auto writable = check_writable(); !writable.has_value()) {
        return writable;
    }
    if (bytes.empty()) {
        return ok();
    }

    auto put = queue_->put(chunk::copy_of(bytes));
    if (!put.has_value()) {
        if (guard_->is_canceled()) {
            return mark_terminated();
        }
        spdlog::debug("[{}] enqueue failed: {}", name_, put.error().message());
        return err<void>(errc::enqueue_failed);
    }
    ++enqueued_;

    // Downstream may have gone away while we were parked in put.
    if (guard_->is_canceled()) {
        return mark_terminated();
    }
    return ok();
}

result<void> blocking_writer::write(std::span<const std::byte> bytes,
                                    std::size_t offset, std::size_t length) {
    if (offset > bytes.size() || length > bytes.size() - offset) {
        return err<void>(make_error_from_errno(EINVAL));
    }
    return write(bytes.subspan(offset, length));
}

result<void> blocking_writer::write(std::byte value) {
    return write(std::span<const std::byte>(&value, 1));
}

result<void> blocking_writer::flush() {
    if (!open_) {
        return err<void>(errc::stream_closed);
    }
    if (guard_->is_canceled()) {
        return mark_terminated();
    }

    auto status = await_control(control_kind::flush);
    if (!status.has_value()) {
        return err<void>(status.error());
    }
    if (*status == downstream_status::canceled) {
        return mark_terminated();
    }
    return ok();
}

result<void> blocking_writer::close() {
    if (!open_) {
        return ok();
    }
    // A canceled guard means the stage has already terminated.
    if (guard_->is_canceled()) {
        open_ = false;
        downstream_alive_ = false;
        spdlog::debug("[{}] writer closed after downstream cancel", name_);
        return ok();
    }

    auto status = await_control(control_kind::close);
    open_ = false;
    if (!status.has_value()) {
        return err<void>(status.error());
    }
    if (*status == downstream_status::canceled) {
        downstream_alive_ = false;
    }
    spdlog::debug("[{}] writer closed after {} chunks", name_, enqueued_);
    return ok();
}

bool blocking_writer::is_open() const noexcept {
    return open_;
}

bool blocking_writer::is_downstream_alive() const noexcept {
    return downstream_alive_;
}

result<void> blocking_writer::check_writable() const {
    if (!open_ || queue_ == nullptr) {
        return err<void>(errc::stream_closed);
    }
    if (!downstream_alive_) {
        return err<void>(errc::stream_terminated);
    }
    return ok();
}

result<void> blocking_writer::mark_terminated() {
    downstream_alive_ = false;
    return err<void>(errc::stream_terminated);
}

result<downstream_status> blocking_writer::await_control(control_kind kind) {
    auto future = channel_.send(kind, enqueued_);
    if (future.wait_for(timeout_) != std::future_status::ready) {
        spdlog::debug("[{}] {} timed out after {} ms", name_, to_string(kind),
                      timeout_.count());
        return err<downstream_status>(errc::timed_out);
    }
    return future.get();
}

} // namespace streambridge
