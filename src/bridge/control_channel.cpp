#include "streambridge/bridge/control_channel.hpp"

#include <spdlog/spdlog.h>
#include <utility>

namespace streambridge {

std::string_view to_string(control_kind kind) noexcept {
    switch (kind) {
    case control_kind::flush:
        return "flush";
    case control_kind::close:
        return "close";
    }
    return "unknown";
}

control_completion::control_completion() = default;

control_completion::~control_completion() {
    settle(downstream_status::canceled);
}

control_completion::control_completion(control_completion&& other) noexcept
    : promise_(std::move(other.promise_)),
      armed_(std::exchange(other.armed_, false)) {}

control_completion&
control_completion::operator=(control_completion&& other) noexcept {
    if (this != &other) {
        settle(downstream_status::canceled);
        promise_ = std::move(other.promise_);
        armed_ = std::exchange(other.armed_, false);
    }
    return *this;
}

std::future<downstream_status> control_completion::get_future() {
    return promise_.get_future();
}

void control_completion::settle(downstream_status status) noexcept {
    if (!armed_) {
        return;
    }
    armed_ = false;
    promise_.set_value(status);
}

bool control_completion::pending() const noexcept {
    return armed_;
}

control_channel::control_channel(runtime::loop_executor executor,
                                 std::weak_ptr<control_handler> handler) noexcept
    : executor_(std::move(executor)), handler_(std::move(handler)) {}

std::future<downstream_status> control_channel::send(control_kind kind,
                                                     std::uint64_t enqueued) {
    control_request request{kind, enqueued, control_completion{}};
    auto future = request.completion.get_future();

    // A rejected post destroys the callable, which settles the request.
    const auto posted = executor_.post(
        [handler = handler_, request = std::move(request)]() mutable {
            if (auto target = handler.lock()) {
                target->on_control(std::move(request));
            }
        });
    if (!posted.has_value()) {
        spdlog::debug("{} request not delivered: {}", to_string(kind),
                      posted.error().message());
    }
    return future;
}

} // namespace streambridge
