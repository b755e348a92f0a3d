#include "streambridge/bridge/stage_controller.hpp"

#include <spdlog/spdlog.h>
#include <utility>

namespace streambridge {

stage_controller::stage_controller(std::string name,
                                   std::shared_ptr<handoff_queue> queue,
                                   std::shared_ptr<lifecycle_guard> guard,
                                   runtime::loop_executor executor,
                                   runtime::blocking_pool& pool)
    : name_(std::move(name)),
      queue_(std::move(queue)),
      guard_(std::move(guard)),
      executor_(std::move(executor)),
      pool_(pool),
      work_(executor_.make_work_guard()) {
    spdlog::debug("[{}] stage started (capacity {})", name_,
                  queue_->capacity());
}

stage_controller::~stage_controller() {
    shutdown();
}

void stage_controller::attach(chunk_sink& sink) noexcept {
    sink_ = &sink;
    sink_finished_ = false;
}

void stage_controller::detach() noexcept {
    sink_ = nullptr;
}

void stage_controller::on_pull() {
    if (state_ == state::terminated) {
        // Only the first pull after termination is answered.
        notify_complete();
        return;
    }
    if (in_flight_take_.has_value()) {
        return;
    }
    schedule_dequeue();
}

void stage_controller::on_cancel() {
    if (state_ == state::terminated) {
        return;
    }
    spdlog::debug("[{}] downstream canceled", name_);
    guard_->cancel();
    settle_pending();
    shutdown();
}

void stage_controller::on_control(control_request request) {
    if (state_ == state::terminated) {
        request.completion.settle(downstream_status::canceled);
        return;
    }

    auto& slot = request.kind == control_kind::flush ? pending_flush_
                                                     : pending_close_;
    if (slot.has_value()) {
        // The writer gave up on the previous request; its future is gone.
        spdlog::debug("[{}] stale {} request superseded", name_,
                      to_string(request.kind));
        slot->completion.settle(guard_->status());
    }
    slot.emplace(std::move(request));
    resolve_pending_if_drained();
}

stage_controller::state stage_controller::current_state() const noexcept {
    return state_;
}

bool stage_controller::dequeue_in_flight() const noexcept {
    return in_flight_take_.has_value();
}

const std::string& stage_controller::name() const noexcept {
    return name_;
}

void stage_controller::schedule_dequeue() {
    runtime::cancel_source source;
    auto submitted = pool_.submit(
        [queue = queue_, token = source.token(), executor = executor_,
         self = weak_from_this()]() mutable {
            auto taken = queue->take(token);
            const auto posted = executor.post(
                [self = std::move(self), taken = std::move(taken)]() mutable {
                    if (auto stage = self.lock()) {
                        stage->on_dequeued(std::move(taken));
                    }
                });
            if (!posted.has_value()) {
                spdlog::debug("dequeue result dropped: {}",
                              posted.error().message());
            }
        });
    if (!submitted.has_value()) {
        fail(submitted.error());
        return;
    }
    in_flight_take_.emplace(std::move(source));
}

void stage_controller::on_dequeued(result<chunk> taken) {
    in_flight_take_.reset();
    if (state_ == state::terminated) {
        return;
    }

    if (!taken.has_value()) {
        if (guard_->is_canceled()) {
            shutdown();
            return;
        }
        fail(taken.error());
        return;
    }

    if (taken->empty()) {
        // Poison reached a running stage: nothing more will arrive.
        complete();
        return;
    }

    if (guard_->status() == downstream_status::open) {
        ++delivered_;
        if (sink_ != nullptr) {
            sink_->on_next(std::move(*taken));
        }
    }
    // The sink may have canceled from inside on_next.
    resolve_pending_if_drained();
}

bool stage_controller::drained(std::uint64_t enqueued) const noexcept {
    return queue_->empty() && delivered_ >= enqueued;
}

void stage_controller::resolve_pending_if_drained() {
    if (state_ == state::terminated) {
        return;
    }

    const bool canceled = guard_->is_canceled();
    if (pending_flush_.has_value() &&
        (canceled || drained(pending_flush_->enqueued))) {
        auto request = std::move(*pending_flush_);
        pending_flush_.reset();
        spdlog::debug("[{}] flush resolved after {} chunks", name_,
                      delivered_);
        request.completion.settle(guard_->status());
    }

    if (pending_close_.has_value() &&
        (canceled || drained(pending_close_->enqueued))) {
        auto request = std::move(*pending_close_);
        pending_close_.reset();
        spdlog::debug("[{}] close resolved after {} chunks", name_,
                      delivered_);
        request.completion.settle(guard_->status());
        guard_->cancel();
        complete();
    }
}

void stage_controller::settle_pending() noexcept {
    const auto status = guard_->status();
    if (pending_flush_.has_value()) {
        pending_flush_->completion.settle(status);
        pending_flush_.reset();
    }
    if (pending_close_.has_value()) {
        pending_close_->completion.settle(status);
        pending_close_.reset();
    }
}

void stage_controller::complete() {
    shutdown();
    notify_complete();
}

void stage_controller::notify_complete() {
    if (sink_ == nullptr || sink_finished_) {
        return;
    }
    sink_finished_ = true;
    sink_->on_complete();
}

void stage_controller::fail(error failure) {
    spdlog::warn("[{}] stage failed: {}", name_, failure.message());
    shutdown();
    if (sink_ != nullptr && !sink_finished_) {
        sink_finished_ = true;
        sink_->on_error(failure);
    }
}

void stage_controller::shutdown() noexcept {
    if (state_ == state::terminated && !work_.owns_work()) {
        return;
    }
    state_ = state::terminated;
    guard_->cancel();

    // Poison first so a parked take wakes even if the token is never seen.
    queue_->poison();
    if (in_flight_take_.has_value()) {
        in_flight_take_->request_stop();
        queue_->interrupt();
    }

    settle_pending();
    work_.reset();
    spdlog::debug("[{}] stage terminated after {} chunks", name_, delivered_);
}

} // namespace streambridge
