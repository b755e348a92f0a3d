#include "streambridge/bridge/chunk_reader.hpp"

#include <utility>

namespace streambridge {

chunk_reader::chunk_reader(std::shared_ptr<stage_controller> stage,
                           runtime::scheduler& scheduler)
    : stage_(std::move(stage)), scheduler_(scheduler) {
    stage_->attach(*this);
}

chunk_reader::~chunk_reader() {
    if (!finished_) {
        stage_->on_cancel();
    }
    stage_->detach();
}

bool chunk_reader::next_awaiter::await_suspend(
    std::coroutine_handle<> awaiting) {
    // A terminated stage answers the pull synchronously, so the handle is
    // only published once the pull is known to be outstanding.
    reader_.stage_->on_pull();
    if (reader_.settled()) {
        return false;
    }
    reader_.waiter_ = awaiting;
    return true;
}

result<std::optional<chunk>> chunk_reader::next_awaiter::await_resume() {
    if (reader_.ready_.has_value()) {
        auto value = std::move(*reader_.ready_);
        reader_.ready_.reset();
        return std::optional<chunk>{std::move(value)};
    }
    if (reader_.failure_.has_value()) {
        return err<std::optional<chunk>>(*reader_.failure_);
    }
    return std::optional<chunk>{};
}

chunk_reader::next_awaiter chunk_reader::next() noexcept {
    return next_awaiter{*this};
}

void chunk_reader::cancel() {
    if (finished_) {
        return;
    }
    finished_ = true;
    stage_->on_cancel();
    wake();
}

bool chunk_reader::finished() const noexcept {
    return finished_;
}

void chunk_reader::on_next(chunk value) {
    ready_.emplace(std::move(value));
    wake();
}

void chunk_reader::on_complete() {
    finished_ = true;
    wake();
}

void chunk_reader::on_error(error failure) {
    failure_ = failure;
    finished_ = true;
    wake();
}

bool chunk_reader::settled() const noexcept {
    return ready_.has_value() || finished_;
}

void chunk_reader::wake() noexcept {
    if (auto waiter = std::exchange(waiter_, {})) {
        scheduler_.schedule(waiter);
    }
}

} // namespace streambridge
