#include "streambridge/core/error.hpp"

namespace streambridge {

namespace {

class bridge_error_category final : public std::error_category {
public:
    [[nodiscard]] const char *name() const noexcept override {
        return "streambridge";
    }

    [[nodiscard]] std::string message(int value) const override {
        switch (static_cast<errc>(value)) {
        case errc::invalid_configuration:
            return "invalid configuration";
        case errc::stream_closed:
            return "output stream is closed";
        case errc::stream_terminated:
            return "stream is terminated, no writes are possible";
        case errc::timed_out:
            return "control request timed out";
        case errc::enqueue_failed:
            return "failed to enqueue chunk";
        case errc::queue_poisoned:
            return "handoff queue is poisoned";
        case errc::wait_canceled:
            return "blocking wait was canceled";
        case errc::executor_closed:
            return "executor no longer accepts work";
        }
        return "unknown streambridge error";
    }
};

} // namespace

const std::error_category& bridge_category() noexcept {
    static const bridge_error_category category;
    return category;
}

std::error_code make_error_code(errc value) noexcept {
    return std::error_code{static_cast<int>(value), bridge_category()};
}

error::error(std::error_code code) noexcept : code_(code) {}

error::error(errc value) noexcept : code_(make_error_code(value)) {}

error error::from_errno(int value) noexcept {
    return error{std::error_code{value, std::system_category()}};
}

std::error_code error::code() const noexcept {
    return code_;
}

int error::value() const noexcept {
    return code_.value();
}

std::string error::message() const {
    return code_.message();
}

bool error::is(errc value) const noexcept {
    return code_ == make_error_code(value);
}

error make_error_from_errno(int value) noexcept {
    return error::from_errno(value);
}

error make_error(errc value) noexcept {
    return error{value};
}

} // namespace streambridge
