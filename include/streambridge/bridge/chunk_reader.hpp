#pragma once

/**
 * @file
 * @brief Coroutine-friendly consumer for a stage controller.
 */

#include "streambridge/bridge/stage_controller.hpp"
#include "streambridge/core/chunk.hpp"
#include "streambridge/core/result.hpp"
#include "streambridge/runtime/task.hpp"

#include <coroutine>
#include <memory>
#include <optional>

namespace streambridge {

/**
 * @brief Pulls chunks one at a time from a `stage_controller`.
 *
 * Lives on the loop thread. `co_await reader.next()` yields the next chunk,
 * `std::nullopt` at end of stream, or the stage's failure. Destroying a
 * reader that has not reached the end cancels the stage.
 */
class chunk_reader final : public chunk_sink {
public:
    chunk_reader(std::shared_ptr<stage_controller> stage,
                 runtime::scheduler& scheduler);
    ~chunk_reader() override;

    chunk_reader(const chunk_reader&) = delete;
    chunk_reader& operator=(const chunk_reader&) = delete;
    chunk_reader(chunk_reader&&) = delete;
    chunk_reader& operator=(chunk_reader&&) = delete;

    class next_awaiter {
    public:
        explicit next_awaiter(chunk_reader& reader) noexcept
            : reader_(reader) {}

        [[nodiscard]] bool await_ready() const noexcept {
            return reader_.settled();
        }
        bool await_suspend(std::coroutine_handle<> awaiting);
        [[nodiscard]] result<std::optional<chunk>> await_resume();

    private:
        chunk_reader& reader_;
    };

    /// @brief Request the next chunk.
    [[nodiscard]] next_awaiter next() noexcept;
    /// @brief Cancel downstream; a suspended `next()` resumes with end of
    /// stream.
    void cancel();
    /// @return `true` after end of stream, failure or `cancel()`.
    [[nodiscard]] bool finished() const noexcept;

    void on_next(chunk value) override;
    void on_complete() override;
    void on_error(error failure) override;

private:
    [[nodiscard]] bool settled() const noexcept;
    void wake() noexcept;

    std::shared_ptr<stage_controller> stage_;
    runtime::scheduler& scheduler_;
    std::optional<chunk> ready_{};
    std::optional<error> failure_{};
    bool finished_{false};
    std::coroutine_handle<> waiter_{};
};

} // namespace streambridge
