#pragma once

/**
 * @file
 * @brief Blocking, stream-style writer half of the bridge.
 */

#include "streambridge/bridge/control_channel.hpp"
#include "streambridge/bridge/handoff_queue.hpp"
#include "streambridge/bridge/lifecycle_guard.hpp"
#include "streambridge/core/result.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>

namespace streambridge {

/**
 * @brief Output-stream facade used by one blocking producer thread.
 *
 * Writes copy the caller's bytes into a chunk and block while the handoff
 * queue is full. `flush()` and `close()` rendezvous with the stage
 * controller and wait at most the configured timeout. The writer is not
 * thread-safe; use it from one thread at a time, and never from the loop
 * thread (flush/close would wait on the loop it blocks).
 */
class blocking_writer {
public:
    blocking_writer(std::string name, std::shared_ptr<handoff_queue> queue,
                    std::shared_ptr<lifecycle_guard> guard,
                    control_channel channel,
                    std::chrono::milliseconds timeout) noexcept;
    /// Close the stream if still open; failures are logged.
    ~blocking_writer();

    blocking_writer(const blocking_writer&) = delete;
    blocking_writer& operator=(const blocking_writer&) = delete;
    blocking_writer(blocking_writer&& other) noexcept;
    blocking_writer& operator=(blocking_writer&&) = delete;

    /**
     * @brief Enqueue a copy of `bytes`, blocking while the queue is full.
     * @return `errc::stream_closed` after close, `errc::stream_terminated`
     * once downstream is gone, `errc::enqueue_failed` for other put failures.
     */
    [[nodiscard]] result<void> write(std::span<const std::byte> bytes);
    /**
     * @brief Enqueue `length` bytes starting at `offset`.
     * @return `EINVAL` when the range does not fit the buffer; otherwise as
     * `write(bytes)`.
     */
    [[nodiscard]] result<void> write(std::span<const std::byte> bytes,
                                     std::size_t offset, std::size_t length);
    /// @brief Enqueue a single byte.
    [[nodiscard]] result<void> write(std::byte value);

    /**
     * @brief Wait until every chunk written so far has been delivered.
     * @return `errc::timed_out` when the stage does not answer in time,
     * `errc::stream_terminated` when downstream canceled.
     */
    [[nodiscard]] result<void> flush();
    /**
     * @brief Drain, complete downstream and close the stream.
     *
     * The stream counts as closed afterwards even when the wait timed out.
     * Downstream cancellation is not an error. Closing twice is a no-op.
     */
    [[nodiscard]] result<void> close();

    [[nodiscard]] bool is_open() const noexcept;
    /// @return `false` once a call observed downstream cancellation.
    [[nodiscard]] bool is_downstream_alive() const noexcept;

private:
    [[nodiscard]] result<void> check_writable() const;
    [[nodiscard]] result<void> mark_terminated();
    [[nodiscard]] result<downstream_status> await_control(control_kind kind);

    std::string name_;
    std::shared_ptr<handoff_queue> queue_;
    std::shared_ptr<lifecycle_guard> guard_;
    control_channel channel_;
    std::chrono::milliseconds timeout_;
    std::uint64_t enqueued_{0};
    bool open_{true};
    bool downstream_alive_{true};
};

} // namespace streambridge
