#pragma once

/**
 * @file
 * @brief Bounded blocking queue handing chunks from the writer thread to the
 * controller's dequeue worker.
 */

#include "streambridge/core/chunk.hpp"
#include "streambridge/core/result.hpp"
#include "streambridge/runtime/cancel.hpp"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>

namespace streambridge {

/**
 * @brief Thread-safe bounded FIFO of chunks with blocking put/take.
 *
 * Capacity is the only backpressure mechanism: `put` parks the writer while
 * the queue is full. Shutdown goes through `poison()`, after which `put`
 * fails immediately and `take` never blocks.
 */
class handoff_queue {
public:
    /**
     * @brief Create a queue shared between writer and controller.
     * @param capacity Maximum number of buffered chunks; must be positive.
     * @return `errc::invalid_configuration` for a zero capacity.
     */
    [[nodiscard]] static result<std::shared_ptr<handoff_queue>>
    create(std::size_t capacity);

    handoff_queue(const handoff_queue&) = delete;
    handoff_queue& operator=(const handoff_queue&) = delete;

    /**
     * @brief Append a chunk, blocking while the queue is full.
     * @return `errc::queue_poisoned` if the queue is (or becomes) poisoned
     * before space frees up; the chunk is then discarded.
     */
    [[nodiscard]] result<void> put(chunk value);
    /**
     * @brief Remove the oldest chunk, blocking while the queue is empty.
     * @param token Cancels the wait; the canceling side must also call
     * `interrupt()` to wake a parked thread.
     * @return The chunk, the empty poison chunk after `poison()`, or
     * `errc::wait_canceled`.
     */
    [[nodiscard]] result<chunk> take(const runtime::cancel_token& token = {});

    /// @brief Discard all buffered chunks and wake blocked writers.
    void clear() noexcept;
    /// @brief Clear, then make every current and future wait return.
    void poison() noexcept;
    /// @brief Wake parked takers so they re-check their tokens.
    void interrupt() noexcept;

    /// @return Snapshot of whether the queue holds no chunk.
    [[nodiscard]] bool empty() const noexcept;
    /// @return Snapshot of the buffered chunk count.
    [[nodiscard]] std::size_t size() const noexcept;
    /// @return Capacity fixed at creation.
    [[nodiscard]] std::size_t capacity() const noexcept;
    /// @return `true` after `poison()`.
    [[nodiscard]] bool poisoned() const noexcept;

private:
    explicit handoff_queue(std::size_t capacity) noexcept;

    const std::size_t capacity_;
    mutable std::mutex mutex_{};
    std::condition_variable not_empty_{};
    std::condition_variable not_full_{};
    std::deque<chunk> items_{};
    bool poisoned_{false};
};

} // namespace streambridge
