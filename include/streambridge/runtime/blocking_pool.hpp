#pragma once

/**
 * @file
 * @brief Fixed-size worker pool for calls that may block indefinitely.
 */

#include "streambridge/core/result.hpp"

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace streambridge::runtime {

/**
 * @brief Runs blocking jobs off the event-loop thread.
 *
 * Jobs report back by posting to a `loop_executor`. Queued jobs that have
 * not started when the pool shuts down are dropped; running jobs are joined,
 * so callers must unblock them first (e.g. by poisoning the queue they wait
 * on).
 */
class blocking_pool {
public:
    /**
     * @brief Start the worker threads.
     * @param worker_count Number of threads, at least one.
     * @param name Tag used in log lines.
     */
    explicit blocking_pool(std::size_t worker_count = 1,
                           std::string name = "blocking-pool");
    /// Stop and join all workers.
    ~blocking_pool();

    blocking_pool(const blocking_pool&) = delete;
    blocking_pool& operator=(const blocking_pool&) = delete;
    blocking_pool(blocking_pool&&) = delete;
    blocking_pool& operator=(blocking_pool&&) = delete;

    /**
     * @brief Queue a job for the next idle worker.
     * @return `errc::executor_closed` once shutdown has started.
     */
    [[nodiscard]] result<void> submit(std::move_only_function<void()> job);
    /**
     * @brief Reject new jobs, drop queued ones and join the workers.
     *
     * Called from one of the pool's own jobs, it only stops the pool; the
     * workers are joined by a later call from another thread or by the
     * destructor, which must not run on a worker.
     */
    void shutdown() noexcept;

    /// @return Number of worker threads.
    [[nodiscard]] std::size_t worker_count() const;
    /// @return Jobs queued but not yet started.
    [[nodiscard]] std::size_t pending_jobs() const;

private:
    void run_worker(std::size_t index);

    std::string name_;
    mutable std::mutex mutex_{};
    std::condition_variable cv_{};
    std::deque<std::move_only_function<void()>> jobs_{};
    bool stop_{false};
    std::vector<std::thread> workers_{};
};

} // namespace streambridge::runtime
