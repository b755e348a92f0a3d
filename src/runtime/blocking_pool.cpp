#include "streambridge/runtime/blocking_pool.hpp"

#include <algorithm>
#include <exception>
#include <spdlog/spdlog.h>
#include <utility>

namespace streambridge::runtime {

blocking_pool::blocking_pool(std::size_t worker_count, std::string name)
    : name_(std::move(name)) {
    worker_count = std::max<std::size_t>(worker_count, 1);
    workers_.reserve(worker_count);
    for (std::size_t i = 0; i < worker_count; ++i) {
        workers_.emplace_back([this, i]() { run_worker(i); });
    }
}

blocking_pool::~blocking_pool() {
    shutdown();
}

result<void> blocking_pool::submit(std::move_only_function<void()> job) {
    if (!job) {
        return err<void>(make_error_from_errno(EINVAL));
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stop_) {
            return err<void>(errc::executor_closed);
        }
        jobs_.push_back(std::move(job));
    }
    cv_.notify_one();
    return ok();
}

void blocking_pool::shutdown() noexcept {
    std::deque<std::move_only_function<void()>> dropped;
    std::vector<std::thread> joining;
    bool from_worker = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stop_ = true;
        dropped.swap(jobs_);
        from_worker = std::any_of(
            workers_.begin(), workers_.end(), [](const std::thread& worker) {
                return worker.get_id() == std::this_thread::get_id();
            });
        // A worker cannot join itself; the owner's next shutdown (or the
        // destructor) joins every worker instead.
        if (!from_worker) {
            joining.swap(workers_);
        }
    }
    cv_.notify_all();

    if (!dropped.empty()) {
        spdlog::debug("[{}] dropping {} queued jobs", name_, dropped.size());
    }
    if (from_worker) {
        spdlog::debug("[{}] shutdown requested from a worker", name_);
    }

    for (auto& worker : joining) {
        worker.join();
    }
}

std::size_t blocking_pool::worker_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return workers_.size();
}

std::size_t blocking_pool::pending_jobs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

void blocking_pool::run_worker(std::size_t index) {
    spdlog::debug("[{}] worker {} started", name_, index);

    while (true) {
        std::move_only_function<void()> job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cv_.wait(lock, [this]() { return stop_ || !jobs_.empty(); });

            if (stop_) {
                break;
            }

            job = std::move(jobs_.front());
            jobs_.pop_front();
        }

        try {
            job();
        } catch (const std::exception& ex) {
            spdlog::error("[{}] job failed on worker {}: {}", name_, index,
                          ex.what());
        }
    }

    spdlog::debug("[{}] worker {} stopped", name_, index);
}

} // namespace streambridge::runtime
