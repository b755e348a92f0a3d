#pragma once

/**
 * @file
 * @brief Loop-side half of the bridge: pulls chunks off the handoff queue and
 * resolves writer control requests.
 */

#include "streambridge/bridge/control_channel.hpp"
#include "streambridge/bridge/handoff_queue.hpp"
#include "streambridge/bridge/lifecycle_guard.hpp"
#include "streambridge/core/chunk.hpp"
#include "streambridge/core/error.hpp"
#include "streambridge/core/result.hpp"
#include "streambridge/runtime/blocking_pool.hpp"
#include "streambridge/runtime/cancel.hpp"
#include "streambridge/runtime/executor.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace streambridge {

/**
 * @brief Downstream consumer of a stage.
 *
 * Callbacks run on the loop thread. `on_next` answers exactly one
 * `stage_controller::on_pull()`; `on_complete` and `on_error` are terminal.
 */
class chunk_sink {
public:
    virtual ~chunk_sink() = default;

    virtual void on_next(chunk value) = 0;
    virtual void on_complete() = 0;
    virtual void on_error(error failure) = 0;
};

/**
 * @brief Single-threaded state machine owning the consumer side of one
 * bridge.
 *
 * Every member function except the destructor must run on the loop thread
 * the executor belongs to. Blocking dequeues run on the blocking pool, which
 * must outlive the controller. Instances are created through
 * `std::make_shared`; dequeue results find their way back through a weak
 * reference.
 */
class stage_controller final
    : public control_handler,
      public std::enable_shared_from_this<stage_controller> {
public:
    enum class state : std::uint8_t {
        running,
        terminated,
    };

    stage_controller(std::string name, std::shared_ptr<handoff_queue> queue,
                     std::shared_ptr<lifecycle_guard> guard,
                     runtime::loop_executor executor,
                     runtime::blocking_pool& pool);
    /// Shut down if still running. Safe from any thread.
    ~stage_controller() override;

    stage_controller(const stage_controller&) = delete;
    stage_controller& operator=(const stage_controller&) = delete;
    stage_controller(stage_controller&&) = delete;
    stage_controller& operator=(stage_controller&&) = delete;

    /// @brief Route downstream callbacks to `sink` until `detach()`.
    /// A newly attached sink may receive one terminal callback.
    void attach(chunk_sink& sink) noexcept;
    void detach() noexcept;

    /**
     * @brief Downstream demand for one chunk.
     *
     * Schedules a dequeue unless one is already in flight. After
     * termination the first pull completes the sink synchronously and later
     * pulls are ignored.
     */
    void on_pull();
    /**
     * @brief Downstream cancellation.
     *
     * Marks the guard canceled, resolves pending control requests without
     * waiting for the queue, and terminates. The sink is not notified.
     */
    void on_cancel();
    /// @brief Accept a flush/close request from the writer.
    void on_control(control_request request) override;

    [[nodiscard]] state current_state() const noexcept;
    /// @return `true` while a pool worker is parked in (or running) a take.
    [[nodiscard]] bool dequeue_in_flight() const noexcept;
    [[nodiscard]] const std::string& name() const noexcept;

private:
    void schedule_dequeue();
    void on_dequeued(result<chunk> taken);
    void resolve_pending_if_drained();
    [[nodiscard]] bool drained(std::uint64_t enqueued) const noexcept;
    void settle_pending() noexcept;
    void complete();
    void notify_complete();
    void fail(error failure);
    void shutdown() noexcept;

    std::string name_;
    std::shared_ptr<handoff_queue> queue_;
    std::shared_ptr<lifecycle_guard> guard_;
    runtime::loop_executor executor_;
    runtime::blocking_pool& pool_;
    runtime::work_guard work_;

    chunk_sink *sink_{nullptr};
    bool sink_finished_{false};
    state state_{state::running};
    std::uint64_t delivered_{0};
    std::optional<control_request> pending_flush_{};
    std::optional<control_request> pending_close_{};
    std::optional<runtime::cancel_source> in_flight_take_{};
};

} // namespace streambridge
