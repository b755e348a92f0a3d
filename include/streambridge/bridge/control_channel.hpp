#pragma once

/**
 * @file
 * @brief Flush/close requests sent from the writer thread into the
 * controller's turn.
 */

#include "streambridge/bridge/lifecycle_guard.hpp"
#include "streambridge/runtime/executor.hpp"

#include <cstdint>
#include <future>
#include <memory>
#include <string_view>

namespace streambridge {

/// @brief Kind of rendezvous requested by the writer.
enum class control_kind : std::uint8_t {
    flush,
    close,
};

/// @return Lower-case name of the request kind.
[[nodiscard]] std::string_view to_string(control_kind kind) noexcept;

/**
 * @brief One-shot completion handle for a control request.
 *
 * Settles its future exactly once. A handle destroyed without being settled
 * (dropped by a closed loop, or by a controller that no longer exists)
 * settles with `downstream_status::canceled`.
 */
class control_completion {
public:
    control_completion();
    ~control_completion();

    control_completion(const control_completion&) = delete;
    control_completion& operator=(const control_completion&) = delete;
    control_completion(control_completion&& other) noexcept;
    control_completion& operator=(control_completion&& other) noexcept;

    /// @brief Obtain the writer-side future. Call once, before moving away.
    [[nodiscard]] std::future<downstream_status> get_future();
    /// @brief Settle with the given status; later calls are ignored.
    void settle(downstream_status status) noexcept;
    /// @return `true` until settled (or moved from).
    [[nodiscard]] bool pending() const noexcept;

private:
    std::promise<downstream_status> promise_{};
    bool armed_{true};
};

/**
 * @brief Control request as seen by the controller.
 */
struct control_request {
    control_kind kind{control_kind::flush};
    /// Chunks the writer had enqueued when it sent the request.
    std::uint64_t enqueued{0};
    control_completion completion{};
};

/**
 * @brief Receiver of control requests; runs on the loop thread only.
 */
class control_handler {
public:
    virtual ~control_handler() = default;

    /// @brief Take ownership of a request and settle it eventually.
    virtual void on_control(control_request request) = 0;
};

/**
 * @brief Send-only channel from the writer thread into a `control_handler`.
 *
 * Requests are posted through the loop executor and processed in the order
 * sent, on the handler's own turn.
 */
class control_channel {
public:
    control_channel() noexcept = default;
    control_channel(runtime::loop_executor executor,
                    std::weak_ptr<control_handler> handler) noexcept;

    /**
     * @brief Post a request to the handler's next turn.
     * @param kind Request kind.
     * @param enqueued Writer-side count of chunks enqueued so far.
     * @return Future settled when the handler resolves the request, or with
     * `canceled` when it cannot be delivered.
     */
    [[nodiscard]] std::future<downstream_status> send(control_kind kind,
                                                      std::uint64_t enqueued);

private:
    runtime::loop_executor executor_{};
    std::weak_ptr<control_handler> handler_{};
};

} // namespace streambridge
