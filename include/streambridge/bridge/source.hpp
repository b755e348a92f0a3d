#pragma once

/**
 * @file
 * @brief Factory wiring a blocking writer to a stage controller.
 */

#include "streambridge/bridge/blocking_writer.hpp"
#include "streambridge/bridge/stage_controller.hpp"
#include "streambridge/core/result.hpp"
#include "streambridge/runtime/blocking_pool.hpp"
#include "streambridge/runtime/event_loop.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>

namespace streambridge {

/**
 * @brief Tuning knobs for one output-stream source.
 */
struct source_options {
    /// Chunks buffered between writer and stage before `write` blocks.
    std::size_t buffer_capacity{16};
    /// Upper bound for each flush/close wait.
    std::chrono::milliseconds write_timeout{std::chrono::seconds{5}};
    /// Tag used in log lines.
    std::string name{"output-stream-source"};

    /// @return `errc::invalid_configuration` for a zero capacity or a
    /// non-positive timeout.
    [[nodiscard]] result<void> validate() const;
};

/**
 * @brief Materialized bridge: the loop-side stage and its writer.
 */
struct output_stream_source {
    std::shared_ptr<stage_controller> stage;
    blocking_writer writer;
};

/**
 * @brief Create a stage on `loop` and the writer feeding it.
 *
 * The stage holds `loop` open (through a work guard) until it terminates.
 * `pool` runs its blocking dequeues and must outlive the stage.
 */
[[nodiscard]] result<output_stream_source>
make_output_stream_source(runtime::event_loop& loop,
                          runtime::blocking_pool& pool,
                          source_options options = {});

} // namespace streambridge
