#include "streambridge/bridge/source.hpp"

#include <spdlog/spdlog.h>
#include <utility>

namespace streambridge {

result<void> source_options::validate() const {
    if (buffer_capacity == 0) {
        return err<void>(errc::invalid_configuration);
    }
    if (write_timeout <= std::chrono::milliseconds::zero()) {
        return err<void>(errc::invalid_configuration);
    }
    return ok();
}

result<output_stream_source>
make_output_stream_source(runtime::event_loop& loop,
                          runtime::blocking_pool& pool,
                          source_options options) {
    if (auto valid = options.validate(); !valid.has_value()) {
        spdlog::warn("[{}] rejected options: capacity {}, timeout {} ms",
                     options.name, options.buffer_capacity,
                     options.write_timeout.count());
        return err<output_stream_source>(valid.error());
    }

    auto queue = handoff_queue::create(options.buffer_capacity);
    if (!queue.has_value()) {
        return err<output_stream_source>(queue.error());
    }

    auto guard = std::make_shared<lifecycle_guard>();
    auto executor = loop.get_executor();
    auto stage = std::make_shared<stage_controller>(options.name, *queue, guard,
                                                    executor, pool);

    control_channel channel{executor, std::weak_ptr<control_handler>(stage)};
    blocking_writer writer{std::move(options.name), std::move(*queue),
                           std::move(guard), std::move(channel),
                           options.write_timeout};

    return output_stream_source{std::move(stage), std::move(writer)};
}

} // namespace streambridge
