#include "streambridge/streambridge.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <future>
#include <gtest/gtest.h>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace {

using namespace std::chrono_literals;

std::span<const std::byte> as_bytes(const std::string& text) {
    return std::as_bytes(std::span<const char>{text.data(), text.size()});
}

std::string to_text(const std::vector<streambridge::chunk>& chunks) {
    std::string text;
    for (const auto& piece : chunks) {
        for (const auto value : piece.bytes()) {
            text.push_back(static_cast<char>(value));
        }
    }
    return text;
}

streambridge::source_options small_options(std::size_t capacity,
                                           std::chrono::milliseconds timeout) {
    streambridge::source_options options;
    options.buffer_capacity = capacity;
    options.write_timeout = timeout;
    options.name = "bridge-test";
    return options;
}

/// Sink that records chunks and keeps pulling.
class recording_sink final : public streambridge::chunk_sink {
public:
    explicit recording_sink(std::weak_ptr<streambridge::stage_controller> stage)
        : stage_(std::move(stage)) {}

    void on_next(streambridge::chunk value) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            chunks_.push_back(std::move(value));
        }
        if (auto stage = stage_.lock()) {
            stage->on_pull();
        }
    }

    void on_complete() override {
        completed_.store(true, std::memory_order_release);
    }

    void on_error(streambridge::error) override {
        failed_.store(true, std::memory_order_release);
    }

    [[nodiscard]] std::size_t count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return chunks_.size();
    }

    [[nodiscard]] std::vector<streambridge::chunk> chunks() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return chunks_;
    }

    [[nodiscard]] bool completed() const noexcept {
        return completed_.load(std::memory_order_acquire);
    }

private:
    std::weak_ptr<streambridge::stage_controller> stage_;
    mutable std::mutex mutex_{};
    std::vector<streambridge::chunk> chunks_{};
    std::atomic_bool completed_{false};
    std::atomic_bool failed_{false};
};

/// Start pulling into `sink` from the loop thread.
void start_pulling(streambridge::runtime::event_loop& loop,
                   const std::shared_ptr<streambridge::stage_controller>& stage,
                   recording_sink& sink) {
    const auto posted = loop.get_executor().post([stage, &sink]() {
        stage->attach(sink);
        stage->on_pull();
    });
    ASSERT_TRUE(posted.has_value());
}

TEST(stream_bridge_test, delivers_writes_in_order_through_reader) {
    streambridge::runtime::blocking_pool pool;
    streambridge::runtime::event_loop loop;
    ASSERT_TRUE(loop.valid());

    auto source = streambridge::make_output_stream_source(
        loop, pool, small_options(4, 5s));
    ASSERT_TRUE(source.has_value()) << source.error().message();
    auto stage = source->stage;

    std::string expected;
    for (int i = 0; i < 64; ++i) {
        expected += "chunk-" + std::to_string(i) + ";";
    }

    std::promise<std::vector<streambridge::chunk>> received;
    auto consumer = [&]() -> streambridge::runtime::task<void> {
        streambridge::chunk_reader reader{stage, loop};
        std::vector<streambridge::chunk> chunks;
        while (true) {
            auto next = co_await reader.next();
            if (!next.has_value() || !next->has_value()) {
                break;
            }
            chunks.push_back(std::move(**next));
        }
        received.set_value(std::move(chunks));
    };
    loop.spawn(consumer());

    std::promise<streambridge::result<void>> writer_done;
    std::thread writer_thread(
        [writer = std::move(source->writer), &writer_done]() mutable {
            for (int i = 0; i < 64; ++i) {
                const auto text = "chunk-" + std::to_string(i) + ";";
                auto written = writer.write(as_bytes(text));
                if (!written.has_value()) {
                    writer_done.set_value(written);
                    return;
                }
            }
            writer_done.set_value(writer.close());
        });

    const auto run_result = loop.run();
    writer_thread.join();

    ASSERT_TRUE(run_result.has_value()) << run_result.error().message();
    const auto written = writer_done.get_future().get();
    ASSERT_TRUE(written.has_value()) << written.error().message();

    const auto chunks = received.get_future().get();
    EXPECT_EQ(chunks.size(), 64U);
    EXPECT_EQ(to_text(chunks), expected);
    EXPECT_EQ(stage->current_state(),
              streambridge::stage_controller::state::terminated);
}

TEST(stream_bridge_test, full_queue_blocks_writer_until_dequeue) {
    streambridge::runtime::blocking_pool pool;
    streambridge::runtime::event_loop loop;
    ASSERT_TRUE(loop.valid());

    auto source = streambridge::make_output_stream_source(
        loop, pool, small_options(2, 5s));
    ASSERT_TRUE(source.has_value());
    auto stage = source->stage;

    std::atomic_bool first_two_done{false};
    std::atomic_bool third_done{false};
    std::promise<streambridge::result<void>> writer_done;
    std::thread writer_thread([writer = std::move(source->writer), &first_two_done,
                               &third_done, &writer_done]() mutable {
        const std::string a = "A";
        const std::string b = "B";
        const std::string c = "C";
        if (!writer.write(as_bytes(a)).has_value() ||
            !writer.write(as_bytes(b)).has_value()) {
            writer_done.set_value(
                streambridge::err<void>(streambridge::errc::enqueue_failed));
            return;
        }
        first_two_done.store(true, std::memory_order_release);

        auto third = writer.write(as_bytes(c));
        third_done.store(true, std::memory_order_release);
        if (!third.has_value()) {
            writer_done.set_value(third);
            return;
        }
        writer_done.set_value(writer.close());
    });

    while (!first_two_done.load(std::memory_order_acquire)) {
        std::this_thread::yield();
    }
    std::this_thread::sleep_for(50ms);
    EXPECT_FALSE(third_done.load(std::memory_order_acquire));

    std::promise<std::string> received;
    auto consumer = [&]() -> streambridge::runtime::task<void> {
        streambridge::chunk_reader reader{stage, loop};
        std::vector<streambridge::chunk> chunks;
        while (true) {
            auto next = co_await reader.next();
            if (!next.has_value() || !next->has_value()) {
                break;
            }
            chunks.push_back(std::move(**next));
        }
        received.set_value(to_text(chunks));
    };
    loop.spawn(consumer());

    const auto run_result = loop.run();
    writer_thread.join();

    ASSERT_TRUE(run_result.has_value());
    EXPECT_TRUE(third_done.load(std::memory_order_acquire));
    const auto written = writer_done.get_future().get();
    ASSERT_TRUE(written.has_value()) << written.error().message();
    EXPECT_EQ(received.get_future().get(), "ABC");
}

TEST(stream_bridge_test, flush_on_empty_queue_resolves) {
    streambridge::runtime::blocking_pool pool;
    streambridge::runtime::event_loop loop;
    ASSERT_TRUE(loop.valid());

    auto source = streambridge::make_output_stream_source(
        loop, pool, small_options(4, 5s));
    ASSERT_TRUE(source.has_value());

    streambridge::result<void> run_result = streambridge::ok();
    std::thread loop_thread([&]() { run_result = loop.run(); });

    const auto started = std::chrono::steady_clock::now();
    const auto flushed = source->writer.flush();
    EXPECT_LT(std::chrono::steady_clock::now() - started, 2s);
    ASSERT_TRUE(flushed.has_value()) << flushed.error().message();
    EXPECT_TRUE(source->writer.is_downstream_alive());

    // Zero-length writes pass the state checks and enqueue nothing.
    EXPECT_TRUE(source->writer.write(std::span<const std::byte>{}).has_value());
    EXPECT_TRUE(source->writer.flush().has_value());

    const auto closed = source->writer.close();
    ASSERT_TRUE(closed.has_value()) << closed.error().message();
    loop_thread.join();
    EXPECT_TRUE(run_result.has_value());
}

TEST(stream_bridge_test, flush_waits_for_queued_chunks_to_drain) {
    streambridge::runtime::blocking_pool pool;
    streambridge::runtime::event_loop loop;
    ASSERT_TRUE(loop.valid());

    auto source = streambridge::make_output_stream_source(
        loop, pool, small_options(8, 500ms));
    ASSERT_TRUE(source.has_value());
    auto stage = source->stage;
    auto& writer = source->writer;
    recording_sink sink{stage};

    streambridge::result<void> run_result = streambridge::ok();
    std::thread loop_thread([&]() { run_result = loop.run(); });

    const std::string text = "queued";
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(writer.write(as_bytes(text)).has_value());
    }

    // Nothing consumes yet, so the flush cannot resolve.
    const auto stalled = writer.flush();
    ASSERT_FALSE(stalled.has_value());
    EXPECT_TRUE(stalled.error().is(streambridge::errc::timed_out));
    EXPECT_EQ(sink.count(), 0U);
    EXPECT_TRUE(writer.is_open());

    start_pulling(loop, stage, sink);
    const auto flushed = writer.flush();
    ASSERT_TRUE(flushed.has_value()) << flushed.error().message();
    EXPECT_EQ(sink.count(), 3U);

    const auto closed = writer.close();
    ASSERT_TRUE(closed.has_value()) << closed.error().message();
    loop_thread.join();

    EXPECT_TRUE(run_result.has_value());
    EXPECT_TRUE(sink.completed());
    EXPECT_EQ(to_text(sink.chunks()), "queuedqueuedqueued");
    stage->detach();
}

TEST(stream_bridge_test, close_after_downstream_cancel_succeeds) {
    streambridge::runtime::blocking_pool pool;
    streambridge::runtime::event_loop loop;
    ASSERT_TRUE(loop.valid());

    auto source = streambridge::make_output_stream_source(
        loop, pool, small_options(4, 5s));
    ASSERT_TRUE(source.has_value());
    auto stage = source->stage;
    auto& writer = source->writer;

    auto keep_alive = loop.get_executor().make_work_guard();
    streambridge::result<void> run_result = streambridge::ok();
    std::thread loop_thread([&]() { run_result = loop.run(); });

    ASSERT_TRUE(loop.get_executor().post([stage]() { stage->on_cancel(); })
                    .has_value());

    const auto closed = writer.close();
    ASSERT_TRUE(closed.has_value()) << closed.error().message();
    EXPECT_FALSE(writer.is_open());
    EXPECT_FALSE(writer.is_downstream_alive());

    const std::string text = "late";
    const auto written = writer.write(as_bytes(text));
    ASSERT_FALSE(written.has_value());
    EXPECT_TRUE(written.error().is(streambridge::errc::stream_closed));

    const auto flushed = writer.flush();
    ASSERT_FALSE(flushed.has_value());
    EXPECT_TRUE(flushed.error().is(streambridge::errc::stream_closed));

    EXPECT_TRUE(writer.close().has_value());

    keep_alive.reset();
    loop_thread.join();
    EXPECT_TRUE(run_result.has_value());
}

TEST(stream_bridge_test, blocked_write_fails_when_downstream_cancels) {
    streambridge::runtime::blocking_pool pool;
    streambridge::runtime::event_loop loop;
    ASSERT_TRUE(loop.valid());

    auto source = streambridge::make_output_stream_source(
        loop, pool, small_options(1, 5s));
    ASSERT_TRUE(source.has_value());
    auto stage = source->stage;
    auto& writer = source->writer;

    auto keep_alive = loop.get_executor().make_work_guard();
    streambridge::result<void> run_result = streambridge::ok();
    std::thread loop_thread([&]() { run_result = loop.run(); });

    const std::string text = "x";
    ASSERT_TRUE(writer.write(as_bytes(text)).has_value());
    auto blocked = std::async(std::launch::async,
                              [&]() { return writer.write(as_bytes(text)); });
    EXPECT_EQ(blocked.wait_for(50ms), std::future_status::timeout);

    ASSERT_TRUE(loop.get_executor().post([stage]() { stage->on_cancel(); })
                    .has_value());

    ASSERT_EQ(blocked.wait_for(2s), std::future_status::ready);
    const auto written = blocked.get();
    ASSERT_FALSE(written.has_value());
    EXPECT_TRUE(written.error().is(streambridge::errc::stream_terminated));
    EXPECT_FALSE(writer.is_downstream_alive());

    const auto again = writer.write(as_bytes(text));
    ASSERT_FALSE(again.has_value());
    EXPECT_TRUE(again.error().is(streambridge::errc::stream_terminated));

    const auto flushed = writer.flush();
    ASSERT_FALSE(flushed.has_value());
    EXPECT_TRUE(flushed.error().is(streambridge::errc::stream_terminated));

    EXPECT_TRUE(writer.close().has_value());
    keep_alive.reset();
    loop_thread.join();
    EXPECT_TRUE(run_result.has_value());
}

TEST(stream_bridge_test, timed_out_close_still_closes) {
    streambridge::runtime::blocking_pool pool;
    streambridge::runtime::event_loop loop;
    ASSERT_TRUE(loop.valid());

    auto source = streambridge::make_output_stream_source(
        loop, pool, small_options(4, 50ms));
    ASSERT_TRUE(source.has_value());
    auto& writer = source->writer;

    // The loop never runs, so nothing answers the close.
    const auto closed = writer.close();
    ASSERT_FALSE(closed.has_value());
    EXPECT_TRUE(closed.error().is(streambridge::errc::timed_out));
    EXPECT_FALSE(writer.is_open());

    EXPECT_TRUE(writer.close().has_value());
    const std::string text = "late";
    const auto written = writer.write(as_bytes(text));
    ASSERT_FALSE(written.has_value());
    EXPECT_TRUE(written.error().is(streambridge::errc::stream_closed));
}

TEST(stream_bridge_test, rejects_range_outside_buffer) {
    streambridge::runtime::blocking_pool pool;
    streambridge::runtime::event_loop loop;
    ASSERT_TRUE(loop.valid());

    auto source = streambridge::make_output_stream_source(
        loop, pool, small_options(4, 2s));
    ASSERT_TRUE(source.has_value());
    auto stage = source->stage;
    auto& writer = source->writer;

    const std::string text = "abcd";
    const auto past_end = writer.write(as_bytes(text), 3, 5);
    ASSERT_FALSE(past_end.has_value());
    EXPECT_EQ(past_end.error().value(), EINVAL);

    const auto bad_offset = writer.write(as_bytes(text), 5, 0);
    ASSERT_FALSE(bad_offset.has_value());
    EXPECT_EQ(bad_offset.error().value(), EINVAL);

    ASSERT_TRUE(writer.write(as_bytes(text), 1, 2).has_value());
    ASSERT_TRUE(writer.write(std::byte{'!'}).has_value());

    recording_sink sink{stage};
    start_pulling(loop, stage, sink);
    auto keep_alive = loop.get_executor().make_work_guard();
    streambridge::result<void> run_result = streambridge::ok();
    std::thread loop_thread([&]() { run_result = loop.run(); });

    const auto flushed = writer.flush();
    ASSERT_TRUE(flushed.has_value()) << flushed.error().message();
    EXPECT_EQ(to_text(sink.chunks()), "bc!");

    keep_alive.reset();
    EXPECT_TRUE(writer.close().has_value());
    loop_thread.join();
    EXPECT_TRUE(run_result.has_value());
    stage->detach();
}

} // namespace
