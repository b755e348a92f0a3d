#include "streambridge/runtime/event_loop.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <gtest/gtest.h>
#include <memory>
#include <thread>

namespace {

using namespace std::chrono_literals;

streambridge::runtime::task<int> child_value(int value) {
    co_return value * 2;
}

TEST(event_loop_test, run_returns_without_work) {
    streambridge::runtime::event_loop loop;
    ASSERT_TRUE(loop.valid());

    const auto run_result = loop.run();
    EXPECT_TRUE(run_result.has_value());
}

TEST(event_loop_test, runs_spawned_task_and_awaited_child) {
    streambridge::runtime::event_loop loop;
    ASSERT_TRUE(loop.valid());

    int observed = 0;
    bool on_loop_thread = false;
    auto coroutine = [&]() -> streambridge::runtime::task<void> {
        on_loop_thread = loop.running_in_this_thread();
        observed = co_await child_value(21);
    };
    loop.spawn(coroutine());

    const auto run_result = loop.run();
    ASSERT_TRUE(run_result.has_value()) << run_result.error().message();
    EXPECT_EQ(observed, 42);
    EXPECT_TRUE(on_loop_thread);
    EXPECT_FALSE(loop.running_in_this_thread());
}

TEST(event_loop_test, post_from_other_thread_runs_on_loop_thread) {
    streambridge::runtime::event_loop loop;
    ASSERT_TRUE(loop.valid());
    auto executor = loop.get_executor();
    auto keep_alive = executor.make_work_guard();

    std::atomic_bool ran_on_loop{false};
    std::thread poster([&]() {
        std::this_thread::sleep_for(20ms);
        const auto posted = executor.post([&]() {
            ran_on_loop.store(loop.running_in_this_thread(),
                              std::memory_order_release);
            keep_alive.reset();
        });
        EXPECT_TRUE(posted.has_value());
    });

    const auto run_result = loop.run();
    poster.join();

    ASSERT_TRUE(run_result.has_value()) << run_result.error().message();
    EXPECT_TRUE(ran_on_loop.load(std::memory_order_acquire));
}

TEST(event_loop_test, work_guard_keeps_loop_running_until_released) {
    streambridge::runtime::event_loop loop;
    ASSERT_TRUE(loop.valid());
    auto guard = loop.get_executor().make_work_guard();
    EXPECT_TRUE(guard.owns_work());

    const auto started = std::chrono::steady_clock::now();
    std::thread releaser([&]() {
        std::this_thread::sleep_for(50ms);
        guard.reset();
    });

    const auto run_result = loop.run();
    const auto elapsed = std::chrono::steady_clock::now() - started;
    releaser.join();

    ASSERT_TRUE(run_result.has_value());
    EXPECT_GE(elapsed, 40ms);
    EXPECT_FALSE(guard.owns_work());
}

TEST(event_loop_test, stop_from_other_thread_is_responsive) {
    streambridge::runtime::event_loop loop;
    ASSERT_TRUE(loop.valid());
    auto guard = loop.get_executor().make_work_guard();

    std::thread stopper([&]() {
        std::this_thread::sleep_for(20ms);
        loop.stop();
    });

    const auto started = std::chrono::steady_clock::now();
    const auto run_result = loop.run();
    const auto elapsed = std::chrono::steady_clock::now() - started;
    stopper.join();

    ASSERT_TRUE(run_result.has_value());
    EXPECT_LT(elapsed, 2s);
}

TEST(event_loop_test, post_after_destruction_is_rejected) {
    streambridge::runtime::loop_executor executor;
    {
        streambridge::runtime::event_loop loop;
        ASSERT_TRUE(loop.valid());
        executor = loop.get_executor();
    }

    auto marker = std::make_shared<int>(0);
    std::weak_ptr<int> observer = marker;
    const auto posted = executor.post([held = std::move(marker)]() {});

    ASSERT_FALSE(posted.has_value());
    EXPECT_TRUE(posted.error().is(streambridge::errc::executor_closed));
    EXPECT_TRUE(observer.expired());
}

TEST(event_loop_test, default_executor_rejects_work) {
    const streambridge::runtime::loop_executor executor;

    EXPECT_FALSE(executor.valid());
    const auto posted = executor.post([]() {});
    ASSERT_FALSE(posted.has_value());
    EXPECT_TRUE(posted.error().is(streambridge::errc::executor_closed));
}

} // namespace
