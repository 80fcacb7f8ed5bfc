/**
 * @file test_thread_pool.cpp
 * @brief Unit tests for ThreadPool.
 */

#include "executor/thread_pool.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <thread>

using namespace task_dispatch;
using namespace std::chrono_literals;

TEST(ThreadPoolTest, BasicSubmit) {
    ThreadPool pool(2);
    auto future = pool.submit([] { return 42; });
    EXPECT_EQ(future.get(), 42);
}

TEST(ThreadPoolTest, MultipleSubmissions) {
    ThreadPool pool(4);
    std::vector<std::future<int>> futures;

    for (size_t i = 0; i < 100; ++i) {
        futures.push_back(pool.submit([i] { return static_cast<int>(i * i); }));
    }

    for (size_t i = 0; i < 100; ++i) {
        EXPECT_EQ(futures[i].get(), static_cast<int>(i * i));
    }
}

TEST(ThreadPoolTest, ConcurrentExecution) {
    ThreadPool pool(4);
    std::atomic<int> counter{0};
    std::vector<std::future<void>> futures;

    for (int i = 0; i < 100; ++i) {
        futures.push_back(pool.submit([&counter] {
            counter.fetch_add(1, std::memory_order_relaxed);
        }));
    }

    for (auto& f : futures) f.get();
    EXPECT_EQ(counter.load(), 100);
}

TEST(ThreadPoolTest, ThreadCount) {
    ThreadPool pool(3);
    EXPECT_EQ(pool.thread_count(), 3u);
}

TEST(ThreadPoolTest, ExceptionReachesFuture) {
    ThreadPool pool(1);
    auto future = pool.submit([]() -> int { throw std::runtime_error("boom"); });
    EXPECT_THROW(future.get(), std::runtime_error);
}

TEST(ThreadPoolTest, CancellableJobSeesOwnStopOnly) {
    ThreadPool pool(2);

    auto stopped = pool.submit_cancellable([](std::stop_token stop) {
        while (!stop.stop_requested()) std::this_thread::sleep_for(1ms);
        return std::string{"stopped"};
    });
    auto untouched = pool.submit_cancellable([](std::stop_token stop) {
        std::this_thread::sleep_for(30ms);
        return stop.stop_requested();
    });

    stopped.request_stop();
    EXPECT_EQ(stopped.future.get(), "stopped");
    EXPECT_FALSE(untouched.future.get());
}

TEST(ThreadPoolTest, ReadyReflectsCompletion) {
    ThreadPool pool(1);
    std::atomic<bool> release{false};
    auto job = pool.submit_cancellable([&release](std::stop_token) {
        while (!release.load()) std::this_thread::sleep_for(1ms);
        return 7;
    });

    EXPECT_FALSE(job.ready());
    release = true;
    job.future.wait();
    EXPECT_TRUE(job.ready());
    EXPECT_EQ(job.future.get(), 7);
}

TEST(ThreadPoolTest, ShutdownStopsRunningAndAbandonsQueued) {
    std::future<bool> running;
    std::future<int> queued;
    std::atomic<bool> started{false};
    {
        ThreadPool pool(1);
        auto first = pool.submit_cancellable([&started](std::stop_token stop) {
            started = true;
            while (!stop.stop_requested()) std::this_thread::sleep_for(1ms);
            return true;
        });
        running = std::move(first.future);
        queued = pool.submit([] { return 1; });

        while (!started.load()) std::this_thread::sleep_for(1ms);
        EXPECT_EQ(pool.queued_count(), 1u);
        EXPECT_EQ(pool.active_count(), 1u);
    }

    EXPECT_TRUE(running.get());
    EXPECT_THROW(queued.get(), std::future_error);
}

TEST(ThreadPoolTest, AbandonedJobFreesItsWorker) {
    auto release = std::make_shared<std::atomic<bool>>(false);
    auto started = std::make_shared<std::atomic<bool>>(false);
    std::future<int> stuck_result;
    {
        ThreadPool pool(1);
        auto stuck = pool.submit_cancellable([release, started](std::stop_token) {
            *started = true;
            while (!release->load()) std::this_thread::sleep_for(1ms);
            return 1;
        });
        while (!started->load()) std::this_thread::sleep_for(1ms);

        EXPECT_TRUE(pool.abandon(stuck.stop));
        EXPECT_FALSE(pool.abandon(stuck.stop));
        EXPECT_EQ(pool.active_count(), 0u);
        EXPECT_EQ(pool.abandoned_count(), 1u);
        EXPECT_EQ(pool.thread_count(), 1u);

        // The replacement worker serves new work while the old one is still blocked
        auto next = pool.submit([] { return 2; });
        ASSERT_EQ(next.wait_for(2s), std::future_status::ready);
        EXPECT_EQ(next.get(), 2);
        EXPECT_FALSE(stuck.ready());
        stuck_result = std::move(stuck.future);
    }

    // Pool destruction did not wait on the abandoned job
    EXPECT_EQ(stuck_result.wait_for(0ms), std::future_status::timeout);
    *release = true;
    ASSERT_EQ(stuck_result.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(stuck_result.get(), 1);
}

TEST(ThreadPoolTest, AbandonUnknownJobIsRejected) {
    ThreadPool pool(1);
    std::stop_source unrelated;
    EXPECT_FALSE(pool.abandon(unrelated));
    EXPECT_EQ(pool.thread_count(), 1u);
}
