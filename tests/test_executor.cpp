#include "nvrpc/runtime/executor.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <future>
#include <stdexcept>

using namespace nvrpc::runtime;

TEST(InlineExecutorTest, RunsTaskImmediately)
{
    InlineExecutor exec;
    std::atomic<int> counter{0};
    exec.schedule([&] { counter.fetch_add(1, std::memory_order_relaxed); });
    EXPECT_EQ(counter.load(std::memory_order_relaxed), 1);
}

TEST(ThreadPoolExecutorTest, ExecutesScheduledTasks)
{
    ThreadPoolExecutor exec(2);
    EXPECT_EQ(exec.thread_count(), 2u);
    std::atomic<int> counter{0};
    std::promise<void> done;
    auto fut = done.get_future();

    for (int i = 0; i < 5; ++i) {
        exec.schedule([&] {
            if (counter.fetch_add(1, std::memory_order_relaxed) == 4) {
                done.set_value();
            }
        });
    }

    EXPECT_EQ(fut.wait_for(std::chrono::seconds(1)), std::future_status::ready);
    exec.stop();
    EXPECT_EQ(counter.load(std::memory_order_relaxed), 5);
}

TEST(ThreadPoolExecutorTest, ThrowingTaskDoesNotKillWorker)
{
    ThreadPoolExecutor exec(1);
    std::promise<void> done;
    auto fut = done.get_future();

    exec.schedule([] { throw std::runtime_error("handler failed"); });
    exec.schedule([&] { done.set_value(); });

    EXPECT_EQ(fut.wait_for(std::chrono::seconds(1)), std::future_status::ready);
    exec.stop();
}

TEST(ThreadPoolExecutorTest, NonStandardThrowDoesNotKillWorker)
{
    ThreadPoolExecutor exec(1);
    std::promise<void> done;
    auto fut = done.get_future();

    exec.schedule([] { throw 42; });
    exec.schedule([&] { done.set_value(); });

    EXPECT_EQ(fut.wait_for(std::chrono::seconds(1)), std::future_status::ready);
    exec.stop();
}

TEST(ThreadPoolExecutorTest, StopDrainsQueuedTasks)
{
    std::atomic<int> counter{0};
    {
        ThreadPoolExecutor exec(1);
        for (int i = 0; i < 100; ++i) {
            exec.schedule([&] { counter.fetch_add(1, std::memory_order_relaxed); });
        }
        exec.stop();
        exec.schedule([&] { counter.fetch_add(1000, std::memory_order_relaxed); });
    }
    EXPECT_EQ(counter.load(std::memory_order_relaxed), 100);
}

TEST(DefaultExecutorTest, CreatesPool)
{
    auto exec = make_default_executor(3);
    ASSERT_NE(exec, nullptr);
    std::promise<void> done;
    auto fut = done.get_future();
    exec->schedule([&] { done.set_value(); });
    EXPECT_EQ(fut.wait_for(std::chrono::seconds(1)), std::future_status::ready);
}

TEST(ThreadPoolExecutorTest, WaitIdleCoversRunningTasks)
{
    ThreadPoolExecutor exec(2);
    std::promise<void> gate;
    auto opened = gate.get_future().share();
    std::atomic<int> finished{0};

    for (int i = 0; i < 4; ++i) {
        exec.schedule([&, opened] {
            opened.wait();
            finished.fetch_add(1, std::memory_order_relaxed);
        });
    }
    EXPECT_EQ(exec.pending(), 4u);

    gate.set_value();
    exec.wait_idle();
    EXPECT_EQ(finished.load(std::memory_order_relaxed), 4);
    EXPECT_EQ(exec.pending(), 0u);
}
