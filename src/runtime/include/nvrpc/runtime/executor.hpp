#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <deque>
#include <thread>
#include <vector>

namespace nvrpc::runtime
{

/// Runs inbound handler invocations off the receive loop.
class Executor
{
public:
    virtual ~Executor() = default;
    virtual void schedule(std::function<void()> fn) = 0;
};

/// Runs every task on the scheduling thread. Deterministic, for tests.
class InlineExecutor : public Executor
{
public:
    void schedule(std::function<void()> fn) override;
};

class ThreadPoolExecutor : public Executor
{
public:
    explicit ThreadPoolExecutor(std::size_t thread_count);
    ~ThreadPoolExecutor() override;

    ThreadPoolExecutor(const ThreadPoolExecutor&) = delete;
    ThreadPoolExecutor& operator=(const ThreadPoolExecutor&) = delete;

    void schedule(std::function<void()> fn) override;

    // Drains queued tasks, then joins the workers. Tasks scheduled afterwards are dropped.
    void stop();

    /// Blocks until no task is queued or running.
    void wait_idle();

    /// Queued plus running tasks.
    std::size_t pending() const;

    std::size_t thread_count() const { return thread_count_; }

private:
    void worker_loop(std::size_t index);

    std::size_t thread_count_ = 0;
    std::vector<std::thread> workers_;
    std::deque<std::function<void()>> tasks_;
    std::size_t running_ = 0;
    mutable std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable idle_cv_;
    bool stopping_ = false;
};

/// Pool sized to `thread_count`, or to the hardware concurrency when zero.
std::shared_ptr<Executor> make_default_executor(std::size_t thread_count = 0);

}  // namespace nvrpc::runtime
