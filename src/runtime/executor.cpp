#include "nvrpc/runtime/executor.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>

namespace nvrpc::runtime
{

void InlineExecutor::schedule(std::function<void()> fn)
{
    fn();
}

ThreadPoolExecutor::ThreadPoolExecutor(std::size_t thread_count)
    : thread_count_(std::max<std::size_t>(1, thread_count))
{
    workers_.reserve(thread_count_);
    for (std::size_t i = 0; i < thread_count_; ++i) {
        workers_.emplace_back([this, i] { worker_loop(i); });
    }
}

ThreadPoolExecutor::~ThreadPoolExecutor()
{
    stop();
}

void ThreadPoolExecutor::schedule(std::function<void()> fn)
{
    std::unique_lock lock(mutex_);
    if (stopping_) {
        lock.unlock();
        spdlog::debug("executor: dropping task scheduled after stop");
        return;
    }
    tasks_.push_back(std::move(fn));
    lock.unlock();
    work_cv_.notify_one();
}

void ThreadPoolExecutor::stop()
{
    std::vector<std::thread> workers;
    {
        std::lock_guard lock(mutex_);
        stopping_ = true;
        workers.swap(workers_);
    }
    work_cv_.notify_all();
    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void ThreadPoolExecutor::wait_idle()
{
    std::unique_lock lock(mutex_);
    idle_cv_.wait(lock, [this] { return tasks_.empty() && running_ == 0; });
}

std::size_t ThreadPoolExecutor::pending() const
{
    std::lock_guard lock(mutex_);
    return tasks_.size() + running_;
}

void ThreadPoolExecutor::worker_loop(std::size_t index)
{
    std::function<void()> task;
    std::unique_lock lock(mutex_);
    while (true) {
        work_cv_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
        if (tasks_.empty()) {
            return;
        }
        task = std::move(tasks_.front());
        tasks_.pop_front();
        ++running_;
        lock.unlock();

        try {
            task();
        } catch (const std::exception& ex) {
            spdlog::error("executor: task on worker {} threw: {}", index, ex.what());
        } catch (...) {
            spdlog::error("executor: task on worker {} threw an unknown exception", index);
        }
        // captured state is released outside the lock
        task = nullptr;

        lock.lock();
        --running_;
        if (tasks_.empty() && running_ == 0) {
            idle_cv_.notify_all();
        }
    }
}

std::shared_ptr<Executor> make_default_executor(std::size_t thread_count)
{
    if (thread_count == 0) {
        thread_count = std::max<std::size_t>(1, std::thread::hardware_concurrency());
    }
    return std::make_shared<ThreadPoolExecutor>(thread_count);
}

}  // namespace nvrpc::runtime
