#pragma once

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

#include "dispatcher/interfaces.h"

namespace Cadence {

/**
 * Fixed-size worker pool
 * Tasks run in submission order across the pool, several at a time.
 */
class ThreadPoolExecutor : public Executor {
public:
    explicit ThreadPoolExecutor(size_t num_threads = 4);
    ~ThreadPoolExecutor() override;

    ThreadPoolExecutor(const ThreadPoolExecutor&) = delete;
    ThreadPoolExecutor& operator=(const ThreadPoolExecutor&) = delete;

    void Execute(std::function<void()> task) override;

    // Stop accepting tasks, run what is already queued, join the workers
    void Stop();

    size_t NumThreads() const { return workers_.size(); }
    size_t NumCompletedTasks() const { return completed_tasks_.load(std::memory_order_relaxed); }

private:
    void WorkerThread();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    std::mutex queue_mutex_;
    std::condition_variable condition_;
    bool stop_ = false;
    std::atomic<size_t> completed_tasks_{0};
};

} // namespace Cadence
