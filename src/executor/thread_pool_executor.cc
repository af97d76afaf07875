#include "thread_pool_executor.h"
#include <glog/logging.h>

namespace Cadence {

ThreadPoolExecutor::ThreadPoolExecutor(size_t num_threads) {
    CHECK_GT(num_threads, 0u) << "ThreadPoolExecutor needs at least one worker";
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back(&ThreadPoolExecutor::WorkerThread, this);
    }
    VLOG(3) << "[ThreadPoolExecutor] Started " << num_threads << " workers";
}

ThreadPoolExecutor::~ThreadPoolExecutor() {
    Stop();
}

void ThreadPoolExecutor::Execute(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stop_) {
            throw ExecutorRejectedError("ThreadPoolExecutor is stopped");
        }
        tasks_.emplace(std::move(task));
    }
    condition_.notify_one();
}

void ThreadPoolExecutor::Stop() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stop_ = true;
    }
    condition_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void ThreadPoolExecutor::WorkerThread() {
    while (true) {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            condition_.wait(lock, [this] { return stop_ || !tasks_.empty(); });

            if (stop_ && tasks_.empty()) {
                return;
            }

            task = std::move(tasks_.front());
            tasks_.pop();
        }

        try {
            task();
        } catch (const std::exception& e) {
            LOG(ERROR) << "[ThreadPoolExecutor] Task failed: " << e.what();
        } catch (...) {
            LOG(ERROR) << "[ThreadPoolExecutor] Task failed with unknown exception";
        }
        completed_tasks_.fetch_add(1, std::memory_order_relaxed);
    }
}

} // namespace Cadence
