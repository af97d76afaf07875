#include <gtest/gtest.h>
#include "../../src/executor/thread_pool_executor.h"
#include <chrono>
#include <future>
#include <stdexcept>

using namespace Cadence;
using namespace std::chrono_literals;

TEST(ThreadPoolExecutorTest, RunsAllSubmittedTasks) {
    ThreadPoolExecutor executor(2);
    std::atomic<int> counter{0};

    for (int i = 0; i < 100; ++i) {
        executor.Execute([&counter]() { counter++; });
    }
    executor.Stop();

    EXPECT_EQ(counter, 100);
    EXPECT_EQ(executor.NumCompletedTasks(), 100);
}

TEST(ThreadPoolExecutorTest, RunsTasksConcurrently) {
    ThreadPoolExecutor executor(2);
    std::promise<void> first_started;
    auto first_future = first_started.get_future();
    std::atomic<bool> second_saw_first{false};

    executor.Execute([&]() {
        first_started.set_value();
        std::this_thread::sleep_for(50ms);
    });
    executor.Execute([&]() {
        second_saw_first = first_future.wait_for(5s) == std::future_status::ready;
    });
    executor.Stop();

    EXPECT_TRUE(second_saw_first);
}

TEST(ThreadPoolExecutorTest, RejectsAfterStop) {
    ThreadPoolExecutor executor(1);
    executor.Stop();

    EXPECT_THROW(executor.Execute([]() {}), ExecutorRejectedError);
}

TEST(ThreadPoolExecutorTest, FailingTaskDoesNotKillWorker) {
    ThreadPoolExecutor executor(1);
    std::atomic<bool> ran_after_failure{false};

    executor.Execute([]() { throw std::runtime_error("boom"); });
    executor.Execute([&]() { ran_after_failure = true; });
    executor.Stop();

    EXPECT_TRUE(ran_after_failure);
    EXPECT_EQ(executor.NumCompletedTasks(), 2);
}

TEST(ThreadPoolExecutorTest, NonStandardExceptionDoesNotKillWorker) {
    ThreadPoolExecutor executor(1);
    std::atomic<bool> ran_after_failure{false};

    executor.Execute([]() { throw 7; });
    executor.Execute([&]() { ran_after_failure = true; });
    executor.Stop();

    EXPECT_TRUE(ran_after_failure);
    EXPECT_EQ(executor.NumCompletedTasks(), 2);
}

TEST(ThreadPoolExecutorTest, StopIsIdempotent) {
    ThreadPoolExecutor executor(3);
    EXPECT_EQ(executor.NumThreads(), 3);
    executor.Stop();
    executor.Stop();
    SUCCEED();
}
