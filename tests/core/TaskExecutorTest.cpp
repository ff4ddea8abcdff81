#include <gtest/gtest.h>
#include <loginet/core/TaskExecutor.h>

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace loginet;

TEST(ThreadPoolExecutorTest, RunsSubmittedTasks) {
    ThreadPoolExecutor executor(3);
    std::atomic<int> counter{0};

    std::vector<std::future<void>> futures;
    for (int i = 0; i < 20; ++i) {
        futures.push_back(submitTask(executor, [&counter]() { ++counter; }));
    }
    for (auto& future : futures) {
        future.get();
    }

    EXPECT_EQ(counter.load(), 20);
    EXPECT_EQ(executor.concurrency(), 3u);
}

TEST(ThreadPoolExecutorTest, SubmitTaskReturnsValue) {
    ThreadPoolExecutor executor(2);
    auto future = submitTask(executor, []() { return 6 * 7; });
    EXPECT_EQ(future.get(), 42);
}

TEST(ThreadPoolExecutorTest, ExceptionTravelsThroughFuture) {
    ThreadPoolExecutor executor(1);
    auto future = submitTask(executor, []() -> int { throw std::runtime_error("routing backend down"); });
    EXPECT_THROW(future.get(), std::runtime_error);

    // Worker survives the exception
    auto next = submitTask(executor, []() { return 1; });
    EXPECT_EQ(next.get(), 1);
}

TEST(ThreadPoolExecutorTest, BoundsConcurrency) {
    ThreadPoolExecutor executor(2);
    std::atomic<int> running{0};
    std::atomic<int> peak{0};

    std::vector<std::future<void>> futures;
    for (int i = 0; i < 8; ++i) {
        futures.push_back(submitTask(executor, [&]() {
            int now = ++running;
            int expected = peak.load();
            while (now > expected && !peak.compare_exchange_weak(expected, now)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
            --running;
        }));
    }
    for (auto& future : futures) {
        future.get();
    }

    EXPECT_LE(peak.load(), 2);
}

TEST(ThreadPoolExecutorTest, ShutdownDrainsQueueAndRejectsNewTasks) {
    ThreadPoolExecutor executor(1);
    std::atomic<int> counter{0};
    for (int i = 0; i < 5; ++i) {
        executor.submit([&counter]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
            ++counter;
        });
    }

    executor.shutdown();

    EXPECT_EQ(counter.load(), 5);
    EXPECT_FALSE(executor.isRunning());
    EXPECT_THROW(executor.submit([]() {}), std::runtime_error);
}

TEST(ThreadPoolExecutorTest, ZeroWorkersMeansOne) {
    ThreadPoolExecutor executor(0);
    EXPECT_EQ(executor.concurrency(), 1u);
    EXPECT_GE(ThreadPoolExecutor::defaultWorkerCount(), 1u);
}

TEST(InlineExecutorTest, RunsOnCallingThread) {
    InlineExecutor executor;
    std::thread::id caller = std::this_thread::get_id();
    std::thread::id ran;

    auto future = submitTask(executor, [&ran]() { ran = std::this_thread::get_id(); });

    EXPECT_EQ(future.wait_for(std::chrono::seconds(0)), std::future_status::ready);
    EXPECT_EQ(ran, caller);

    executor.shutdown();
    EXPECT_THROW(executor.submit([]() {}), std::runtime_error);
}
