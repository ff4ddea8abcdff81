#pragma once

#include <condition_variable>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <vector>

namespace loginet {

/// Interface for task execution strategies
/// Allows swapping between a worker pool and synchronous execution
class ITaskExecutor {
public:
    virtual ~ITaskExecutor() = default;

    /// Submit a task for execution
    /// @param task The task to execute
    /// @throws std::runtime_error if the executor has been shut down
    virtual void submit(std::function<void()> task) = 0;

    /// Shutdown the executor and wait for pending tasks
    virtual void shutdown() = 0;

    /// Check if executor is running
    virtual bool isRunning() const = 0;

    /// Number of tasks that may run at the same time
    virtual size_t concurrency() const = 0;
};

/// Fixed-size pool of std::jthread workers draining a FIFO queue
///
/// Bounds the number of concurrent routing queries regardless of how many
/// edges are submitted. Exceptions escaping a raw task are logged and the
/// worker keeps running; use submitTask() to receive them through a future.
class ThreadPoolExecutor : public ITaskExecutor {
public:
    /// @param workerCount Number of workers (0 is treated as 1)
    explicit ThreadPoolExecutor(size_t workerCount);
    ~ThreadPoolExecutor() override;

    // Non-copyable
    ThreadPoolExecutor(const ThreadPoolExecutor&) = delete;
    ThreadPoolExecutor& operator=(const ThreadPoolExecutor&) = delete;

    void submit(std::function<void()> task) override;
    void shutdown() override;
    bool isRunning() const override;
    size_t concurrency() const override { return workerCount_; }

    /// Default worker count: hardware_concurrency() - 1, at least 1
    static size_t defaultWorkerCount();

private:
    void workerLoop();

    size_t workerCount_;
    std::vector<std::jthread> workers_;
    std::queue<std::function<void()>> tasks_;
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    bool stopping_ = false;
};

/// Runs every task on the calling thread during submit()
class InlineExecutor : public ITaskExecutor {
public:
    void submit(std::function<void()> task) override;
    void shutdown() override { running_ = false; }
    bool isRunning() const override { return running_; }
    size_t concurrency() const override { return 1; }

private:
    bool running_ = true;
};

/// Submit a callable and receive its result (or exception) through a future
template <class F>
auto submitTask(ITaskExecutor& executor, F&& fn) -> std::future<std::invoke_result_t<F>> {
    using ResultType = std::invoke_result_t<F>;
    auto task = std::make_shared<std::packaged_task<ResultType()>>(std::forward<F>(fn));
    std::future<ResultType> future = task->get_future();
    executor.submit([task]() { (*task)(); });
    return future;
}

}  // namespace loginet
