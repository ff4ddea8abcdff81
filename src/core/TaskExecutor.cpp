#include "loginet/core/TaskExecutor.h"
#include "loginet/common/Logger.h"

namespace loginet {

ThreadPoolExecutor::ThreadPoolExecutor(size_t workerCount)
    : workerCount_(workerCount == 0 ? 1 : workerCount) {
    workers_.reserve(workerCount_);
    for (size_t i = 0; i < workerCount_; ++i) {
        workers_.emplace_back([this]() { workerLoop(); });
    }
}

ThreadPoolExecutor::~ThreadPoolExecutor() {
    shutdown();
}

void ThreadPoolExecutor::submit(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            throw std::runtime_error("submit on stopped ThreadPoolExecutor");
        }
        tasks_.push(std::move(task));
    }
    condition_.notify_one();
}

void ThreadPoolExecutor::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
    }
    condition_.notify_all();
    // jthreads join in their destructors; queued tasks are drained first
    workers_.clear();
}

bool ThreadPoolExecutor::isRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !stopping_;
}

size_t ThreadPoolExecutor::defaultWorkerCount() {
    unsigned int cores = std::thread::hardware_concurrency();
    return cores > 1 ? static_cast<size_t>(cores - 1) : 1;
}

void ThreadPoolExecutor::workerLoop() {
    while (true) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            condition_.wait(lock, [this] { return stopping_ || !tasks_.empty(); });
            if (stopping_ && tasks_.empty()) {
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop();
        }

        try {
            task();
        } catch (const std::exception& e) {
            LOG_ERROR("Task failed: {}", e.what());
        }
    }
}

void InlineExecutor::submit(std::function<void()> task) {
    if (!running_) {
        throw std::runtime_error("submit on stopped InlineExecutor");
    }
    task();
}

}  // namespace loginet
