// SEMAPHORE - Worker Pool Implementation
// Copyright (c) 2024 SEMAPHORE Developers
// MIT License

#include "semaphore/util/threadpool.h"

#include <algorithm>

namespace semaphore {
namespace util {

ThreadPool::ThreadPool(size_t numThreads)
    : ThreadPool(Config{numThreads, Config{}.maxQueueSize, Config{}.name}) {}

ThreadPool::ThreadPool(const Config& config) : config_(config) {
    size_t count = config_.numThreads;
    if (count == 0) {
        count = std::max<size_t>(1, std::thread::hardware_concurrency());
    }

    workers_.reserve(count);
    for (size_t i = 0; i < count; ++i) {
        workers_.emplace_back(&ThreadPool::Run, this);
    }
}

ThreadPool::~ThreadPool() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    ready_.notify_all();
    for (auto& worker : workers_) {
        worker.join();
    }
}

void ThreadPool::Run() {
    for (;;) {
        std::function<void()> task;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            ready_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                return;
            }
            task = std::move(queue_.front());
            queue_.pop_front();
        }
        // packaged_task stores any exception in its future
        task();
    }
}

} // namespace util
} // namespace semaphore
