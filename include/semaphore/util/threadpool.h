// SEMAPHORE - Worker Pool
// Copyright (c) 2024 SEMAPHORE Developers
// MIT License
//
// Fixed set of worker threads behind a bounded FIFO queue, used to spread
// independent proof verifications over several cores. Results and
// exceptions travel back through std::future.

#ifndef SEMAPHORE_UTIL_THREADPOOL_H
#define SEMAPHORE_UTIL_THREADPOOL_H

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace semaphore {
namespace util {

class ThreadPool {
public:
    struct Config {
        /// Worker count; 0 uses the hardware concurrency
        size_t numThreads{0};
        /// Tasks allowed to wait in the queue
        size_t maxQueueSize{1024};
        std::string name{"workers"};
    };

    explicit ThreadPool(size_t numThreads);
    explicit ThreadPool(const Config& config);

    /// Runs every queued task, then joins the workers
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    size_t ThreadCount() const { return workers_.size(); }
    size_t QueueCapacity() const { return config_.maxQueueSize; }
    const std::string& Name() const { return config_.name; }

    /**
     * Queue a callable unless the queue is at capacity.
     *
     * @return the task's future, or nullopt if the task was not queued
     */
    template<typename F>
    auto TrySubmit(F&& f)
        -> std::optional<std::future<typename std::invoke_result<F>::type>> {
        using Result = typename std::invoke_result<F>::type;

        auto task = std::make_shared<std::packaged_task<Result()>>(std::forward<F>(f));
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_ || queue_.size() >= config_.maxQueueSize) {
                return std::nullopt;
            }
            queue_.emplace_back([task]() { (*task)(); });
        }
        ready_.notify_one();
        return task->get_future();
    }

private:
    Config config_;
    std::vector<std::thread> workers_;

    std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<std::function<void()>> queue_;
    bool stopping_{false};

    void Run();
};

/**
 * Apply `func` to every item and return the results in input order.
 *
 * Items that do not fit in the pool's queue run on the calling thread, so
 * any batch size is accepted. Every queued task has finished before this
 * returns or throws; the first exception raised by `func` (in input order)
 * is rethrown.
 */
template<typename T, typename Func>
auto ParallelMap(ThreadPool& pool, const std::vector<T>& items, Func func)
    -> std::vector<typename std::invoke_result<Func, const T&>::type> {
    using Result = typename std::invoke_result<Func, const T&>::type;

    std::vector<std::future<Result>> futures;
    futures.reserve(items.size());

    auto waitAll = [&futures]() {
        for (auto& f : futures) {
            f.wait();
        }
    };

    // Queued tasks borrow func and items
    try {
        for (const auto& item : items) {
            auto queued = pool.TrySubmit([&func, &item]() { return func(item); });
            if (queued) {
                futures.push_back(std::move(*queued));
                continue;
            }
            std::packaged_task<Result()> local([&func, &item]() { return func(item); });
            futures.push_back(local.get_future());
            local();
        }
    } catch (...) {
        waitAll();
        throw;
    }
    waitAll();

    std::vector<Result> results;
    results.reserve(items.size());
    for (auto& f : futures) {
        results.push_back(f.get());
    }
    return results;
}

} // namespace util
} // namespace semaphore

#endif // SEMAPHORE_UTIL_THREADPOOL_H
