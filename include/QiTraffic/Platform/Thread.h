#pragma once

/**
 * @file Thread.h
 * @brief Worker pool and range partitioning for the intersection pass
 *
 * Provides:
 * - ThreadPool sized at construction, tasks submitted as futures
 * - PartitionRange to split [0, count) into contiguous chunks
 *
 * Usage:
 * @code
 * ThreadPool pool(4);
 * auto future = pool.Submit([](int a) { return a * 2; }, 21);
 * int value = future.get();   // rethrows if the task threw
 * @endcode
 */

#include <QiTraffic/Core/Export.h>

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace Qi::Traffic::Platform {

// ============================================================================
// System Information
// ============================================================================

/**
 * @brief Get number of hardware threads (logical cores)
 * @return Number of threads, minimum 1
 */
QITRAFFIC_API size_t GetNumCores();

/**
 * @brief Get recommended number of worker threads
 * @return GetNumCores() - 1, minimum 1
 */
QITRAFFIC_API size_t GetRecommendedThreadCount();

// ============================================================================
// Thread Pool
// ============================================================================

/**
 * @brief Fixed-size pool owned by one parallel pass
 *
 * Workers start in the constructor. The destructor lets them finish every
 * queued task, then joins them, so futures obtained from Submit() are always
 * satisfied.
 */
class QITRAFFIC_API ThreadPool {
public:
    /// @throws InvalidArgumentException if numThreads < 1
    explicit ThreadPool(size_t numThreads);
    ~ThreadPool();

    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;

    size_t Size() const { return workers_.size(); }

    /**
     * @brief Queue f(args...) and return a future for its result
     *
     * An exception thrown by the task is rethrown by future.get().
     */
    template<typename F, typename... Args>
    auto Submit(F&& f, Args&&... args)
        -> std::future<typename std::invoke_result<F, Args...>::type>;

    /// Block until the queue is empty and no task is running
    void WaitAll();

    /// Queued plus running tasks
    size_t PendingTasks() const;

private:
    void RunWorker();

    // Waits for work; false once the pool is stopping and the queue is drained
    bool NextTask(std::function<void()>& task);

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> queue_;
    size_t busy_ = 0;
    bool stopping_ = false;

    mutable std::mutex mutex_;
    std::condition_variable workAvailable_;
    std::condition_variable idle_;
};

// ============================================================================
// Partitioning
// ============================================================================

/// Half-open index range [begin, end)
struct IndexRange {
    size_t begin = 0;
    size_t end = 0;
};

/**
 * @brief Split [0, count) into at most numChunks contiguous, non-empty ranges
 *
 * The first (count % numChunks) ranges are one element longer.
 */
QITRAFFIC_API std::vector<IndexRange> PartitionRange(size_t count, size_t numChunks);

// ============================================================================
// Template Implementations
// ============================================================================

template<typename F, typename... Args>
auto ThreadPool::Submit(F&& f, Args&&... args)
    -> std::future<typename std::invoke_result<F, Args...>::type>
{
    using Result = typename std::invoke_result<F, Args...>::type;

    auto task = std::make_shared<std::packaged_task<Result()>>(
        std::bind(std::forward<F>(f), std::forward<Args>(args)...));
    std::future<Result> future = task->get_future();

    {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.emplace([task]() { (*task)(); });
    }
    workAvailable_.notify_one();
    return future;
}

} // namespace Qi::Traffic::Platform
