/**
 * @file Thread.cpp
 * @brief Thread pool and range partitioning
 */

#include <QiTraffic/Platform/Thread.h>
#include <QiTraffic/Core/Validate.h>

#include <algorithm>

namespace Qi::Traffic::Platform {

// ============================================================================
// System Information
// ============================================================================

size_t GetNumCores() {
    unsigned int cores = std::thread::hardware_concurrency();
    return cores > 0 ? static_cast<size_t>(cores) : 1;
}

size_t GetRecommendedThreadCount() {
    size_t cores = GetNumCores();
    return cores > 1 ? cores - 1 : 1;
}

// ============================================================================
// Thread Pool
// ============================================================================

ThreadPool::ThreadPool(size_t numThreads) {
    Validate::RequireAtLeast(static_cast<int64_t>(numThreads), 1, "numThreads", "ThreadPool");

    workers_.reserve(numThreads);
    for (size_t i = 0; i < numThreads; ++i) {
        workers_.emplace_back([this]() { RunWorker(); });
    }
}

ThreadPool::~ThreadPool() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    workAvailable_.notify_all();

    for (auto& worker : workers_) {
        worker.join();
    }
}

bool ThreadPool::NextTask(std::function<void()>& task) {
    std::unique_lock<std::mutex> lock(mutex_);
    workAvailable_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
    if (queue_.empty()) {
        return false;
    }
    task = std::move(queue_.front());
    queue_.pop();
    ++busy_;
    return true;
}

void ThreadPool::RunWorker() {
    std::function<void()> task;
    while (NextTask(task)) {
        // Tasks are packaged_tasks: their exceptions end up in the future
        task();
        task = nullptr;

        bool drained;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            --busy_;
            drained = (busy_ == 0 && queue_.empty());
        }
        if (drained) {
            idle_.notify_all();
        }
    }
}

void ThreadPool::WaitAll() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_.wait(lock, [this] { return busy_ == 0 && queue_.empty(); });
}

size_t ThreadPool::PendingTasks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size() + busy_;
}

// ============================================================================
// Partitioning
// ============================================================================

std::vector<IndexRange> PartitionRange(size_t count, size_t numChunks) {
    std::vector<IndexRange> ranges;
    if (count == 0 || numChunks == 0) {
        return ranges;
    }

    numChunks = std::min(numChunks, count);
    size_t chunkSize = count / numChunks;
    size_t remainder = count % numChunks;

    ranges.reserve(numChunks);
    size_t current = 0;
    for (size_t chunk = 0; chunk < numChunks; ++chunk) {
        size_t thisChunkSize = chunkSize + (chunk < remainder ? 1 : 0);
        ranges.push_back({current, current + thisChunkSize});
        current += thisChunkSize;
    }
    return ranges;
}

} // namespace Qi::Traffic::Platform
