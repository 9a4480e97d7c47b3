#pragma once

/**
 * Async Settlement Executor
 *
 * Worker pool on which asynchronous completion work runs. Tasks submitted
 * here typically block on a std::future until the wrapped computation
 * settles, then run bookkeeping and fulfil a promise of their own.
 *
 * Because tasks block, the pool is elastic and unbounded: a task queued while
 * no worker is idle always starts a new worker, so a single computation that
 * never settles cannot starve the others. Idle workers are reused for later
 * tasks.
 */

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace memoflow {
namespace common {

/**
 * Thread-Safety: All public methods are thread-safe
 * Lifecycle: Must call initialize() before use, shutdown() for cleanup
 */
class AsyncExecutor {
public:
    AsyncExecutor();
    ~AsyncExecutor();

    // Disable copy/move
    AsyncExecutor(const AsyncExecutor&) = delete;
    AsyncExecutor& operator=(const AsyncExecutor&) = delete;

    /**
     * Start accepting tasks
     * @return false if already running
     */
    bool initialize();

    /**
     * Stop accepting tasks, drain the queue and join all workers.
     * Blocks until every running task has returned.
     */
    void shutdown();

    bool is_running() const { return running_.load(std::memory_order_acquire); }

    /**
     * Queue a task
     * @throws std::runtime_error if the executor is not running
     */
    void submit(std::function<void()> work);

    struct Stats {
        uint64_t submitted_tasks;
        uint64_t completed_tasks;
        uint64_t failed_tasks;
        uint64_t pending_tasks;
        size_t worker_count;
        size_t idle_workers;
    };

    Stats get_stats() const;

    void reset_stats();

private:
    std::atomic<bool> running_;

    struct Task {
        std::function<void()> work;
        std::chrono::steady_clock::time_point enqueue_time;
    };

    std::vector<std::thread> workers_;
    std::queue<Task> task_queue_;
    size_t idle_workers_ = 0;
    mutable std::mutex queue_mutex_;
    std::condition_variable queue_cv_;

    std::atomic<uint64_t> submitted_tasks_{0};
    std::atomic<uint64_t> completed_tasks_{0};
    std::atomic<uint64_t> failed_tasks_{0};

    void worker_loop();
};

/**
 * Process-wide executor, initialized on first use. Caches constructed
 * without an explicit executor settle on this one.
 */
AsyncExecutor& global_async_executor();

} // namespace common
} // namespace memoflow
