#include "common/async_executor.h"
#include "common/logging.h"
#include <stdexcept>
#include <string>

namespace memoflow {
namespace common {

AsyncExecutor::AsyncExecutor() : running_(false) {}

AsyncExecutor::~AsyncExecutor() {
    if (running_.load(std::memory_order_acquire)) {
        shutdown();
    }
}

bool AsyncExecutor::initialize() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        LOG_WARN("AsyncExecutor already initialized");
        return false;
    }

    LOG_DEBUG("AsyncExecutor initialized");
    return true;
}

void AsyncExecutor::shutdown() {
    std::vector<std::thread> workers;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        bool expected = true;
        if (!running_.compare_exchange_strong(expected, false, std::memory_order_acq_rel)) {
            LOG_WARN("AsyncExecutor already shut down");
            return;
        }
        workers.swap(workers_);
    }

    LOG_DEBUG("Shutting down AsyncExecutor (", workers.size(), " workers)");

    // Workers drain the remaining queue before exiting
    queue_cv_.notify_all();

    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        idle_workers_ = 0;
    }

    LOG_DEBUG("AsyncExecutor shut down complete");
}

void AsyncExecutor::submit(std::function<void()> work) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!running_.load(std::memory_order_acquire)) {
            throw std::runtime_error("AsyncExecutor is not running");
        }

        task_queue_.push(Task{std::move(work), std::chrono::steady_clock::now()});
        submitted_tasks_.fetch_add(1, std::memory_order_relaxed);

        if (idle_workers_ < task_queue_.size()) {
            workers_.emplace_back(&AsyncExecutor::worker_loop, this);
        }
    }
    queue_cv_.notify_one();
}

AsyncExecutor::Stats AsyncExecutor::get_stats() const {
    Stats stats;
    stats.submitted_tasks = submitted_tasks_.load(std::memory_order_relaxed);
    stats.completed_tasks = completed_tasks_.load(std::memory_order_relaxed);
    stats.failed_tasks = failed_tasks_.load(std::memory_order_relaxed);

    std::lock_guard<std::mutex> lock(queue_mutex_);
    stats.pending_tasks = task_queue_.size();
    stats.worker_count = workers_.size();
    stats.idle_workers = idle_workers_;
    return stats;
}

void AsyncExecutor::reset_stats() {
    submitted_tasks_.store(0, std::memory_order_relaxed);
    completed_tasks_.store(0, std::memory_order_relaxed);
    failed_tasks_.store(0, std::memory_order_relaxed);
}

void AsyncExecutor::worker_loop() {
    for (;;) {
        Task task;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            ++idle_workers_;
            queue_cv_.wait(lock, [this] {
                return !task_queue_.empty() || !running_.load(std::memory_order_acquire);
            });
            --idle_workers_;

            if (task_queue_.empty()) {
                break; // stopped and drained
            }

            task = std::move(task_queue_.front());
            task_queue_.pop();
        }

        try {
            task.work();
            completed_tasks_.fetch_add(1, std::memory_order_relaxed);
        } catch (const std::exception& e) {
            failed_tasks_.fetch_add(1, std::memory_order_relaxed);
            LOG_ERROR("Exception in executor task: ", e.what());
        }
    }
}

AsyncExecutor& global_async_executor() {
    // Logger must be constructed first so it outlives the executor at exit
    Logger::instance();
    static AsyncExecutor executor;
    static bool initialized = executor.initialize();
    (void)initialized;
    return executor;
}

} // namespace common
} // namespace memoflow
