/**
 * Unit tests for the settlement executor
 *
 * Tests:
 * - Lifecycle (initialize/shutdown)
 * - Task execution and statistics
 * - Elastic growth with blocking tasks
 */

#include "common/async_executor.h"
#include "common/logging.h"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace memoflow::common;

class AsyncExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().set_level(LogLevel::CRITICAL);
    }

    void TearDown() override {
        Logger::instance().set_level(LogLevel::INFO);
    }
};

TEST_F(AsyncExecutorTest, LifecycleManagement) {
    AsyncExecutor executor;
    EXPECT_FALSE(executor.is_running());

    EXPECT_TRUE(executor.initialize());
    EXPECT_TRUE(executor.is_running());
    EXPECT_FALSE(executor.initialize()); // Already running

    executor.shutdown();
    EXPECT_FALSE(executor.is_running());
}

TEST_F(AsyncExecutorTest, SubmitBeforeInitializeThrows) {
    AsyncExecutor executor;
    EXPECT_THROW(executor.submit([] {}), std::runtime_error);
}

TEST_F(AsyncExecutorTest, RunsSubmittedTasks) {
    AsyncExecutor executor;
    executor.initialize();

    std::atomic<int> counter{0};
    for (int i = 0; i < 50; ++i) {
        executor.submit([&counter] { counter.fetch_add(1); });
    }

    executor.shutdown(); // drains the queue
    EXPECT_EQ(counter.load(), 50);

    auto stats = executor.get_stats();
    EXPECT_EQ(stats.submitted_tasks, 50u);
    EXPECT_EQ(stats.completed_tasks, 50u);
    EXPECT_EQ(stats.failed_tasks, 0u);
    EXPECT_EQ(stats.pending_tasks, 0u);
}

TEST_F(AsyncExecutorTest, ThrowingTaskIsCountedAndWorkerSurvives) {
    AsyncExecutor executor;
    executor.initialize();

    executor.submit([] { throw std::runtime_error("task failure"); });

    std::promise<void> done;
    executor.submit([&done] { done.set_value(); });
    EXPECT_EQ(done.get_future().wait_for(std::chrono::seconds(5)),
              std::future_status::ready);

    executor.shutdown();
    auto stats = executor.get_stats();
    EXPECT_EQ(stats.failed_tasks, 1u);
    EXPECT_EQ(stats.completed_tasks, 1u);
}

TEST_F(AsyncExecutorTest, BlockedTaskDoesNotStarveOthers) {
    AsyncExecutor executor;
    executor.initialize();

    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    executor.submit([gate] { gate.wait(); });

    std::promise<void> done;
    executor.submit([&done] { done.set_value(); });
    EXPECT_EQ(done.get_future().wait_for(std::chrono::seconds(5)),
              std::future_status::ready);

    EXPECT_GE(executor.get_stats().worker_count, 2u);

    release.set_value();
    executor.shutdown();
}

TEST_F(AsyncExecutorTest, EveryBlockedTaskGetsItsOwnWorker) {
    AsyncExecutor executor;
    executor.initialize();

    std::promise<void> release;
    std::shared_future<void> gate = release.get_future().share();
    std::atomic<int> started{0};
    for (int i = 0; i < 6; ++i) {
        executor.submit([gate, &started] {
            started.fetch_add(1);
            gate.wait();
        });
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    while (started.load() < 6 && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    EXPECT_EQ(started.load(), 6);
    EXPECT_GE(executor.get_stats().worker_count, 6u);

    release.set_value();
    executor.shutdown();
    EXPECT_EQ(executor.get_stats().completed_tasks, 6u);
}

TEST_F(AsyncExecutorTest, ResetStats) {
    AsyncExecutor executor;
    executor.initialize();
    executor.submit([] {});
    executor.shutdown();

    executor.reset_stats();
    auto stats = executor.get_stats();
    EXPECT_EQ(stats.submitted_tasks, 0u);
    EXPECT_EQ(stats.completed_tasks, 0u);
}

TEST_F(AsyncExecutorTest, GlobalExecutorIsRunning) {
    AsyncExecutor& global = global_async_executor();
    EXPECT_TRUE(global.is_running());
    EXPECT_EQ(&global, &global_async_executor());

    std::promise<int> result;
    global.submit([&result] { result.set_value(7); });
    EXPECT_EQ(result.get_future().get(), 7);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
