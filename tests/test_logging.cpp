/**
 * Unit tests for the logger
 *
 * Tests:
 * - Level filtering and parsing
 * - Text and JSON line formats
 * - Async worker flush and bounded queue
 * - Concurrent writers
 */

#include "common/logging.h"
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

using namespace memoflow::common;

namespace {

size_t count_lines(const std::string& text) {
    size_t lines = 0;
    for (char c : text) {
        if (c == '\n') {
            ++lines;
        }
    }
    return lines;
}

} // namespace

class LoggingTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger& logger = Logger::instance();
        logger.set_level(LogLevel::INFO);
        logger.set_json_format(false);
        logger.set_output_stream(&output_);
    }

    void TearDown() override {
        Logger& logger = Logger::instance();
        logger.set_async_logging(false);
        logger.set_output_stream(nullptr);
        logger.set_json_format(false);
        logger.set_level(LogLevel::INFO);
    }

    std::string output() const { return output_.str(); }

    std::ostringstream output_;
};

TEST_F(LoggingTest, LevelFiltering) {
    Logger& logger = Logger::instance();

    EXPECT_FALSE(logger.is_enabled(LogLevel::DEBUG));
    EXPECT_FALSE(logger.is_debug_enabled());
    EXPECT_TRUE(logger.is_enabled(LogLevel::INFO));
    EXPECT_TRUE(logger.is_enabled(LogLevel::CRITICAL));

    logger.set_level(LogLevel::CRITICAL);
    EXPECT_EQ(logger.level(), LogLevel::CRITICAL);
    EXPECT_FALSE(logger.is_enabled(LogLevel::ERROR));
}

TEST_F(LoggingTest, ParseLogLevel) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::DEBUG);
    EXPECT_EQ(parse_log_level("WARNING"), LogLevel::WARN);
    EXPECT_EQ(parse_log_level("Critical"), LogLevel::CRITICAL);
    EXPECT_FALSE(parse_log_level("verbose").has_value());
}

TEST_F(LoggingTest, TextFormatAndModules) {
    LOG_INFO("entries=", 3, " evicted=", true);
    LOG_DEBUG("filtered out");
    LOG_MODULE_WARN("memo_cache", "recursion detected");

    std::string out = output();
    EXPECT_EQ(count_lines(out), 2u);
    EXPECT_NE(out.find("[INFO] [general] entries=3 evicted=1"), std::string::npos);
    EXPECT_NE(out.find("[WARN] [memo_cache] recursion detected"), std::string::npos);
    EXPECT_EQ(out.find("filtered out"), std::string::npos);
}

TEST_F(LoggingTest, JsonFormatEscapesFields) {
    Logger& logger = Logger::instance();
    logger.set_json_format(true);

    std::unordered_map<std::string, std::string> context = {
        {"fingerprint", "key\"with\"quotes"},
    };
    LOG_STRUCTURED(LogLevel::ERROR, "memo_cache", "line\nbreak\ttab", "CACHE_001", context);

    std::string out = output();
    EXPECT_NE(out.find("\"level\":\"ERROR\""), std::string::npos);
    EXPECT_NE(out.find("\"module\":\"memo_cache\""), std::string::npos);
    EXPECT_NE(out.find("\"message\":\"line\\nbreak\\ttab\""), std::string::npos);
    EXPECT_NE(out.find("\"error_code\":\"CACHE_001\""), std::string::npos);
    EXPECT_NE(out.find("\"fingerprint\":\"key\\\"with\\\"quotes\""), std::string::npos);
}

TEST_F(LoggingTest, AsyncFlushWritesEverything) {
    Logger& logger = Logger::instance();
    logger.set_async_logging(true);

    for (int i = 0; i < 100; ++i) {
        logger.log(LogLevel::INFO, "async message ", i);
    }
    logger.flush();

    EXPECT_EQ(count_lines(output()), 100u);
    EXPECT_NE(output().find("async message 99"), std::string::npos);
}

TEST_F(LoggingTest, AsyncQueueIsBounded) {
    Logger& logger = Logger::instance();
    logger.set_async_logging(true);

    for (int i = 0; i < 15000; ++i) { // More than the queue bound
        logger.log(LogLevel::INFO, "Stress test message ", i);
    }

    // Disabling drains whatever the queue still holds
    logger.set_async_logging(false);
    size_t lines = count_lines(output());
    EXPECT_GE(lines, 10000u);
    EXPECT_LE(lines, 15000u);
    EXPECT_NE(output().find("Stress test message 14999"), std::string::npos);
}

TEST_F(LoggingTest, ConcurrentWritersProduceWholeLines) {
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([t]() {
            for (int i = 0; i < 50; ++i) {
                LOG_MODULE_INFO("worker", "thread ", t, " message ", i);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(count_lines(output()), 200u);
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
