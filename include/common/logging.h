#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <iostream>
#include <mutex>
#include <optional>
#include <queue>
#include <sstream>
#include <string>
#include <thread>
#include <unordered_map>

namespace memoflow {
namespace common {

/**
 * @brief Logging levels for conditional debug output
 *
 * Debug logging should be disabled in release configurations; cache hit and
 * miss traces are emitted at DEBUG.
 */
enum class LogLevel {
    TRACE = 0,
    DEBUG = 1,
    INFO = 2,
    WARN = 3,
    ERROR = 4,
    CRITICAL = 5
};

/// Parse "TRACE".."CRITICAL" (case-insensitive)
std::optional<LogLevel> parse_log_level(const std::string& name);

/**
 * @brief Structured log entry for JSON logging
 */
struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    LogLevel level;
    std::string module;
    std::string thread_id;
    std::string message;
    std::string error_code;
    std::unordered_map<std::string, std::string> context;
};

/**
 * @brief Global logging configuration
 *
 * Thread-safe logging configuration that can be adjusted at runtime.
 * Hot paths should check is_enabled() before formatting strings.
 */
class Logger {
public:
    /// Get the singleton logger instance
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    /// Set current logging level
    void set_level(LogLevel level) noexcept {
        current_level_.store(static_cast<int>(level), std::memory_order_relaxed);
    }

    LogLevel level() const noexcept {
        return static_cast<LogLevel>(current_level_.load(std::memory_order_relaxed));
    }

    /// Enable/disable structured JSON logging
    void set_json_format(bool enabled) noexcept {
        json_format_.store(enabled, std::memory_order_relaxed);
    }

    /// Enable/disable async logging
    void set_async_logging(bool enabled) {
        if (enabled && !async_enabled_.load()) {
            start_async_worker();
        } else if (!enabled && async_enabled_.load()) {
            stop_async_worker();
        }
    }

    /// Redirect output; nullptr restores std::cout
    void set_output_stream(std::ostream* out) {
        std::lock_guard<std::mutex> lock(output_mutex_);
        output_ = out ? out : &std::cout;
    }

    /// Check if debug logging is enabled
    bool is_debug_enabled() const noexcept {
        return current_level_.load(std::memory_order_relaxed) <= static_cast<int>(LogLevel::DEBUG);
    }

    /// Check if a specific level is enabled
    bool is_enabled(LogLevel level) const noexcept {
        return static_cast<int>(level) >= current_level_.load(std::memory_order_relaxed);
    }

    /// Log a simple message under the "general" module
    template<typename... Args>
    void log(LogLevel level, Args&&... args) {
        if (!is_enabled(level)) return;

        std::ostringstream oss;
        (oss << ... << args);
        emit(level, "general", oss.str());
    }

    /// Log with explicit module (preferred)
    template<typename... Args>
    void log_to(LogLevel level, const std::string& module, Args&&... args) {
        if (!is_enabled(level)) return;

        std::ostringstream oss;
        (oss << ... << args);
        emit(level, module, oss.str());
    }

    /// Log a structured message with context
    void log_structured(LogLevel level, const std::string& module,
                       const std::string& message, const std::string& error_code = "",
                       const std::unordered_map<std::string, std::string>& context = {}) {
        if (!is_enabled(level)) return;

        LogEntry entry{
            std::chrono::system_clock::now(),
            level,
            module,
            get_thread_id(),
            message,
            error_code,
            context
        };

        process_log_entry(entry);
    }

    /// Flush pending async entries (no-op in synchronous mode)
    void flush();

    std::string format_json(const LogEntry& entry) const;
    std::string format_text(const LogEntry& entry) const;
    std::string level_to_string(LogLevel level) const;

private:
    Logger() : current_level_(static_cast<int>(LogLevel::INFO)),
               json_format_(false), async_enabled_(false), worker_shutdown_(false),
               output_(&std::cout) {}

    ~Logger() {
        stop_async_worker();
    }

    std::atomic<int> current_level_;
    std::atomic<bool> json_format_;
    std::atomic<bool> async_enabled_;
    std::atomic<bool> worker_shutdown_;

    // Async logging support with bounded queue
    static const size_t MAX_QUEUE_SIZE = 10000;
    std::queue<LogEntry> log_queue_;
    std::mutex queue_mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable drained_cv_;
    bool writing_ = false;
    std::thread worker_thread_;

    std::mutex output_mutex_;
    std::ostream* output_;

    void emit(LogLevel level, const std::string& module, std::string message) {
        LogEntry entry{
            std::chrono::system_clock::now(),
            level,
            module,
            get_thread_id(),
            std::move(message),
            "",
            {}
        };

        process_log_entry(entry);
    }

    void process_log_entry(const LogEntry& entry) {
        if (async_enabled_.load()) {
            {
                std::lock_guard<std::mutex> lock(queue_mutex_);
                // Drop oldest entries if queue is full
                if (log_queue_.size() >= MAX_QUEUE_SIZE) {
                    log_queue_.pop();
                }
                log_queue_.push(entry);
            }
            queue_cv_.notify_one();
        } else {
            output_log_entry(entry);
        }
    }

    void output_log_entry(const LogEntry& entry);

    std::string get_thread_id() const;
    std::string escape_json_string(const std::string& input) const;

    void start_async_worker();
    void stop_async_worker();
    void worker_loop();
};

} // namespace common
} // namespace memoflow

/**
 * @brief Performance-conscious logging macros
 *
 * These macros avoid string formatting overhead when logging is disabled.
 */
#define LOG_TRACE(...) \
    do { \
        if (memoflow::common::Logger::instance().is_enabled(memoflow::common::LogLevel::TRACE)) { \
            memoflow::common::Logger::instance().log(memoflow::common::LogLevel::TRACE, __VA_ARGS__); \
        } \
    } while(0)

#define LOG_DEBUG(...) \
    do { \
        if (memoflow::common::Logger::instance().is_debug_enabled()) { \
            memoflow::common::Logger::instance().log(memoflow::common::LogLevel::DEBUG, __VA_ARGS__); \
        } \
    } while(0)

#define LOG_INFO(...) \
    memoflow::common::Logger::instance().log(memoflow::common::LogLevel::INFO, __VA_ARGS__)

#define LOG_WARN(...) \
    memoflow::common::Logger::instance().log(memoflow::common::LogLevel::WARN, __VA_ARGS__)

#define LOG_ERROR(...) \
    memoflow::common::Logger::instance().log(memoflow::common::LogLevel::ERROR, __VA_ARGS__)

#define LOG_CRITICAL(...) \
    memoflow::common::Logger::instance().log(memoflow::common::LogLevel::CRITICAL, __VA_ARGS__)

/**
 * @brief Module-aware logging macros
 */
#define LOG_MODULE_DEBUG(module, ...) \
    do { \
        if (memoflow::common::Logger::instance().is_debug_enabled()) { \
            memoflow::common::Logger::instance().log_to(memoflow::common::LogLevel::DEBUG, module, __VA_ARGS__); \
        } \
    } while(0)

#define LOG_MODULE_INFO(module, ...) \
    memoflow::common::Logger::instance().log_to(memoflow::common::LogLevel::INFO, module, __VA_ARGS__)

#define LOG_MODULE_WARN(module, ...) \
    memoflow::common::Logger::instance().log_to(memoflow::common::LogLevel::WARN, module, __VA_ARGS__)

#define LOG_MODULE_ERROR(module, ...) \
    memoflow::common::Logger::instance().log_to(memoflow::common::LogLevel::ERROR, module, __VA_ARGS__)

#define LOG_STRUCTURED(level, module, message, ...) \
    memoflow::common::Logger::instance().log_structured(level, module, message, ##__VA_ARGS__)
