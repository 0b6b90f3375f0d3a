/**
 * Ring-buffer logging for the trend engine
 */

#pragma once

#include <string>
#include <fstream>
#include <thread>
#include <atomic>
#include <array>
#include <mutex>
#include <chrono>
#include <cstdint>

namespace trend_engine {
namespace common {

// Log levels
enum class LogLevel {
    DEBUG,
    INFO,
    WARNING,
    ERROR,
    CRITICAL
};

// Log entry structure (pre-allocated). A zero timestamp marks a free or
// half-written slot; writers publish it last with release ordering.
struct LogEntry {
    std::atomic<uint64_t> timestamp{0};   // Nanoseconds since epoch
    LogLevel level;
    uint32_t thread_id;
    char message[1024];       // Fixed-size message buffer
};

// Buffered logger. Until open() is called entries go straight to stderr.
class Logger {
public:
    Logger(const std::string& name, LogLevel level = LogLevel::INFO);
    ~Logger();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    // Log a message
    void log(LogLevel level, const std::string& message);

    // Set log level
    void setLevel(const std::string& level_str);
    void setLevel(LogLevel level);
    LogLevel getLevel() const { return level_.load(); }

    // Route entries to a file, flushed by a background thread
    void open(const std::string& path, int flush_interval_ms);

    // Flush pending entries to disk
    void flush();

    // Convert log level string to enum
    static LogLevel stringToLogLevel(const std::string& level_str);

    // Convert log level to string
    static const char* logLevelToString(LogLevel level);

private:
    // Pre-allocated ring buffer
    static constexpr size_t BUFFER_SIZE = 8192;
    std::array<LogEntry, BUFFER_SIZE> buffer_;
    std::atomic<size_t> write_index_{0};
    size_t read_index_ = 0;

    // Logger name
    std::string name_;

    // Current log level
    std::atomic<LogLevel> level_;

    // Output file
    std::ofstream file_;
    std::mutex io_mutex_;
    std::atomic<bool> buffered_{false};

    // Background thread for flushing
    std::thread flush_thread_;
    std::atomic<bool> running_{false};
    int flush_interval_ms_ = 1000;

    void writeEntry(std::ostream& out, const LogEntry& entry);

    // Background flush function
    void flushThreadFunc();

    // Get current timestamp in nanoseconds
    static uint64_t getCurrentNanoTime();
};

// Global logger instance
extern Logger g_logger;

// Convenience macros
#define LOG_DEBUG(message) ::trend_engine::common::g_logger.log(::trend_engine::common::LogLevel::DEBUG, message)
#define LOG_INFO(message) ::trend_engine::common::g_logger.log(::trend_engine::common::LogLevel::INFO, message)
#define LOG_WARNING(message) ::trend_engine::common::g_logger.log(::trend_engine::common::LogLevel::WARNING, message)
#define LOG_ERROR(message) ::trend_engine::common::g_logger.log(::trend_engine::common::LogLevel::ERROR, message)
#define LOG_CRITICAL(message) ::trend_engine::common::g_logger.log(::trend_engine::common::LogLevel::CRITICAL, message)

} // namespace common
} // namespace trend_engine
