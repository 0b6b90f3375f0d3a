/**
 * Ring-buffer logging implementation
 */

#include <algorithm>
#include <cstring>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>

#include "trend_engine/common/logging.h"

namespace trend_engine {
namespace common {

namespace {

constexpr const char* LEVEL_NAMES[] = {"DEBUG", "INFO", "WARNING", "ERROR", "CRITICAL"};

// Timestamp is published last so the flush thread never reads a partial entry
void fillEntry(LogEntry& entry, LogLevel level, const std::string& message, uint64_t now_ns) {
    entry.level = level;
    entry.thread_id = static_cast<uint32_t>(std::hash<std::thread::id>{}(std::this_thread::get_id()));

    size_t length = std::min(message.size(), sizeof(entry.message) - 1);
    std::memcpy(entry.message, message.data(), length);
    entry.message[length] = '\0';

    entry.timestamp.store(now_ns, std::memory_order_release);
}

} // namespace

Logger g_logger("trend_engine");

Logger::Logger(const std::string& name, LogLevel level)
    : name_(name),
      level_(level) {
}

Logger::~Logger() {
    running_ = false;
    if (flush_thread_.joinable()) {
        flush_thread_.join();
    }

    flush();
    if (file_.is_open()) {
        file_.close();
    }
}

void Logger::log(LogLevel level, const std::string& message) {
    if (level < level_.load()) {
        return;
    }

    // Unbuffered until a file is opened
    if (!buffered_.load()) {
        LogEntry entry;
        fillEntry(entry, level, message, getCurrentNanoTime());

        std::lock_guard<std::mutex> lock(io_mutex_);
        writeEntry(std::cerr, entry);
        return;
    }

    LogEntry& slot = buffer_[write_index_.fetch_add(1) % BUFFER_SIZE];
    fillEntry(slot, level, message, getCurrentNanoTime());
}

void Logger::setLevel(const std::string& level_str) {
    setLevel(stringToLogLevel(level_str));
}

void Logger::setLevel(LogLevel level) {
    level_ = level;
}

void Logger::open(const std::string& path, int flush_interval_ms) {
    std::lock_guard<std::mutex> lock(io_mutex_);

    if (file_.is_open()) {
        file_.close();
    }

    file_.open(path, std::ios::out | std::ios::app);
    if (!file_.is_open()) {
        std::cerr << "Unable to open log file " << path << ", logging to stderr" << std::endl;
        return;
    }

    flush_interval_ms_ = flush_interval_ms > 0 ? flush_interval_ms : 1000;
    read_index_ = write_index_.load();
    buffered_ = true;

    if (!running_.exchange(true)) {
        flush_thread_ = std::thread(&Logger::flushThreadFunc, this);
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(io_mutex_);
    if (!file_.is_open()) {
        return;
    }

    size_t end = write_index_.load();

    // Entries overwritten since the last flush are lost
    if (end - read_index_ > BUFFER_SIZE) {
        read_index_ = end - BUFFER_SIZE;
    }

    for (; read_index_ < end; ++read_index_) {
        LogEntry& entry = buffer_[read_index_ % BUFFER_SIZE];

        // Reserved but not yet filled: resume here on the next flush
        if (entry.timestamp.load(std::memory_order_acquire) == 0) {
            break;
        }

        writeEntry(file_, entry);
        entry.timestamp.store(0, std::memory_order_release);
    }

    file_.flush();
}

void Logger::writeEntry(std::ostream& out, const LogEntry& entry) {
    auto since_epoch = std::chrono::nanoseconds(entry.timestamp.load(std::memory_order_acquire));
    std::time_t seconds = std::chrono::duration_cast<std::chrono::seconds>(since_epoch).count();
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count() % 1000;

    std::tm local_tm{};
    localtime_r(&seconds, &local_tm);

    out << std::put_time(&local_tm, "%Y-%m-%d %H:%M:%S") << "."
        << std::setfill('0') << std::setw(3) << millis << std::setfill(' ')
        << " [" << logLevelToString(entry.level) << "] [" << name_ << "] [" << entry.thread_id << "] "
        << entry.message << '\n';
}

LogLevel Logger::stringToLogLevel(const std::string& level_str) {
    for (size_t i = 0; i < sizeof(LEVEL_NAMES) / sizeof(LEVEL_NAMES[0]); ++i) {
        if (level_str == LEVEL_NAMES[i]) {
            return static_cast<LogLevel>(i);
        }
    }
    return LogLevel::INFO;
}

const char* Logger::logLevelToString(LogLevel level) {
    size_t index = static_cast<size_t>(level);
    return index < sizeof(LEVEL_NAMES) / sizeof(LEVEL_NAMES[0]) ? LEVEL_NAMES[index] : "UNKNOWN";
}

void Logger::flushThreadFunc() {
    while (running_) {
        flush();
        std::this_thread::sleep_for(std::chrono::milliseconds(flush_interval_ms_));
    }
}

uint64_t Logger::getCurrentNanoTime() {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace common
} // namespace trend_engine
