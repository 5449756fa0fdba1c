#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <functional>
#include <string>
#include <thread>

namespace fxsig {
namespace logging {

/**
 * Log Level
 */
enum class LogLevel : uint8_t { Trace = 0, Debug = 1, Info = 2, Warn = 3, Error = 4, Fatal = 5 };

inline const char* level_to_string(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "TRACE";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO ";
    case LogLevel::Warn:
        return "WARN ";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Fatal:
        return "FATAL";
    default:
        return "?????";
    }
}

// Category constants for the signal engine
namespace LogCategory {
constexpr uint8_t System = 0;
constexpr uint8_t Data = 1;
constexpr uint8_t Signal = 2;
constexpr uint8_t Trade = 3;
constexpr uint8_t Store = 4;
constexpr uint8_t External = 5;
constexpr uint8_t Backtest = 6;
} // namespace LogCategory

inline const char* category_to_string(uint8_t category) {
    switch (category) {
    case LogCategory::System:
        return "system";
    case LogCategory::Data:
        return "data";
    case LogCategory::Signal:
        return "signal";
    case LogCategory::Trade:
        return "trade";
    case LogCategory::Store:
        return "store";
    case LogCategory::External:
        return "external";
    case LogCategory::Backtest:
        return "backtest";
    default:
        return "?";
    }
}

/**
 * Log Entry - fixed size, four cache lines
 */
struct alignas(64) LogEntry {
    int64_t timestamp_ms; // wall clock, 8 bytes
    LogLevel level;       // 1 byte
    uint8_t category;     // 1 byte
    uint16_t reserved;    // 2 bytes padding
    uint32_t thread_id;   // 4 bytes
    char message[240];    // null-terminated, truncated if longer

    void set_message(const char* msg) {
        size_t len = std::strlen(msg);
        if (len >= sizeof(message))
            len = sizeof(message) - 1;
        std::memcpy(message, msg, len);
        message[len] = '\0';
    }
};
static_assert(sizeof(LogEntry) == 256, "LogEntry must be 256 bytes");

/**
 * Lock-Free SPSC Ring Buffer
 *
 * One producer (the engine thread), one consumer (the logger thread).
 */
template <size_t Capacity = 4096>
class alignas(64) LogRingBuffer {
public:
    static_assert((Capacity & (Capacity - 1)) == 0, "Capacity must be power of 2");

    LogRingBuffer() : head_(0), tail_(0) {}

    // Returns false if the buffer is full
    bool try_push(const LogEntry& entry) {
        size_t head = head_.load(std::memory_order_relaxed);
        size_t next_head = (head + 1) & (Capacity - 1);

        if (next_head == tail_.load(std::memory_order_acquire)) {
            return false;
        }

        buffer_[head] = entry;
        head_.store(next_head, std::memory_order_release);
        return true;
    }

    // Returns false if the buffer is empty
    bool try_pop(LogEntry& entry) {
        size_t tail = tail_.load(std::memory_order_relaxed);

        if (tail == head_.load(std::memory_order_acquire)) {
            return false;
        }

        entry = buffer_[tail];
        tail_.store((tail + 1) & (Capacity - 1), std::memory_order_release);
        return true;
    }

    size_t size() const {
        size_t head = head_.load(std::memory_order_acquire);
        size_t tail = tail_.load(std::memory_order_acquire);
        return (head - tail + Capacity) & (Capacity - 1);
    }

    bool empty() const { return head_.load(std::memory_order_acquire) == tail_.load(std::memory_order_acquire); }

private:
    alignas(64) std::atomic<size_t> head_;
    alignas(64) std::atomic<size_t> tail_;
    alignas(64) std::array<LogEntry, Capacity> buffer_{};
};

/**
 * Async Logger
 *
 * After start(), log calls only enqueue and a background thread does
 * the I/O. Before start() (tests, one-shot tools) entries are written
 * synchronously on the calling thread.
 *
 * The output callback and minimum level are set before start().
 *
 * Usage:
 *   auto& logger = global_logger();
 *   logger.start();
 *   LOGF_INFO(Trade, "Opened %s @ %.5f", id.c_str(), entry);
 *   logger.stop();
 */
class AsyncLogger {
public:
    using OutputCallback = std::function<void(const LogEntry&)>;

    AsyncLogger() : running_(false), min_level_(LogLevel::Info), dropped_count_(0), total_logged_(0) {}

    ~AsyncLogger() { stop(); }

    AsyncLogger(const AsyncLogger&) = delete;
    AsyncLogger& operator=(const AsyncLogger&) = delete;

    void start() {
        if (running_.exchange(true))
            return;

        consumer_thread_ = std::thread([this]() { consume_loop(); });
    }

    /**
     * Stop the consumer thread and flush remaining entries
     */
    void stop() {
        if (running_.exchange(false)) {
            if (consumer_thread_.joinable()) {
                consumer_thread_.join();
            }
        }

        LogEntry entry;
        while (buffer_.try_pop(entry)) {
            output_entry(entry);
        }
    }

    void log(LogLevel level, uint8_t category, const char* message) {
        if (level < min_level_)
            return;

        LogEntry entry;
        entry.timestamp_ms = get_timestamp_ms();
        entry.level = level;
        entry.category = category;
        entry.reserved = 0;
        entry.thread_id = get_thread_id();
        entry.set_message(message);

        total_logged_.fetch_add(1, std::memory_order_relaxed);

        if (!running_.load(std::memory_order_acquire)) {
            output_entry(entry);
            return;
        }

        if (!buffer_.try_push(entry)) {
            dropped_count_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    void log(LogLevel level, uint8_t category, const std::string& message) { log(level, category, message.c_str()); }

    /**
     * Log with printf-style formatting
     */
    template <typename... Args>
    void logf(LogLevel level, uint8_t category, const char* fmt, Args... args) {
        if (level < min_level_)
            return;

        char buffer[sizeof(LogEntry::message)];
        std::snprintf(buffer, sizeof(buffer), fmt, args...);
        log(level, category, buffer);
    }

    void set_min_level(LogLevel level) { min_level_ = level; }
    LogLevel min_level() const { return min_level_; }
    void set_output_callback(OutputCallback cb) { output_callback_ = std::move(cb); }

    bool running() const { return running_.load(); }
    uint64_t dropped_count() const { return dropped_count_.load(); }
    uint64_t total_logged() const { return total_logged_.load(); }
    size_t pending_count() const { return buffer_.size(); }

private:
    LogRingBuffer<4096> buffer_;
    std::atomic<bool> running_;
    std::thread consumer_thread_;
    LogLevel min_level_;
    OutputCallback output_callback_;

    std::atomic<uint64_t> dropped_count_;
    std::atomic<uint64_t> total_logged_;

    void consume_loop() {
        LogEntry entry;
        while (running_.load(std::memory_order_relaxed)) {
            while (buffer_.try_pop(entry)) {
                output_entry(entry);
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
    }

    void output_entry(const LogEntry& entry) {
        if (output_callback_) {
            output_callback_(entry);
            return;
        }

        std::time_t secs = static_cast<std::time_t>(entry.timestamp_ms / 1000);
        std::tm tm{};
        gmtime_r(&secs, &tm);
        char ts[32];
        std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm);
        std::fprintf(stderr, "%s.%03d [%s] [%s] %s\n", ts, static_cast<int>(entry.timestamp_ms % 1000),
                     level_to_string(entry.level), category_to_string(entry.category), entry.message);
    }

    static int64_t get_timestamp_ms() {
        auto now = std::chrono::system_clock::now();
        return std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
    }

    static uint32_t get_thread_id() {
        static thread_local uint32_t id = 0;
        if (id == 0) {
            std::hash<std::thread::id> hasher;
            id = static_cast<uint32_t>(hasher(std::this_thread::get_id()));
        }
        return id;
    }
};

/**
 * Process-wide logger used by the library and tools
 */
inline AsyncLogger& global_logger() {
    static AsyncLogger logger;
    return logger;
}

// Convenience macros, category is one of the LogCategory names
#define LOG_DEBUG(cat, msg) fxsig::logging::global_logger().log(fxsig::logging::LogLevel::Debug, fxsig::logging::LogCategory::cat, msg)
#define LOG_INFO(cat, msg) fxsig::logging::global_logger().log(fxsig::logging::LogLevel::Info, fxsig::logging::LogCategory::cat, msg)
#define LOG_WARN(cat, msg) fxsig::logging::global_logger().log(fxsig::logging::LogLevel::Warn, fxsig::logging::LogCategory::cat, msg)
#define LOG_ERROR(cat, msg) fxsig::logging::global_logger().log(fxsig::logging::LogLevel::Error, fxsig::logging::LogCategory::cat, msg)

// Printf-style variants
#define LOGF_DEBUG(cat, fmt, ...) fxsig::logging::global_logger().logf(fxsig::logging::LogLevel::Debug, fxsig::logging::LogCategory::cat, fmt, ##__VA_ARGS__)
#define LOGF_INFO(cat, fmt, ...) fxsig::logging::global_logger().logf(fxsig::logging::LogLevel::Info, fxsig::logging::LogCategory::cat, fmt, ##__VA_ARGS__)
#define LOGF_WARN(cat, fmt, ...) fxsig::logging::global_logger().logf(fxsig::logging::LogLevel::Warn, fxsig::logging::LogCategory::cat, fmt, ##__VA_ARGS__)
#define LOGF_ERROR(cat, fmt, ...) fxsig::logging::global_logger().logf(fxsig::logging::LogLevel::Error, fxsig::logging::LogCategory::cat, fmt, ##__VA_ARGS__)

} // namespace logging
} // namespace fxsig
