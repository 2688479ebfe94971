#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstring>
#include <functional>
#include <string>
#include <thread>

namespace mcpgw {
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

/**
 * Parse a level name ("trace" .. "fatal"). Returns false for unknown names.
 */
inline bool parse_level(const std::string& name, LogLevel& out) {
    if (name == "trace") out = LogLevel::Trace;
    else if (name == "debug") out = LogLevel::Debug;
    else if (name == "info") out = LogLevel::Info;
    else if (name == "warn") out = LogLevel::Warn;
    else if (name == "error") out = LogLevel::Error;
    else if (name == "fatal") out = LogLevel::Fatal;
    else return false;
    return true;
}

// Category constants for the gateway
namespace LogCategory {
constexpr uint8_t System = 0;
constexpr uint8_t Worker = 1;
constexpr uint8_t Rpc = 2;
constexpr uint8_t Http = 3;
constexpr uint8_t WebSocket = 4;
constexpr uint8_t WorkerStderr = 5;
} // namespace LogCategory

inline const char* category_to_string(uint8_t category) {
    switch (category) {
    case LogCategory::System:
        return "system";
    case LogCategory::Worker:
        return "worker";
    case LogCategory::Rpc:
        return "rpc";
    case LogCategory::Http:
        return "http";
    case LogCategory::WebSocket:
        return "ws";
    case LogCategory::WorkerStderr:
        return "stderr";
    default:
        return "?";
    }
}

/**
 * Log Entry - Fixed size so the ring buffer never allocates
 */
struct alignas(64) LogEntry {
    uint64_t timestamp_ns; // 8 bytes
    LogLevel level;        // 1 byte
    uint8_t category;      // 1 byte
    uint16_t reserved;     // 2 bytes padding
    uint32_t thread_id;    // 4 bytes
    char message[240];     // 240 bytes (null-terminated, truncated)
    // Total: 256 bytes (four cache lines)

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
 * Single Producer, Single Consumer. AsyncLogger serializes its producers
 * so the buffer itself stays SPSC.
 */
template <size_t Capacity = 2048>
class alignas(64) LogRingBuffer {
public:
    static_assert((Capacity & (Capacity - 1)) == 0, "Capacity must be power of 2");

    LogRingBuffer() : head_(0), tail_(0) { std::memset(buffer_.data(), 0, sizeof(buffer_)); }

    bool try_push(const LogEntry& entry) {
        size_t head = head_.load(std::memory_order_relaxed);
        size_t next_head = (head + 1) & (Capacity - 1);

        if (next_head == tail_.load(std::memory_order_acquire)) {
            return false; // Buffer full
        }

        buffer_[head] = entry;
        head_.store(next_head, std::memory_order_release);
        return true;
    }

    bool try_pop(LogEntry& entry) {
        size_t tail = tail_.load(std::memory_order_relaxed);

        if (tail == head_.load(std::memory_order_acquire)) {
            return false; // Buffer empty
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
    alignas(64) std::array<LogEntry, Capacity> buffer_;
};

/**
 * Async Logger
 *
 * Callers format into a fixed entry and push it; a background thread
 * does the actual I/O. Worker reader threads, HTTP handler threads and
 * the WebSocket service loop all log through one instance, so pushes
 * are serialized with a short spin lock.
 *
 * Usage:
 *   AsyncLogger logger;
 *   logger.start();
 *   LOGF_INFO(logger, LogCategory::Worker, "worker %s ready", name);
 *   logger.stop();
 */
class AsyncLogger {
public:
    using OutputCallback = std::function<void(const LogEntry&)>;

    AsyncLogger() : running_(false), min_level_(LogLevel::Info), dropped_count_(0), total_logged_(0) {}

    ~AsyncLogger() { stop(); }

    // Non-copyable
    AsyncLogger(const AsyncLogger&) = delete;
    AsyncLogger& operator=(const AsyncLogger&) = delete;

    /**
     * Start the background consumer thread
     */
    void start() {
        if (running_.exchange(true))
            return; // Already running

        consumer_thread_ = std::thread([this]() { consume_loop(); });
    }

    /**
     * Stop the logger and flush remaining entries
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
        if (level < min_level_.load(std::memory_order_relaxed))
            return;

        LogEntry entry;
        entry.timestamp_ns = get_timestamp_ns();
        entry.level = level;
        entry.category = category;
        entry.reserved = 0;
        entry.thread_id = get_thread_id();
        entry.set_message(message);

        while (producer_lock_.test_and_set(std::memory_order_acquire)) {
            std::this_thread::yield(); // holder may be preempted
        }
        bool pushed = buffer_.try_push(entry);
        producer_lock_.clear(std::memory_order_release);

        if (!pushed) {
            dropped_count_.fetch_add(1, std::memory_order_relaxed);
        } else {
            total_logged_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    /**
     * Log with printf-style formatting
     */
    template <typename... Args>
    void logf(LogLevel level, uint8_t category, const char* fmt, Args... args) {
        if (level < min_level_.load(std::memory_order_relaxed))
            return;

        char buffer[sizeof(LogEntry::message)];
        std::snprintf(buffer, sizeof(buffer), fmt, args...);
        log(level, category, buffer);
    }

    bool enabled(LogLevel level) const { return level >= min_level_.load(std::memory_order_relaxed); }

    void set_min_level(LogLevel level) { min_level_.store(level, std::memory_order_relaxed); }
    LogLevel min_level() const { return min_level_.load(std::memory_order_relaxed); }

    // Must be installed before start()
    void set_output_callback(OutputCallback cb) { output_callback_ = std::move(cb); }

    // Statistics
    uint64_t dropped_count() const { return dropped_count_.load(); }
    uint64_t total_logged() const { return total_logged_.load(); }
    size_t pending_count() const { return buffer_.size(); }

private:
    LogRingBuffer<2048> buffer_;
    std::atomic<bool> running_;
    std::atomic_flag producer_lock_ = ATOMIC_FLAG_INIT;
    std::thread consumer_thread_;
    std::atomic<LogLevel> min_level_;
    OutputCallback output_callback_;

    std::atomic<uint64_t> dropped_count_;
    std::atomic<uint64_t> total_logged_;

    void consume_loop() {
        LogEntry entry;
        while (running_.load(std::memory_order_relaxed)) {
            while (buffer_.try_pop(entry)) {
                output_entry(entry);
            }
            std::this_thread::sleep_for(std::chrono::microseconds(500));
        }
    }

    void output_entry(const LogEntry& entry) {
        if (output_callback_) {
            output_callback_(entry);
        } else {
            auto ts_ms = entry.timestamp_ns / 1000000;
            std::fprintf(stderr, "[%lu.%03lu] [%s] [%s] %s\n", static_cast<unsigned long>(ts_ms / 1000),
                         static_cast<unsigned long>(ts_ms % 1000), level_to_string(entry.level),
                         category_to_string(entry.category), entry.message);
        }
    }

    static uint64_t get_timestamp_ns() {
        auto now = std::chrono::system_clock::now();
        return std::chrono::duration_cast<std::chrono::nanoseconds>(now.time_since_epoch()).count();
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

// Convenience macros
#define LOG_TRACE(logger, cat, msg) (logger).log(mcpgw::logging::LogLevel::Trace, cat, msg)
#define LOG_DEBUG(logger, cat, msg) (logger).log(mcpgw::logging::LogLevel::Debug, cat, msg)
#define LOG_INFO(logger, cat, msg) (logger).log(mcpgw::logging::LogLevel::Info, cat, msg)
#define LOG_WARN(logger, cat, msg) (logger).log(mcpgw::logging::LogLevel::Warn, cat, msg)
#define LOG_ERROR(logger, cat, msg) (logger).log(mcpgw::logging::LogLevel::Error, cat, msg)

// Printf-style variants
#define LOGF_DEBUG(logger, cat, fmt, ...) (logger).logf(mcpgw::logging::LogLevel::Debug, cat, fmt, ##__VA_ARGS__)
#define LOGF_INFO(logger, cat, fmt, ...) (logger).logf(mcpgw::logging::LogLevel::Info, cat, fmt, ##__VA_ARGS__)
#define LOGF_WARN(logger, cat, fmt, ...) (logger).logf(mcpgw::logging::LogLevel::Warn, cat, fmt, ##__VA_ARGS__)
#define LOGF_ERROR(logger, cat, fmt, ...) (logger).logf(mcpgw::logging::LogLevel::Error, cat, fmt, ##__VA_ARGS__)

} // namespace logging
} // namespace mcpgw
