#pragma once

/**
 * Line-delimited JSON decoding for worker output
 *
 * Framing and parsing are split into three pull-based layers:
 *   LineBuffer     - bytes in, complete lines out (no I/O)
 *   LineReader     - pulls bytes from a file descriptor into a LineBuffer
 *   JsonLineStream - pulls lines and yields parsed JSON values, skipping
 *                    blank and non-JSON lines
 *
 * Usage:
 *   LineReader reader(stdout_fd);
 *   JsonLineStream stream(reader, [](const std::string& line) { ... });
 *   while (auto message = stream.next()) {
 *       correlate(*message);
 *   }
 */

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

namespace mcpgw {
namespace rpc {

constexpr size_t DEFAULT_MAX_LINE_BYTES = 64 * 1024 * 1024;

class LineBuffer {
public:
    explicit LineBuffer(size_t max_line_bytes = DEFAULT_MAX_LINE_BYTES) : max_line_bytes_(max_line_bytes) {}

    void feed(const char* data, size_t len);
    void feed(const std::string& chunk) { feed(chunk.data(), chunk.size()); }

    /**
     * Pop the next complete line (terminator and trailing '\r' removed).
     */
    std::optional<std::string> pop_line();

    /**
     * Take whatever is left once the source is exhausted (a final line
     * without a terminator). Empty optional if nothing is buffered.
     */
    std::optional<std::string> take_remainder();

    size_t buffered() const { return buffer_.size() - consumed_; }

    // Lines dropped because they exceeded max_line_bytes
    uint64_t oversized_lines() const { return oversized_lines_; }

private:
    std::string buffer_;
    size_t consumed_ = 0;
    size_t scan_from_ = 0;
    size_t max_line_bytes_;
    bool skipping_ = false;
    uint64_t oversized_lines_ = 0;

    void compact();
};

class LineReader {
public:
    explicit LineReader(int fd, size_t max_line_bytes = DEFAULT_MAX_LINE_BYTES)
        : fd_(fd), buffer_(max_line_bytes) {}

    /**
     * Blocks until a full line is available. Returns nullopt once the
     * descriptor reaches EOF (after yielding any unterminated tail) or
     * fails with an unrecoverable error.
     */
    std::optional<std::string> next_line();

    /**
     * Also poll wake_fd; once it becomes readable the reader behaves as if
     * the descriptor hit EOF. Lets the owner stop a read that another
     * process keeps open.
     */
    void set_wake_fd(int wake_fd) { wake_fd_ = wake_fd; }

    bool at_eof() const { return eof_; }
    uint64_t oversized_lines() const { return buffer_.oversized_lines(); }

private:
    int fd_;
    int wake_fd_ = -1;
    LineBuffer buffer_;
    bool eof_ = false;

    bool wait_readable();
};

class JsonLineStream {
public:
    using DiscardCallback = std::function<void(const std::string& line)>;

    explicit JsonLineStream(LineReader& reader, DiscardCallback on_discard = nullptr)
        : reader_(reader), on_discard_(std::move(on_discard)) {}

    /**
     * Next parsed JSON value, or nullopt at end of stream.
     */
    std::optional<nlohmann::json> next();

    uint64_t discarded() const { return discarded_; }

private:
    LineReader& reader_;
    DiscardCallback on_discard_;
    uint64_t discarded_ = 0;
};

} // namespace rpc
} // namespace mcpgw
