#include "../../include/rpc/line_decoder.hpp"

#include <cerrno>
#include <poll.h>
#include <unistd.h>

namespace mcpgw::rpc {

// =============================================================================
// LineBuffer
// =============================================================================

void LineBuffer::feed(const char* data, size_t len) {
    if (len == 0)
        return;
    compact();
    buffer_.append(data, len);
}

std::optional<std::string> LineBuffer::pop_line() {
    while (true) {
        size_t newline = buffer_.find('\n', scan_from_);
        if (newline == std::string::npos) {
            scan_from_ = buffer_.size();
            if (buffered() > max_line_bytes_) {
                // Drop the oversized prefix and keep discarding until the next terminator
                if (!skipping_)
                    oversized_lines_++;
                skipping_ = true;
                buffer_.clear();
                consumed_ = 0;
                scan_from_ = 0;
            }
            return std::nullopt;
        }

        size_t start = consumed_;
        consumed_ = newline + 1;
        scan_from_ = consumed_;

        if (skipping_) {
            skipping_ = false;
            continue;
        }

        size_t end = newline;
        if (end > start && buffer_[end - 1] == '\r')
            end--;
        return buffer_.substr(start, end - start);
    }
}

std::optional<std::string> LineBuffer::take_remainder() {
    if (buffered() == 0 || skipping_) {
        buffer_.clear();
        consumed_ = 0;
        scan_from_ = 0;
        skipping_ = false;
        return std::nullopt;
    }

    std::string rest = buffer_.substr(consumed_);
    buffer_.clear();
    consumed_ = 0;
    scan_from_ = 0;
    if (!rest.empty() && rest.back() == '\r')
        rest.pop_back();
    return rest;
}

void LineBuffer::compact() {
    if (consumed_ == 0)
        return;
    buffer_.erase(0, consumed_);
    scan_from_ -= consumed_;
    consumed_ = 0;
}

// =============================================================================
// LineReader
// =============================================================================

std::optional<std::string> LineReader::next_line() {
    char chunk[8192];

    while (true) {
        if (auto line = buffer_.pop_line())
            return line;

        if (eof_)
            return std::nullopt;

        if (!wait_readable()) {
            eof_ = true;
            return buffer_.take_remainder();
        }

        ssize_t n = ::read(fd_, chunk, sizeof(chunk));
        if (n > 0) {
            buffer_.feed(chunk, static_cast<size_t>(n));
            continue;
        }
        if (n < 0 && errno == EINTR)
            continue;

        eof_ = true;
        return buffer_.take_remainder();
    }
}

// False once only the wake descriptor is ready, or poll() fails for good
bool LineReader::wait_readable() {
    if (wake_fd_ < 0)
        return true;

    pollfd fds[2] = {{fd_, POLLIN, 0}, {wake_fd_, POLLIN, 0}};
    while (true) {
        int rc = ::poll(fds, 2, -1);
        if (rc < 0) {
            if (errno == EINTR)
                continue;
            return false;
        }
        // Pending data (or a hangup) wins over the wake signal
        if (fds[0].revents != 0)
            return true;
        return false;
    }
}

// =============================================================================
// JsonLineStream
// =============================================================================

std::optional<nlohmann::json> JsonLineStream::next() {
    while (auto line = reader_.next_line()) {
        if (line->find_first_not_of(" \t") == std::string::npos)
            continue;

        nlohmann::json value = nlohmann::json::parse(*line, nullptr, false);
        if (value.is_discarded()) {
            discarded_++;
            if (on_discard_)
                on_discard_(*line);
            continue;
        }
        return value;
    }
    return std::nullopt;
}

} // namespace mcpgw::rpc
