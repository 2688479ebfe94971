#pragma once

/**
 * DispatchGate - bounded admission for listener dispatch threads
 *
 * try_enter() admits at most `limit` concurrent holders and nothing once
 * close() has been called; leave() releases a slot. wait_idle() blocks
 * until every admitted holder has left.
 *
 * Shutdown order with the supervisor:
 *   gate.close();          // new messages are refused
 *   supervisor.shutdown(); // pending worker calls are rejected
 *   gate.wait_idle(...);   // admitted dispatches finish promptly
 */

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace mcpgw {
namespace transport {

class DispatchGate {
public:
    explicit DispatchGate(size_t limit) : limit_(limit) {}

    DispatchGate(const DispatchGate&) = delete;
    DispatchGate& operator=(const DispatchGate&) = delete;

    bool try_enter() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_ || in_flight_ >= limit_)
            return false;
        ++in_flight_;
        return true;
    }

    // Notifies under the lock: a waiter may destroy the gate once idle
    void leave() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (in_flight_ > 0)
            --in_flight_;
        cv_.notify_all();
    }

    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }

    void reopen() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = false;
    }

    void wait_idle() {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this]() { return in_flight_ == 0; });
    }

    // True if idle before the timeout
    bool wait_idle(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_for(lock, timeout, [this]() { return in_flight_ == 0; });
    }

    bool is_closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t in_flight() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return in_flight_;
    }

    size_t limit() const { return limit_; }

private:
    const size_t limit_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    size_t in_flight_ = 0;
    bool closed_ = false;
};

} // namespace transport
} // namespace mcpgw
