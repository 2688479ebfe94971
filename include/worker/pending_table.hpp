#pragma once

/**
 * PendingTable - request/response correlation for one worker
 *
 * Each in-flight request owns one slot keyed by its serialized id. A slot
 * leaves the table exactly once: through resolve() when the matching
 * response arrives, through remove() when the caller's deadline fires, or
 * through close() when the worker goes away. Whoever erases the slot under
 * the lock owns the outcome, so a response racing a timeout can never
 * resolve the caller twice.
 */

#include "../rpc/json_rpc.hpp"

#include <exception>
#include <future>
#include <mutex>
#include <string>
#include <unordered_map>

namespace mcpgw {
namespace worker {

using json = nlohmann::json;

/**
 * Correlation key for a JSON-RPC id. Numbers and strings never collide
 * because strings keep their quotes.
 */
inline std::string id_key(const json& id) {
    return id.dump();
}

class PendingTable {
public:
    explicit PendingTable(size_t capacity) : capacity_(capacity) {}

    PendingTable(const PendingTable&) = delete;
    PendingTable& operator=(const PendingTable&) = delete;

    /**
     * Register a slot. Throws RpcError when the table is closed, full, or
     * the key is already in flight.
     */
    std::future<json> add(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            throw rpc::RpcError(close_code_, close_message_);
        }
        if (slots_.size() >= capacity_) {
            throw rpc::RpcError(rpc::error_code::MCP_RATE_LIMIT_ERROR, "Too many pending requests",
                                json{{"limit", capacity_}});
        }
        if (slots_.count(key)) {
            throw rpc::RpcError(rpc::error_code::INVALID_REQUEST, "Duplicate request id " + key);
        }
        auto& promise = slots_[key];
        return promise.get_future();
    }

    /**
     * Complete a slot with a response. False if nothing was waiting for it
     * (unknown id, or the caller already timed out).
     */
    bool resolve(const std::string& key, json response) {
        std::promise<json> promise;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = slots_.find(key);
            if (it == slots_.end())
                return false;
            promise = std::move(it->second);
            slots_.erase(it);
        }
        promise.set_value(std::move(response));
        return true;
    }

    /**
     * Abandon a slot (deadline expired or the write failed). True if the
     * slot was still pending, i.e. the caller owns the failure.
     */
    bool remove(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        return slots_.erase(key) > 0;
    }

    /**
     * Reject everything in flight and refuse further adds.
     */
    size_t close(int code, const std::string& message) {
        std::unordered_map<std::string, std::promise<json>> drained;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!closed_) {
                closed_ = true;
                close_code_ = code;
                close_message_ = message;
            }
            drained.swap(slots_);
        }
        for (auto& [key, promise] : drained) {
            promise.set_exception(std::make_exception_ptr(rpc::RpcError(code, message)));
        }
        return drained.size();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return slots_.size();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t capacity() const { return capacity_; }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::promise<json>> slots_;
    size_t capacity_;
    bool closed_ = false;
    int close_code_ = rpc::error_code::MCP_BRIDGE_ERROR;
    std::string close_message_;
};

} // namespace worker
} // namespace mcpgw
