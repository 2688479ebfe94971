#pragma once

/**
 * WorkerProcess - one capability provider running as a child process
 *
 * Speaks line-delimited JSON-RPC 2.0: requests are written to the child's
 * stdin, responses are read from its stdout by a dedicated reader thread
 * and matched to waiting callers by id. stderr is drained by a second
 * thread into the log and never parsed. A third thread waits for the
 * child to exit, independently of whether its stdout ever closes.
 *
 * State machine:
 *   NotReady -> Handshaking -> Ready
 *   Ready    -> Exited       (unexpected exit, terminal)
 *   *        -> Terminated   (after terminate() completes)
 *
 * Owned exclusively by WorkerSupervisor; nothing else writes to its pipes.
 */

#include "pending_table.hpp"
#include "worker_descriptor.hpp"
#include "../logging/async_logger.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <sys/types.h>
#include <thread>

namespace mcpgw {
namespace worker {

enum class WorkerState : uint8_t { NotReady = 0, Handshaking = 1, Ready = 2, Exited = 3, Terminated = 4 };

inline const char* state_to_string(WorkerState state) {
    switch (state) {
    case WorkerState::NotReady:
        return "not_ready";
    case WorkerState::Handshaking:
        return "handshaking";
    case WorkerState::Ready:
        return "ready";
    case WorkerState::Exited:
        return "exited";
    case WorkerState::Terminated:
        return "terminated";
    default:
        return "unknown";
    }
}

/**
 * Capability lists discovered during the handshake. Written once before
 * the worker becomes Ready, read-only afterwards.
 */
struct CapabilitySet {
    json tools = json::array();
    json resources = json::array();
    json prompts = json::array();
};

class WorkerProcess {
public:
    // Called from the exit waiter thread when the child exits without terminate()
    using ExitCallback = std::function<void(WorkerProcess& worker, int exit_code, int signal)>;

    WorkerProcess(WorkerDescriptor descriptor, size_t max_pending, logging::AsyncLogger& logger);
    ~WorkerProcess();

    WorkerProcess(const WorkerProcess&) = delete;
    WorkerProcess& operator=(const WorkerProcess&) = delete;

    /**
     * Fork/exec the child and start the reader threads.
     * Throws RpcError(MCP_BRIDGE_ERROR) if the command cannot be started.
     */
    void spawn();

    /**
     * Write one request and wait for the response with the same id, up to
     * the descriptor's timeout. Returns the full response envelope (result
     * or error). Throws RpcError on timeout, write failure, exit, or when
     * the pending cap is reached.
     */
    json send_request(const json& request);

    /// Fire-and-forget message without an id
    void send_notification(const json& notification);

    /**
     * Two-phase stop: close stdin and SIGTERM, wait up to grace, then
     * SIGKILL. Rejects anything still pending. Safe to call repeatedly.
     */
    void terminate(std::chrono::milliseconds grace);

    /// Wait for the child to exit. True if it has exited.
    bool wait_for_exit(std::chrono::milliseconds timeout);

    void set_exit_callback(ExitCallback cb) { exit_callback_ = std::move(cb); }

    // =========================================================================
    // State
    // =========================================================================

    const std::string& name() const { return descriptor_.name; }
    const WorkerDescriptor& descriptor() const { return descriptor_; }

    WorkerState state() const { return state_.load(std::memory_order_acquire); }
    void set_state(WorkerState state) { state_.store(state, std::memory_order_release); }
    bool is_ready() const { return state() == WorkerState::Ready; }

    /// Atomic from -> to; fails if the state moved (e.g. the child exited)
    bool transition(WorkerState from, WorkerState to) {
        return state_.compare_exchange_strong(from, to, std::memory_order_acq_rel);
    }

    pid_t pid() const { return pid_.load(); }
    bool has_exited() const { return exited_.load(std::memory_order_acquire); }
    int exit_code() const { return exit_code_; }
    int exit_signal() const { return exit_signal_; }

    size_t pending_count() const { return pending_.size(); }
    uint64_t discarded_lines() const { return discarded_lines_.load(std::memory_order_relaxed); }
    uint64_t late_responses() const { return late_responses_.load(std::memory_order_relaxed); }
    uint64_t timeouts() const { return timeouts_.load(std::memory_order_relaxed); }

    /**
     * Store the discovered capability lists. Called once by the supervisor
     * at the end of the handshake; readers check capabilities_published()
     * and need no lock afterwards.
     */
    void publish_capabilities(CapabilitySet capabilities) {
        capabilities_ = std::move(capabilities);
        capabilities_published_.store(true, std::memory_order_release);
    }
    bool capabilities_published() const { return capabilities_published_.load(std::memory_order_acquire); }
    const CapabilitySet& capabilities() const { return capabilities_; }

private:
    WorkerDescriptor descriptor_;
    logging::AsyncLogger& logger_;
    PendingTable pending_;
    CapabilitySet capabilities_;
    std::atomic<bool> capabilities_published_{false};

    std::atomic<WorkerState> state_{WorkerState::NotReady};
    std::atomic<pid_t> pid_{-1};
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
    int wake_read_fd_ = -1;
    int wake_write_fd_ = -1;

    std::mutex write_mutex_;
    std::thread reader_thread_;
    std::thread stderr_thread_;
    std::thread waiter_thread_;

    std::mutex exit_mutex_;
    std::condition_variable exit_cv_;
    std::atomic<bool> exited_{false};
    std::atomic<bool> terminating_{false};
    bool output_closed_ = false;
    int exit_code_ = -1;
    int exit_signal_ = 0;

    std::mutex terminate_mutex_;
    ExitCallback exit_callback_;

    std::atomic<uint64_t> discarded_lines_{0};
    std::atomic<uint64_t> late_responses_{0};
    std::atomic<uint64_t> timeouts_{0};

    void write_line(const std::string& line);
    void close_stdin();
    void read_loop();
    void stderr_loop();
    void wait_loop();
    void wake_readers();
    void dispatch_message(const json& message);
    void on_exit(int status);
    void join_threads();
};

} // namespace worker
} // namespace mcpgw
