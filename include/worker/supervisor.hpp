#pragma once

/**
 * WorkerSupervisor - owns every WorkerProcess of the gateway
 *
 * initialize() starts all workers concurrently and runs the handshake
 * (initialize, notifications/initialized, tools/list, then the optional
 * resources/list and prompts/list). Startup is all-or-nothing: if any
 * worker fails its mandatory steps, every worker that did start is shut
 * down again and initialize() throws naming the failing workers.
 *
 * After startup the supervisor forwards tool calls, resource reads and
 * prompt lookups, aggregates cached capabilities from Ready workers, and
 * reports per-worker status. A crashed worker is not restarted.
 */

#include "worker_process.hpp"
#include "../rpc/routing_table.hpp"
#include "../rpc/worker_backend.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace mcpgw {
namespace worker {

enum class HealthState : uint8_t { Healthy = 0, Degraded = 1, Unhealthy = 2 };

inline const char* health_to_string(HealthState health) {
    switch (health) {
    case HealthState::Healthy:
        return "healthy";
    case HealthState::Degraded:
        return "degraded";
    case HealthState::Unhealthy:
        return "unhealthy";
    default:
        return "unknown";
    }
}

struct SupervisorOptions {
    std::chrono::milliseconds shutdown_grace{5000};
    size_t max_pending_per_worker = 256;
};

class WorkerSupervisor : public rpc::IWorkerBackend {
public:
    using CrashCallback = std::function<void(const std::string& worker, int exit_code, int signal)>;

    WorkerSupervisor(std::vector<WorkerDescriptor> descriptors, SupervisorOptions options,
                     logging::AsyncLogger& logger);
    ~WorkerSupervisor() override;

    WorkerSupervisor(const WorkerSupervisor&) = delete;
    WorkerSupervisor& operator=(const WorkerSupervisor&) = delete;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    void initialize() override;
    bool is_initialized() const override { return initialized_.load(std::memory_order_acquire); }

    /**
     * Stop every worker: SIGTERM, wait up to the grace period, SIGKILL the
     * rest. Pending requests are rejected. initialize() may be called again.
     */
    void shutdown();

    void set_crash_callback(CrashCallback cb);

    // =========================================================================
    // Forwarding
    // =========================================================================

    /**
     * Send a raw request to a named worker and return its response envelope.
     * The worker must be Ready unless the request is the bootstrap
     * "initialize" call.
     */
    json send_request(const std::string& worker, const json& request);

    json call_tool(const std::string& worker, const std::string& tool, const json& arguments) override;
    json read_resource(const std::string& uri) override;
    json get_prompt(const std::string& name, const json& arguments) override;

    std::optional<std::string> route_tool(const std::string& tool) const override;

    // =========================================================================
    // Aggregation and status
    // =========================================================================

    json all_tools() const override;
    json all_resources() const override;
    json all_prompts() const override;

    /// Per worker: ready, state, pid, capability counts, pending requests
    json status() const;

    /// Per worker: pending requests, timeouts, discarded lines, late responses
    json stats() const;

    HealthState health() const;
    std::string last_error() const;

    const std::vector<WorkerDescriptor>& descriptors() const { return descriptors_; }

    /// Monotonic id for gateway-originated requests
    int64_t next_request_id() { return request_id_.fetch_add(1, std::memory_order_relaxed) + 1; }

private:
    std::vector<WorkerDescriptor> descriptors_;
    SupervisorOptions options_;
    logging::AsyncLogger& logger_;

    std::mutex lifecycle_mutex_; // serializes initialize() and shutdown()
    mutable std::mutex workers_mutex_;
    std::map<std::string, std::shared_ptr<WorkerProcess>> workers_;
    rpc::RoutingTable routing_;
    std::string last_error_;

    std::mutex crash_mutex_;
    CrashCallback crash_callback_;

    std::atomic<bool> initialized_{false};
    std::atomic<int64_t> request_id_{0};

    void start_worker(WorkerProcess& worker);
    void handshake(WorkerProcess& worker);
    void load_capabilities(WorkerProcess& worker);
    json list_capability(WorkerProcess& worker, const char* method, const char* key, bool required);
    void on_worker_exit(WorkerProcess& worker, int exit_code, int signal);

    void stop_workers(const std::vector<std::shared_ptr<WorkerProcess>>& workers);
    std::shared_ptr<WorkerProcess> find_worker(const std::string& name) const;
    std::vector<std::shared_ptr<WorkerProcess>> ready_workers() const;
    json aggregate(json CapabilitySet::*list) const;
};

} // namespace worker
} // namespace mcpgw
