#pragma once

/**
 * GatewayContext - everything a listener needs, built once in main()
 *
 * Passed by reference into the HTTP and WebSocket listeners instead of
 * process-wide globals. The context does not own the components; main()
 * declares them in dependency order so destruction runs in reverse.
 */

#include "../config/gateway_config.hpp"
#include "../logging/async_logger.hpp"
#include "../rpc/dispatcher.hpp"
#include "../util/time_utils.hpp"
#include "../worker/supervisor.hpp"

#include <atomic>
#include <cstdint>

namespace mcpgw {
namespace transport {

constexpr const char* GATEWAY_VERSION = "1.0.0";

struct GatewayMetrics {
    uint64_t start_ms = util::now_ms();

    std::atomic<uint64_t> http_requests{0};
    std::atomic<uint64_t> http_errors{0};
    std::atomic<uint64_t> parse_errors{0};

    std::atomic<int64_t> ws_connections{0}; // currently open
    std::atomic<uint64_t> ws_connections_total{0};
    std::atomic<uint64_t> ws_messages{0};
    std::atomic<uint64_t> ws_errors{0};
    std::atomic<uint64_t> ws_rejected{0}; // over the dispatch limit

    uint64_t uptime_ms() const { return util::now_ms() - start_ms; }
};

struct GatewayContext {
    const config::GatewayConfig& config;
    logging::AsyncLogger& logger;
    worker::WorkerSupervisor& supervisor;
    rpc::Dispatcher& dispatcher;
    GatewayMetrics metrics;

    GatewayContext(const config::GatewayConfig& cfg, logging::AsyncLogger& log, worker::WorkerSupervisor& sup,
                   rpc::Dispatcher& disp)
        : config(cfg), logger(log), supervisor(sup), dispatcher(disp) {}

    GatewayContext(const GatewayContext&) = delete;
    GatewayContext& operator=(const GatewayContext&) = delete;
};

} // namespace transport
} // namespace mcpgw
