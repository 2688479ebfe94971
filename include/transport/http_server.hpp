#pragma once

/**
 * HttpServer - cpp-httplib listener for the gateway
 *
 * Endpoints:
 *   POST /mcp      - JSON-RPC 2.0
 *   GET  /health   - Gateway and worker health (200 healthy, 503 otherwise)
 *   GET  /metrics  - Counters
 *   GET  /ws       - Where the WebSocket listener is
 *
 * Unknown routes get a JSON-RPC METHOD_NOT_FOUND body with HTTP 404.
 * Exceptions escaping a handler become HTTP 500 / INTERNAL_ERROR.
 */

#include "gateway_context.hpp"

#include <atomic>
#include <memory>
#include <thread>

namespace httplib {
class Server;
}

namespace mcpgw {
namespace transport {

class HttpServer {
public:
    explicit HttpServer(GatewayContext& ctx);
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    /**
     * Bind to config.host:config.port and serve on a background thread.
     * Returns false if the port cannot be bound.
     */
    bool start();

    /// Close the listening socket; handlers already running keep going
    void stop_accepting();

    /// Stop accepting and wait for in-flight handlers
    void stop();

    bool is_running() const { return running_.load(); }

private:
    GatewayContext& ctx_;
    std::unique_ptr<httplib::Server> server_;
    std::thread listen_thread_;
    std::atomic<bool> running_{false};
    std::atomic<bool> stop_requested_{false};

    void setup_routes();
};

} // namespace transport
} // namespace mcpgw
