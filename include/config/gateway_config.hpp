#pragma once

/**
 * GatewayConfig - process-wide settings, loaded once at startup
 *
 * Sources, later wins:
 *   1. defaults.hpp
 *   2. environment (MCP_HOST, MCP_PORT, LOG_LEVEL, ...)
 *   3. command line (util::parse_args)
 *
 * The worker set is either the built-in six-worker deployment or the
 * contents of a JSON descriptor file (MCP_WORKERS_FILE / --workers).
 */

#include "defaults.hpp"
#include "../worker/worker_descriptor.hpp"

#include <chrono>
#include <functional>
#include <string>
#include <vector>

namespace mcpgw {
namespace config {

struct GatewayConfig {
    std::string host = server::HOST;
    int port = server::HTTP_PORT;
    bool enable_websocket = server::ENABLE_WEBSOCKET;
    int ws_port = server::WS_PORT;
    size_t max_body_bytes = server::MAX_BODY_BYTES;
    size_t ws_max_in_flight = server::WS_MAX_IN_FLIGHT;

    std::string log_level = logger::LEVEL;

    std::string python = workers::PYTHON;
    std::string servers_dir = workers::SERVERS_DIR;
    std::string workers_file; // empty = built-in set

    std::chrono::milliseconds shutdown_grace{workers::SHUTDOWN_GRACE_MS};
    size_t max_pending_per_worker = workers::MAX_PENDING;

    /**
     * Overlay environment variables onto the defaults. getenv is injectable
     * for tests. Malformed numbers are recorded and reported by validate().
     */
    static GatewayConfig from_env(const std::function<const char*(const char*)>& getenv_fn);
    static GatewayConfig from_env();

    /// Every problem found, empty if the configuration is usable
    std::vector<std::string> validate() const;

    /**
     * The worker set to start: the descriptor file if one is configured,
     * otherwise the built-in deployment. Throws std::runtime_error when
     * the file cannot be read or parsed.
     */
    std::vector<worker::WorkerDescriptor> load_workers() const;

    std::vector<std::string> parse_errors; // from from_env / CLI overrides
};

/**
 * Built-in deployment: six Python workers launched as
 * `<python> <servers_dir>/<dir>/main.py`.
 */
std::vector<worker::WorkerDescriptor> default_workers(const std::string& python, const std::string& servers_dir);

/**
 * Parse a JSON array of worker descriptors:
 *   [{"name": "risk", "command": ["python3", "risk.py"], "timeout_ms": 5000,
 *     "description": "...", "env": {"K": "V"}, "working_dir": "/srv"}]
 * Throws std::runtime_error with the offending entry on malformed input.
 */
std::vector<worker::WorkerDescriptor> parse_workers(const std::string& text);
std::vector<worker::WorkerDescriptor> load_workers_file(const std::string& path);

} // namespace config
} // namespace mcpgw
