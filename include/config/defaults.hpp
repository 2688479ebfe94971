#pragma once

#include <cstddef>
#include <cstdint>

/**
 * Centralized configuration defaults for the gateway.
 *
 * All default values are defined here to avoid duplication across:
 * - GatewayConfig (environment and command line)
 * - WorkerSupervisor options
 * - HTTP / WebSocket listeners
 *
 * Naming:
 * - _MS suffix: milliseconds
 * - _BYTES suffix: bytes
 */

namespace mcpgw::config {

// =============================================================================
// Listeners
// =============================================================================
namespace server {
constexpr const char* HOST = "0.0.0.0";
constexpr int HTTP_PORT = 8080;
constexpr int WS_PORT = 8081;
constexpr bool ENABLE_WEBSOCKET = true;

// Request body limit for POST /mcp and WebSocket messages
constexpr size_t MAX_BODY_BYTES = 10 * 1024 * 1024; // 10 MiB

// Concurrent WebSocket dispatches; further messages get MCP_RATE_LIMIT_ERROR
constexpr size_t WS_MAX_IN_FLIGHT = 64;

// httplib worker threads (each blocks for the duration of one call)
constexpr size_t HTTP_THREADS = 16;
} // namespace server

// =============================================================================
// Workers
// =============================================================================
namespace workers {
constexpr const char* PYTHON = "python3";
constexpr const char* SERVERS_DIR = "servers";
constexpr const char* ENTRY_POINT = "main.py";

constexpr int64_t DEFAULT_TIMEOUT_MS = 30000;
constexpr int64_t MAX_TIMEOUT_MS = 60 * 60 * 1000; // keeps deadline arithmetic in range

// SIGTERM -> SIGKILL escalation window
constexpr int64_t SHUTDOWN_GRACE_MS = 5000;
constexpr int64_t MIN_SHUTDOWN_GRACE_MS = 100;

// Per-worker cap on in-flight requests
constexpr size_t MAX_PENDING = 256;
} // namespace workers

// =============================================================================
// Logging
// =============================================================================
namespace logger {
constexpr const char* LEVEL = "info";
} // namespace logger

} // namespace mcpgw::config
