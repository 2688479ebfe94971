#pragma once

/**
 * CLI utilities for the gateway
 *
 * Provides command-line argument parsing. Flags override the
 * environment-derived GatewayConfig.
 */

#include "../config/gateway_config.hpp"

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace mcpgw {
namespace util {

/**
 * Command-line arguments for mcp_gateway. Unset options leave the
 * configuration untouched.
 */
struct CLIArgs {
    bool help = false;
    std::optional<std::string> host;
    std::optional<int> port;
    std::optional<int> ws_port;
    bool no_websocket = false;
    std::optional<std::string> log_level;
    std::optional<std::string> python;
    std::optional<std::string> servers_dir;
    std::optional<std::string> workers_file;
    std::optional<long long> grace_ms;
    std::optional<long long> max_pending;
};

/**
 * Print help message for mcp_gateway.
 */
inline void print_help() {
    std::cout << R"(
Crypto Trading MCP Gateway
==========================

Usage: mcp_gateway [options]

Options:
  --host ADDR            Bind address (default: 0.0.0.0, env MCP_HOST)
  --port N               HTTP port (default: 8080, env MCP_PORT)
  --ws-port N            WebSocket port (default: 8081, env MCP_WS_PORT)
  --no-ws                Disable the WebSocket listener (env ENABLE_WEBSOCKET=false)
  --log-level LEVEL      fatal, error, warn, info, debug, trace (default: info)
  --python PATH          Interpreter for built-in workers (default: python3)
  --servers-dir DIR      Directory holding the worker packages (default: servers)
  --workers FILE         JSON worker descriptor file instead of the built-in set
  --grace-ms N           Shutdown grace before SIGKILL (default: 5000)
  --max-pending N        Max in-flight requests per worker (default: 256)
  -h, --help             Show this help

Endpoints:
  POST /mcp              JSON-RPC 2.0
  GET  /health           Gateway and worker health
  GET  /metrics          Counters
  ws://HOST:WS_PORT/     JSON-RPC 2.0 over WebSocket

Examples:
  mcp_gateway                                  # Built-in workers on :8080
  mcp_gateway --port 3000 --no-ws              # HTTP only on :3000
  mcp_gateway --workers workers.json --log-level debug
)";
}

/**
 * Parse an integer option value, reporting the option name on failure.
 */
inline bool parse_number(const std::string& option, const char* text, long long& out) {
    char* end = nullptr;
    long long value = std::strtoll(text, &end, 10);
    if (end == text || *end != '\0') {
        std::cerr << "Invalid value for " << option << ": " << text << "\n";
        return false;
    }
    out = value;
    return true;
}

/**
 * Parse command-line arguments into CLIArgs struct.
 *
 * @param argc Argument count
 * @param argv Argument values
 * @param args Output argument struct
 * @return true if parsing succeeded, false on error
 */
inline bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        long long number = 0;

        if (arg == "--help" || arg == "-h") {
            args.help = true;
        }
        else if (arg == "--no-ws") {
            args.no_websocket = true;
        }
        else if (arg == "--host" && i + 1 < argc) {
            args.host = argv[++i];
        }
        else if (arg == "--port" && i + 1 < argc) {
            if (!parse_number(arg, argv[++i], number))
                return false;
            args.port = static_cast<int>(number);
        }
        else if (arg == "--ws-port" && i + 1 < argc) {
            if (!parse_number(arg, argv[++i], number))
                return false;
            args.ws_port = static_cast<int>(number);
        }
        else if (arg == "--log-level" && i + 1 < argc) {
            args.log_level = argv[++i];
        }
        else if (arg == "--python" && i + 1 < argc) {
            args.python = argv[++i];
        }
        else if (arg == "--servers-dir" && i + 1 < argc) {
            args.servers_dir = argv[++i];
        }
        else if (arg == "--workers" && i + 1 < argc) {
            args.workers_file = argv[++i];
        }
        else if (arg == "--grace-ms" && i + 1 < argc) {
            if (!parse_number(arg, argv[++i], number))
                return false;
            args.grace_ms = number;
        }
        else if (arg == "--max-pending" && i + 1 < argc) {
            if (!parse_number(arg, argv[++i], number))
                return false;
            args.max_pending = number;
        }
        else {
            std::cerr << "Unknown option: " << arg << "\n";
            std::cerr << "Use --help for usage information.\n";
            return false;
        }
    }
    return true;
}

/**
 * Overlay parsed flags onto a configuration.
 */
inline void apply_args(const CLIArgs& args, config::GatewayConfig& cfg) {
    if (args.host)
        cfg.host = *args.host;
    if (args.port)
        cfg.port = *args.port;
    if (args.ws_port)
        cfg.ws_port = *args.ws_port;
    if (args.no_websocket)
        cfg.enable_websocket = false;
    if (args.log_level)
        cfg.log_level = *args.log_level;
    if (args.python)
        cfg.python = *args.python;
    if (args.servers_dir)
        cfg.servers_dir = *args.servers_dir;
    if (args.workers_file)
        cfg.workers_file = *args.workers_file;
    if (args.grace_ms)
        cfg.shutdown_grace = std::chrono::milliseconds(*args.grace_ms);
    if (args.max_pending)
        cfg.max_pending_per_worker = *args.max_pending < 0 ? 0 : static_cast<size_t>(*args.max_pending);
}

}  // namespace util
}  // namespace mcpgw
