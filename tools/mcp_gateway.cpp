/**
 * MCP Gateway
 *
 * JSON-RPC 2.0 front door for the crypto trading MCP workers. Starts every
 * configured worker process, performs the MCP handshake, and serves
 * clients over HTTP (POST /mcp) and WebSocket.
 *
 * Usage:
 *   mcp_gateway                          # Built-in workers, HTTP :8080, WS :8081
 *   mcp_gateway --port 3000 --no-ws      # HTTP only
 *   mcp_gateway --workers workers.json   # Custom worker set
 */

#include "../include/config/gateway_config.hpp"
#include "../include/logging/async_logger.hpp"
#include "../include/rpc/dispatcher.hpp"
#include "../include/transport/gateway_context.hpp"
#include "../include/transport/http_server.hpp"
#include "../include/transport/ws_server.hpp"
#include "../include/util/cli.hpp"
#include "../include/util/system.hpp"
#include "../include/worker/supervisor.hpp"

#include <atomic>
#include <chrono>
#include <iostream>
#include <thread>

using namespace mcpgw;
namespace LogCategory = logging::LogCategory;

namespace {

std::atomic<bool> g_running{true};

int run(const config::GatewayConfig& cfg) {
    logging::AsyncLogger logger;
    logging::LogLevel level = logging::LogLevel::Info;
    logging::parse_level(cfg.log_level, level);
    logger.set_min_level(level);
    logger.start();

    std::vector<worker::WorkerDescriptor> descriptors;
    try {
        descriptors = cfg.load_workers();
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        logger.stop();
        return 1;
    }

    LOGF_INFO(logger, LogCategory::System, "Crypto Trading MCP Gateway %s starting (%zu workers)",
              transport::GATEWAY_VERSION, descriptors.size());

    worker::SupervisorOptions options;
    options.shutdown_grace = cfg.shutdown_grace;
    options.max_pending_per_worker = cfg.max_pending_per_worker;

    worker::WorkerSupervisor supervisor(std::move(descriptors), options, logger);
    supervisor.set_crash_callback([&logger](const std::string& name, int code, int signal) {
        LOGF_ERROR(logger, LogCategory::System, "Worker %s is down (code=%d signal=%d); restart the gateway to recover",
                   name.c_str(), code, signal);
    });

    rpc::Dispatcher dispatcher(supervisor, logger);
    transport::GatewayContext ctx(cfg, logger, supervisor, dispatcher);

    try {
        supervisor.initialize();
    } catch (const std::exception& e) {
        // Keep serving: /health reports unhealthy and a client initialize retries
        LOGF_ERROR(logger, LogCategory::System, "Startup initialization failed: %s", e.what());
    }

    transport::HttpServer http(ctx);
    if (!http.start()) {
        supervisor.shutdown();
        logger.stop();
        return 1;
    }

    transport::WebSocketServer ws(ctx);
    if (cfg.enable_websocket && !ws.start()) {
        http.stop();
        supervisor.shutdown();
        logger.stop();
        return 1;
    }

    LOG_INFO(logger, LogCategory::System, "Crypto Trading MCP Gateway started");

    while (g_running.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    LOGF_INFO(logger, LogCategory::System, "Received signal %d, shutting down...", util::shutdown_signal());

    // Refuse new work, reject what workers still owe, then drain the listeners
    ws.stop_accepting();
    http.stop_accepting();
    supervisor.shutdown();
    ws.stop();
    http.stop();

    LOG_INFO(logger, LogCategory::System, "Gateway shutdown complete");
    logger.stop();
    return 0;
}

} // namespace

int main(int argc, char* argv[]) {
    util::install_shutdown_handler(g_running);
    util::ignore_sigpipe();

    util::CLIArgs args;
    if (!util::parse_args(argc, argv, args))
        return 1;

    if (args.help) {
        util::print_help();
        return 0;
    }

    config::GatewayConfig cfg = config::GatewayConfig::from_env();
    util::apply_args(args, cfg);

    auto errors = cfg.validate();
    if (!errors.empty()) {
        std::cerr << "Configuration validation failed:\n";
        for (const auto& e : errors) {
            std::cerr << "  " << e << "\n";
        }
        return 1;
    }

    return run(cfg);
}
