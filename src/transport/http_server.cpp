#define CPPHTTPLIB_NO_OPENSSL 1

#include "../../include/transport/http_server.hpp"
#include "../../include/transport/endpoints.hpp"

#include <httplib.h>

#include <exception>
#include <string>

namespace mcpgw::transport {

namespace LogCategory = logging::LogCategory;

namespace {

constexpr const char* JSON_TYPE = "application/json";

void send_json(httplib::Response& res, int status, const json& body) {
    res.status = status;
    res.set_content(serialize(body), JSON_TYPE);
}

} // namespace

HttpServer::HttpServer(GatewayContext& ctx) : ctx_(ctx), server_(std::make_unique<httplib::Server>()) {
    setup_routes();
}

HttpServer::~HttpServer() {
    stop();
}

bool HttpServer::start() {
    if (running_.load())
        return true;

    const auto& cfg = ctx_.config;
    if (!server_->bind_to_port(cfg.host, cfg.port)) {
        LOGF_ERROR(ctx_.logger, LogCategory::Http, "Failed to bind HTTP listener on %s:%d", cfg.host.c_str(),
                   cfg.port);
        return false;
    }

    running_ = true;
    stop_requested_ = false;
    listen_thread_ = std::thread([this]() {
        if (!server_->listen_after_bind()) {
            LOG_ERROR(ctx_.logger, LogCategory::Http, "HTTP listener stopped unexpectedly");
        }
        running_ = false;
    });
    server_->wait_until_ready();

    LOGF_INFO(ctx_.logger, LogCategory::Http, "MCP endpoint: http://%s:%d/mcp", cfg.host.c_str(), cfg.port);
    LOGF_INFO(ctx_.logger, LogCategory::Http, "Health check: http://%s:%d/health", cfg.host.c_str(), cfg.port);
    LOGF_INFO(ctx_.logger, LogCategory::Http, "Metrics: http://%s:%d/metrics", cfg.host.c_str(), cfg.port);
    return true;
}

void HttpServer::stop_accepting() {
    // httplib::Server::stop() must run once per listen
    if (!listen_thread_.joinable() || stop_requested_.exchange(true))
        return;
    server_->stop();
    LOG_INFO(ctx_.logger, LogCategory::Http, "HTTP listener no longer accepting connections");
}

void HttpServer::stop() {
    stop_accepting();
    if (listen_thread_.joinable()) {
        listen_thread_.join();
    }
    running_ = false;
}

void HttpServer::setup_routes() {
    const auto& cfg = ctx_.config;

    server_->set_payload_max_length(cfg.max_body_bytes);
    server_->new_task_queue = [] { return new httplib::ThreadPool(config::server::HTTP_THREADS); };

    // Main JSON-RPC 2.0 endpoint
    server_->Post("/mcp", [this](const httplib::Request& req, httplib::Response& res) {
        ctx_.metrics.http_requests.fetch_add(1, std::memory_order_relaxed);

        HttpReply reply = handle_http_body(ctx_.dispatcher, req.body);
        if (reply.parse_error) {
            ctx_.metrics.parse_errors.fetch_add(1, std::memory_order_relaxed);
            LOG_WARN(ctx_.logger, LogCategory::Http, "Rejected unparseable request body");
        }
        if (reply.status != 200) {
            ctx_.metrics.http_errors.fetch_add(1, std::memory_order_relaxed);
        }
        send_json(res, reply.status, reply.body);
    });

    // Health check
    server_->Get("/health", [this](const httplib::Request&, httplib::Response& res) {
        HttpReply reply = health_report(ctx_);
        send_json(res, reply.status, reply.body);
    });

    // Metrics
    server_->Get("/metrics", [this](const httplib::Request&, httplib::Response& res) {
        send_json(res, 200, metrics_report(ctx_));
    });

    // WebSocket pointer (the listener runs on its own port)
    server_->Get("/ws", [this](const httplib::Request&, httplib::Response& res) {
        const auto& c = ctx_.config;
        if (c.enable_websocket) {
            res.set_content("WebSocket endpoint available at ws://" + c.host + ":" + std::to_string(c.ws_port) + "/",
                            "text/plain");
        } else {
            res.set_content("WebSocket transport is disabled", "text/plain");
        }
    });

    // 404 and other bodiless errors (e.g. 413 from the payload limit)
    server_->set_error_handler(httplib::Server::HandlerWithResponse(
        [this](const httplib::Request& req, httplib::Response& res) {
            if (!res.body.empty())
                return httplib::Server::HandlerResponse::Unhandled;

            ctx_.metrics.http_errors.fetch_add(1, std::memory_order_relaxed);
            if (res.status == 404) {
                send_json(res, 404, not_found_body(req.path));
            } else {
                send_json(res, res.status,
                          rpc::make_error(rpc::error_code::INVALID_REQUEST, "Invalid Request",
                                          "HTTP error " + std::to_string(res.status), nullptr));
            }
            return httplib::Server::HandlerResponse::Handled;
        }));

    // Last line of defence: no request may take the process down
    server_->set_exception_handler([this](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        ctx_.metrics.http_errors.fetch_add(1, std::memory_order_relaxed);
        std::string what = "unknown exception";
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            what = e.what();
        } catch (...) {
            LOG_ERROR(ctx_.logger, LogCategory::Http, "Non-standard exception in HTTP handler");
        }
        LOGF_ERROR(ctx_.logger, LogCategory::Http, "Unhandled error on %s %s: %s", req.method.c_str(),
                   req.path.c_str(), what.c_str());
        send_json(res, 500, rpc::make_error(rpc::error_code::INTERNAL_ERROR, "Internal error", what, nullptr));
    });

    // Request log
    server_->set_logger([this](const httplib::Request& req, const httplib::Response& res) {
        LOGF_INFO(ctx_.logger, LogCategory::Http, "%s %s -> %d", req.method.c_str(), req.path.c_str(), res.status);
    });
}

} // namespace mcpgw::transport
