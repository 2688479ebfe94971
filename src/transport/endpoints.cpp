#include "../../include/transport/endpoints.hpp"

namespace mcpgw::transport {

namespace error_code = rpc::error_code;

namespace {

json parse_error_reply() {
    return rpc::make_error(error_code::PARSE_ERROR, "Parse error", "Invalid JSON", nullptr);
}

} // namespace

int http_status(rpc::Disposition disposition) {
    switch (disposition) {
    case rpc::Disposition::EnvelopeError:
        return 400;
    case rpc::Disposition::InternalError:
        return 500;
    case rpc::Disposition::Dispatched:
    default:
        return 200;
    }
}

HttpReply handle_http_body(rpc::Dispatcher& dispatcher, const std::string& body) {
    json request = json::parse(body, nullptr, false);
    if (request.is_discarded()) {
        HttpReply reply;
        reply.status = 400;
        reply.body = parse_error_reply();
        reply.parse_error = true;
        return reply;
    }

    rpc::DispatchResult result = dispatcher.dispatch(request);
    HttpReply reply;
    reply.status = http_status(result.disposition);
    reply.body = std::move(result.response);
    return reply;
}

json handle_ws_message(rpc::Dispatcher& dispatcher, const std::string& message) {
    json request = json::parse(message, nullptr, false);
    if (request.is_discarded()) {
        return parse_error_reply();
    }
    return dispatcher.handle(request);
}

json ws_rejection(const std::string& message, bool shutting_down, size_t limit) {
    json request = json::parse(message, nullptr, false);
    json id = request.is_discarded() ? json() : rpc::request_id(request);

    if (shutting_down) {
        return rpc::make_error(error_code::MCP_BRIDGE_ERROR, "Gateway is shutting down", nullptr, std::move(id));
    }
    return rpc::make_error(error_code::MCP_RATE_LIMIT_ERROR, "Too many concurrent requests",
                           "At most " + std::to_string(limit) + " WebSocket requests may be in flight",
                           std::move(id));
}

HttpReply health_report(GatewayContext& ctx) {
    worker::HealthState state = ctx.supervisor.health();

    json doc = {
        {"status", worker::health_to_string(state)},
        {"timestamp", util::iso8601_now()},
        {"uptime_ms", ctx.metrics.uptime_ms()},
        {"version", GATEWAY_VERSION},
        {"workers", ctx.supervisor.status()},
    };

    std::string last_error = ctx.supervisor.last_error();
    if (!last_error.empty()) {
        doc["lastError"] = last_error;
    }

    HttpReply reply;
    reply.status = state == worker::HealthState::Healthy ? 200 : 503;
    reply.body = std::move(doc);
    return reply;
}

json metrics_report(GatewayContext& ctx) {
    const GatewayMetrics& m = ctx.metrics;
    uint64_t http_requests = m.http_requests.load(std::memory_order_relaxed);
    uint64_t http_errors = m.http_errors.load(std::memory_order_relaxed);
    uint64_t ws_messages = m.ws_messages.load(std::memory_order_relaxed);
    uint64_t ws_errors = m.ws_errors.load(std::memory_order_relaxed);

    return json{
        {"uptime_ms", m.uptime_ms()},
        {"requests", http_requests + ws_messages},
        {"errors", http_errors + ws_errors},
        {"parseErrors", m.parse_errors.load(std::memory_order_relaxed)},
        {"wsConnections", m.ws_connections.load(std::memory_order_relaxed)},
        {"http", {{"requests", http_requests}, {"errors", http_errors}}},
        {"websocket",
         {{"connections", m.ws_connections.load(std::memory_order_relaxed)},
          {"totalConnections", m.ws_connections_total.load(std::memory_order_relaxed)},
          {"messages", ws_messages},
          {"rejected", m.ws_rejected.load(std::memory_order_relaxed)},
          {"errors", ws_errors}}},
        {"rpc", ctx.dispatcher.stats_json()},
        {"logger",
         {{"logged", ctx.logger.total_logged()},
          {"dropped", ctx.logger.dropped_count()},
          {"pending", ctx.logger.pending_count()}}},
        {"workers", ctx.supervisor.stats()},
    };
}

json not_found_body(const std::string& path) {
    return rpc::make_error(error_code::METHOD_NOT_FOUND, "Method not found",
                           "Endpoint " + path + " not found. Available: /mcp, /health, /metrics, /ws", nullptr);
}

std::string serialize(const json& value) {
    return value.dump(-1, ' ', false, json::error_handler_t::replace);
}

} // namespace mcpgw::transport
