#pragma once

/**
 * Transport-independent endpoint logic
 *
 * Turns raw request text into a JSON-RPC reply plus, for HTTP, a status
 * code. The listeners only move bytes; everything testable lives here.
 *
 * HTTP status mapping:
 *   unparseable body, invalid envelope  -> 400
 *   exception escaped the dispatcher    -> 500
 *   anything dispatched (incl. errors)  -> 200
 */

#include "gateway_context.hpp"
#include "../rpc/dispatcher.hpp"

#include <string>

namespace mcpgw {
namespace transport {

using json = nlohmann::json;

struct HttpReply {
    int status = 200;
    json body;
    bool parse_error = false;
};

int http_status(rpc::Disposition disposition);

/// POST /mcp
HttpReply handle_http_body(rpc::Dispatcher& dispatcher, const std::string& body);

/// One WebSocket text message -> one reply envelope
json handle_ws_message(rpc::Dispatcher& dispatcher, const std::string& message);

/**
 * Reply for a WebSocket message that was not admitted: MCP_RATE_LIMIT_ERROR
 * while the dispatch limit is reached, MCP_BRIDGE_ERROR once shutting down.
 * Keeps the message's id when it parses.
 */
json ws_rejection(const std::string& message, bool shutting_down, size_t limit);

/// GET /health body; status 200 only when healthy
HttpReply health_report(GatewayContext& ctx);

/// GET /metrics body
json metrics_report(GatewayContext& ctx);

/// Body for routes that do not exist
json not_found_body(const std::string& path);

/// Compact serialization that never throws on invalid UTF-8
std::string serialize(const json& value);

} // namespace transport
} // namespace mcpgw
