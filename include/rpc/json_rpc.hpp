#pragma once

/**
 * JSON-RPC 2.0 envelopes and the gateway error taxonomy
 *
 * Shared by the Dispatcher (client side) and the Worker Supervisor
 * (worker side). A response is a tagged union: it carries either
 * "result" or "error", never both.
 */

#include <nlohmann/json.hpp>

#include <cstdint>
#include <stdexcept>
#include <string>

namespace mcpgw {
namespace rpc {

using json = nlohmann::json;

// =============================================================================
// Error codes
// =============================================================================
namespace error_code {
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int INTERNAL_ERROR = -32603;

// Gateway-private range (-32000 to -32099)
constexpr int MCP_SERVER_ERROR = -32000;     // worker-reported failure
constexpr int MCP_TIMEOUT_ERROR = -32001;    // no response within deadline
constexpr int MCP_RATE_LIMIT_ERROR = -32002; // too many pending requests
constexpr int MCP_BRIDGE_ERROR = -32003;     // process-level failure
} // namespace error_code

inline const char* error_code_name(int code) {
    switch (code) {
    case error_code::PARSE_ERROR:
        return "PARSE_ERROR";
    case error_code::INVALID_REQUEST:
        return "INVALID_REQUEST";
    case error_code::METHOD_NOT_FOUND:
        return "METHOD_NOT_FOUND";
    case error_code::INVALID_PARAMS:
        return "INVALID_PARAMS";
    case error_code::INTERNAL_ERROR:
        return "INTERNAL_ERROR";
    case error_code::MCP_SERVER_ERROR:
        return "MCP_SERVER_ERROR";
    case error_code::MCP_TIMEOUT_ERROR:
        return "MCP_TIMEOUT_ERROR";
    case error_code::MCP_RATE_LIMIT_ERROR:
        return "MCP_RATE_LIMIT_ERROR";
    case error_code::MCP_BRIDGE_ERROR:
        return "MCP_BRIDGE_ERROR";
    default:
        return "UNKNOWN";
    }
}

// =============================================================================
// Protocol constants
// =============================================================================
constexpr const char* JSONRPC_VERSION = "2.0";
constexpr const char* PROTOCOL_VERSION = "2024-11-05";
constexpr const char* CLIENT_NAME = "crypto-trading-mcp-bridge";
constexpr const char* CLIENT_VERSION = "1.0.0";

namespace method {
constexpr const char* INITIALIZE = "initialize";
constexpr const char* INITIALIZED = "notifications/initialized";
constexpr const char* PING = "ping";
constexpr const char* TOOLS_LIST = "tools/list";
constexpr const char* TOOLS_CALL = "tools/call";
constexpr const char* RESOURCES_LIST = "resources/list";
constexpr const char* RESOURCES_READ = "resources/read";
constexpr const char* PROMPTS_LIST = "prompts/list";
constexpr const char* PROMPTS_GET = "prompts/get";
} // namespace method

// =============================================================================
// Exceptions
// =============================================================================

/**
 * Gateway-side failure with a JSON-RPC error code attached.
 */
class RpcError : public std::runtime_error {
public:
    RpcError(int code, const std::string& message, json data = nullptr)
        : std::runtime_error(message), code_(code), data_(std::move(data)) {}

    int code() const { return code_; }
    const json& data() const { return data_; }

private:
    int code_;
    json data_;
};

/**
 * Error object returned by a worker. A well-formed {code, message} object
 * is relayed to the client unchanged; anything else is wrapped into an
 * MCP_SERVER_ERROR object with the original value under "data".
 */
class WorkerError : public RpcError {
public:
    explicit WorkerError(const json& error)
        : RpcError(extract_code(error), extract_message(error), extract_data(error)), error_(normalize(error)) {}

    const json& error_object() const { return error_; }

private:
    json error_;

    static json normalize(const json& error) {
        json fixed = error.is_object() ? error : json::object();
        fixed["code"] = extract_code(error);
        fixed["message"] = extract_message(error);
        json data = extract_data(error);
        if (!data.is_null())
            fixed["data"] = std::move(data);
        return fixed;
    }

    static json extract_data(const json& error) {
        if (error.is_object())
            return error.contains("data") ? error["data"] : json();
        return error;
    }

    static int extract_code(const json& error) {
        if (error.is_object() && error.contains("code") && error["code"].is_number_integer())
            return error["code"].get<int>();
        return error_code::MCP_SERVER_ERROR;
    }

    static std::string extract_message(const json& error) {
        if (error.is_object() && error.contains("message") && error["message"].is_string())
            return error["message"].get<std::string>();
        return "Server error";
    }
};

// =============================================================================
// Envelope helpers
// =============================================================================

/**
 * A request is valid iff it is an object with jsonrpc == "2.0", a non-empty
 * string method, an id member (null and 0 are valid ids), and params that
 * is absent, an object or an array.
 */
inline bool is_valid_request(const json& request) {
    if (!request.is_object())
        return false;

    auto version = request.find("jsonrpc");
    if (version == request.end() || !version->is_string() || version->get<std::string>() != JSONRPC_VERSION)
        return false;

    auto method = request.find("method");
    if (method == request.end() || !method->is_string() || method->get<std::string>().empty())
        return false;

    if (!request.contains("id"))
        return false;

    auto params = request.find("params");
    if (params != request.end() && !params->is_object() && !params->is_array())
        return false;

    return true;
}

/**
 * Id to echo back in a response. Missing or unreadable ids become null.
 */
inline json request_id(const json& request) {
    if (request.is_object()) {
        auto it = request.find("id");
        if (it != request.end())
            return *it;
    }
    return nullptr;
}

inline json make_request(const std::string& method, json params, json id) {
    json request = {{"jsonrpc", JSONRPC_VERSION}, {"method", method}};
    if (!params.is_null())
        request["params"] = std::move(params);
    request["id"] = std::move(id);
    return request;
}

inline json make_notification(const std::string& method) {
    return json{{"jsonrpc", JSONRPC_VERSION}, {"method", method}};
}

inline json make_success(json result, json id) {
    return json{{"jsonrpc", JSONRPC_VERSION}, {"result", std::move(result)}, {"id", std::move(id)}};
}

inline json make_error_object(int code, const std::string& message, json data = nullptr) {
    json error = {{"code", code}, {"message", message}};
    if (!data.is_null())
        error["data"] = std::move(data);
    return error;
}

inline json make_error(int code, const std::string& message, json data, json id) {
    return json{{"jsonrpc", JSONRPC_VERSION},
                {"error", make_error_object(code, message, std::move(data))},
                {"id", std::move(id)}};
}

/**
 * Relay a worker's error object as-is under the client's id.
 */
inline json make_error_passthrough(json error_object, json id) {
    return json{{"jsonrpc", JSONRPC_VERSION}, {"error", std::move(error_object)}, {"id", std::move(id)}};
}

// "error": null is how some workers spell "no error"
inline bool is_error_response(const json& response) {
    if (!response.is_object())
        return false;
    auto error = response.find("error");
    return error != response.end() && !error->is_null();
}

inline int response_error_code(const json& response) {
    if (!is_error_response(response))
        return 0;
    const json& error = response["error"];
    if (error.is_object() && error.contains("code") && error["code"].is_number_integer())
        return error["code"].get<int>();
    return 0;
}

} // namespace rpc
} // namespace mcpgw
