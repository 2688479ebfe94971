#include "../../include/rpc/dispatcher.hpp"

namespace mcpgw::rpc {

namespace LogCategory = logging::LogCategory;

namespace {

bool has_string(const json& params, const char* key) {
    if (!params.is_object())
        return false;
    auto it = params.find(key);
    return it != params.end() && it->is_string() && !it->get<std::string>().empty();
}

std::string join_methods(const std::vector<std::string>& methods) {
    std::string out;
    for (const auto& m : methods) {
        if (!out.empty())
            out += ", ";
        out += m;
    }
    return out;
}

} // namespace

Dispatcher::Dispatcher(IWorkerBackend& backend, logging::AsyncLogger& logger) : backend_(backend), logger_(logger) {}

const std::vector<std::string>& Dispatcher::supported_methods() {
    static const std::vector<std::string> methods = {
        method::INITIALIZE,     method::PING,           method::TOOLS_LIST,   method::TOOLS_CALL,
        method::RESOURCES_LIST, method::RESOURCES_READ, method::PROMPTS_LIST, method::PROMPTS_GET,
    };
    return methods;
}

// =============================================================================
// Entry point
// =============================================================================

DispatchResult Dispatcher::dispatch(const json& request) {
    stats_.requests.fetch_add(1, std::memory_order_relaxed);
    json id = request_id(request);

    if (!is_valid_request(request)) {
        stats_.invalid_requests.fetch_add(1, std::memory_order_relaxed);
        stats_.errors.fetch_add(1, std::memory_order_relaxed);
        LOG_WARN(logger_, LogCategory::Rpc, "Rejected invalid JSON-RPC request");
        return {error(error_code::INVALID_REQUEST, "Invalid Request",
                      "Request must be a JSON-RPC 2.0 object with jsonrpc \"2.0\", a method and an id", id),
                Disposition::EnvelopeError};
    }

    const std::string method = request["method"].get<std::string>();
    auto params_it = request.find("params");
    const json params = params_it != request.end() ? *params_it : json::object();

    LOGF_INFO(logger_, LogCategory::Rpc, "Processing %s id=%s", method.c_str(),
              id.dump(-1, ' ', false, json::error_handler_t::replace).c_str());

    try {
        json response = route(method, params, id);
        if (is_error_response(response)) {
            stats_.errors.fetch_add(1, std::memory_order_relaxed);
        }
        return {std::move(response), Disposition::Dispatched};
    } catch (const std::exception& e) {
        stats_.internal_errors.fetch_add(1, std::memory_order_relaxed);
        stats_.errors.fetch_add(1, std::memory_order_relaxed);
        LOGF_ERROR(logger_, LogCategory::Rpc, "Request handling error in %s: %s", method.c_str(), e.what());
        return {error(error_code::INTERNAL_ERROR, "Internal error", e.what(), id), Disposition::InternalError};
    }
}

json Dispatcher::route(const std::string& m, const json& params, const json& id) {
    if (m == method::INITIALIZE)
        return handle_initialize(id);
    if (m == method::PING)
        return make_success(json::object(), id);
    if (m == method::TOOLS_LIST)
        return handle_list("tools", &IWorkerBackend::all_tools, "Failed to list tools", id);
    if (m == method::TOOLS_CALL)
        return handle_tools_call(params, id);
    if (m == method::RESOURCES_LIST)
        return handle_list("resources", &IWorkerBackend::all_resources, "Failed to list resources", id);
    if (m == method::RESOURCES_READ)
        return handle_resources_read(params, id);
    if (m == method::PROMPTS_LIST)
        return handle_list("prompts", &IWorkerBackend::all_prompts, "Failed to list prompts", id);
    if (m == method::PROMPTS_GET)
        return handle_prompts_get(params, id);

    return error(error_code::METHOD_NOT_FOUND, "Method not found",
                 "Method '" + m + "' is not supported. Available methods: " + join_methods(supported_methods()), id);
}

// =============================================================================
// Handlers
// =============================================================================

json Dispatcher::handle_initialize(const json& id) {
    try {
        backend_.initialize();
    } catch (const std::exception& e) {
        LOGF_ERROR(logger_, LogCategory::Rpc, "initialize failed: %s", e.what());
        return error(error_code::MCP_BRIDGE_ERROR, "Failed to initialize MCP bridge", e.what(), id);
    }

    json result = {
        {"protocolVersion", PROTOCOL_VERSION},
        {"capabilities",
         {{"tools", json::object()},
          {"resources", json::object()},
          {"prompts", json::object()},
          {"logging", json::object()}}},
        {"serverInfo", {{"name", CLIENT_NAME}, {"version", CLIENT_VERSION}}},
    };
    return make_success(std::move(result), id);
}

json Dispatcher::handle_list(const char* key, json (IWorkerBackend::*list)() const, const char* failure,
                             const json& id) {
    try {
        json entries = (backend_.*list)();
        return make_success(json{{key, std::move(entries)}}, id);
    } catch (const std::exception& e) {
        return error(error_code::MCP_SERVER_ERROR, failure, e.what(), id);
    }
}

json Dispatcher::handle_tools_call(const json& params, const json& id) {
    if (!has_string(params, "name")) {
        return error(error_code::INVALID_PARAMS, "Invalid params", "Tool name is required", id);
    }

    const std::string tool = params["name"].get<std::string>();
    auto worker = backend_.route_tool(tool);
    if (!worker) {
        return error(error_code::METHOD_NOT_FOUND, "Tool not found",
                     "Tool '" + tool + "' is not available. Use tools/list to see available tools.", id);
    }

    auto args_it = params.find("arguments");
    json arguments = args_it != params.end() && !args_it->is_null() ? *args_it : json::object();

    stats_.tool_calls.fetch_add(1, std::memory_order_relaxed);
    LOGF_DEBUG(logger_, LogCategory::Rpc, "Routing tool %s -> %s", tool.c_str(), worker->c_str());

    try {
        return make_success(backend_.call_tool(*worker, tool, arguments), id);
    } catch (const WorkerError& e) {
        return make_error_passthrough(e.error_object(), id);
    } catch (const RpcError& e) {
        if (e.code() == error_code::MCP_TIMEOUT_ERROR) {
            stats_.timeouts.fetch_add(1, std::memory_order_relaxed);
            return error(error_code::MCP_TIMEOUT_ERROR, "Tool execution timeout", e.what(), id);
        }
        return error(e.code(), "Tool execution failed", e.what(), id);
    }
}

json Dispatcher::handle_resources_read(const json& params, const json& id) {
    if (!has_string(params, "uri")) {
        return error(error_code::INVALID_PARAMS, "Invalid params", "Resource URI is required", id);
    }

    try {
        json contents = json::array();
        contents.push_back(backend_.read_resource(params["uri"].get<std::string>()));
        return make_success(json{{"contents", std::move(contents)}}, id);
    } catch (const WorkerError& e) {
        return make_error_passthrough(e.error_object(), id);
    } catch (const RpcError& e) {
        if (e.code() == error_code::MCP_TIMEOUT_ERROR)
            stats_.timeouts.fetch_add(1, std::memory_order_relaxed);
        return error(e.code(), "Failed to read resource", e.what(), id);
    }
}

json Dispatcher::handle_prompts_get(const json& params, const json& id) {
    if (!has_string(params, "name")) {
        return error(error_code::INVALID_PARAMS, "Invalid params", "Prompt name is required", id);
    }

    auto args_it = params.find("arguments");
    json arguments = args_it != params.end() ? *args_it : json();

    try {
        json prompt = backend_.get_prompt(params["name"].get<std::string>(), arguments);
        json result = {
            {"description", prompt.is_object() && prompt.contains("description") ? prompt["description"] : json()},
            {"messages", prompt.is_object() && prompt.contains("messages") ? prompt["messages"] : json::array()},
        };
        return make_success(std::move(result), id);
    } catch (const WorkerError& e) {
        return make_error_passthrough(e.error_object(), id);
    } catch (const RpcError& e) {
        if (e.code() == error_code::MCP_TIMEOUT_ERROR)
            stats_.timeouts.fetch_add(1, std::memory_order_relaxed);
        return error(e.code(), "Failed to get prompt", e.what(), id);
    }
}

json Dispatcher::error(int code, const std::string& message, json data, const json& id) {
    LOGF_DEBUG(logger_, LogCategory::Rpc, "Responding with %s (%d): %s", error_code_name(code), code,
               message.c_str());
    return make_error(code, message, std::move(data), id);
}

json Dispatcher::stats_json() const {
    return json{
        {"requests", stats_.requests.load(std::memory_order_relaxed)},
        {"errors", stats_.errors.load(std::memory_order_relaxed)},
        {"invalidRequests", stats_.invalid_requests.load(std::memory_order_relaxed)},
        {"toolCalls", stats_.tool_calls.load(std::memory_order_relaxed)},
        {"timeouts", stats_.timeouts.load(std::memory_order_relaxed)},
        {"internalErrors", stats_.internal_errors.load(std::memory_order_relaxed)},
    };
}

} // namespace mcpgw::rpc
