#pragma once

/**
 * Dispatcher - JSON-RPC 2.0 method table of the gateway
 *
 * Validates the envelope before anything else, then routes:
 *   initialize                  -> backend bootstrap (idempotent)
 *   ping                        -> {}
 *   tools|resources|prompts/list -> cached capability aggregation
 *   tools/call                  -> routing table -> owning worker
 *   resources/read, prompts/get -> backend lookup
 *
 * handle() never throws. Envelope and routing errors never reach a worker;
 * worker error objects are relayed unchanged; anything unexpected becomes
 * INTERNAL_ERROR.
 */

#include "json_rpc.hpp"
#include "worker_backend.hpp"
#include "../logging/async_logger.hpp"

#include <atomic>
#include <cstdint>
#include <string>
#include <vector>

namespace mcpgw {
namespace rpc {

/**
 * Where a response came from. Transports use it to pick a status code:
 * envelope errors are the client's fault, internal errors are ours, and
 * everything after a successful dispatch (including worker errors) is a
 * normal JSON-RPC reply.
 */
enum class Disposition : uint8_t {
    Dispatched = 0,    // result or post-dispatch error
    EnvelopeError = 1, // rejected before dispatch
    InternalError = 2  // exception escaped a handler
};

struct DispatchResult {
    json response;
    Disposition disposition = Disposition::Dispatched;
};

struct DispatcherStats {
    std::atomic<uint64_t> requests{0};
    std::atomic<uint64_t> errors{0};
    std::atomic<uint64_t> invalid_requests{0};
    std::atomic<uint64_t> tool_calls{0};
    std::atomic<uint64_t> timeouts{0};
    std::atomic<uint64_t> internal_errors{0};
};

class Dispatcher {
public:
    Dispatcher(IWorkerBackend& backend, logging::AsyncLogger& logger);

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;

    DispatchResult dispatch(const json& request);

    /// Response envelope only
    json handle(const json& request) { return dispatch(request).response; }

    /// Methods answered by handle(), in the order they are advertised
    static const std::vector<std::string>& supported_methods();

    const DispatcherStats& stats() const { return stats_; }
    json stats_json() const;

private:
    IWorkerBackend& backend_;
    logging::AsyncLogger& logger_;
    DispatcherStats stats_;

    json route(const std::string& method, const json& params, const json& id);

    json handle_initialize(const json& id);
    json handle_tools_call(const json& params, const json& id);
    json handle_resources_read(const json& params, const json& id);
    json handle_prompts_get(const json& params, const json& id);
    json handle_list(const char* key, json (IWorkerBackend::*list)() const, const char* failure, const json& id);

    json error(int code, const std::string& message, json data, const json& id);
};

} // namespace rpc
} // namespace mcpgw
