#pragma once

#include "json_rpc.hpp"

#include <optional>
#include <string>

namespace mcpgw {
namespace rpc {

/**
 * IWorkerBackend - what the Dispatcher needs from the worker side
 *
 * Implemented by worker::WorkerSupervisor in production. Tests plug in a
 * scripted backend to check routing and error mapping without processes.
 *
 * Forwarding calls throw:
 *   WorkerError - the worker answered with a JSON-RPC error object
 *   RpcError    - gateway-side failure (timeout, process failure, ...)
 */
class IWorkerBackend {
public:
    virtual ~IWorkerBackend() = default;

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// Idempotent all-or-nothing bootstrap of every worker
    virtual void initialize() = 0;

    virtual bool is_initialized() const = 0;

    // =========================================================================
    // Capability aggregation (Ready workers only)
    // =========================================================================

    virtual json all_tools() const = 0;
    virtual json all_resources() const = 0;
    virtual json all_prompts() const = 0;

    // =========================================================================
    // Routing and forwarding
    // =========================================================================

    /// Owning worker of a tool, if any worker advertised it
    virtual std::optional<std::string> route_tool(const std::string& tool) const = 0;

    virtual json call_tool(const std::string& worker, const std::string& tool, const json& arguments) = 0;

    /// uri has the form worker://path; returns the first content item
    virtual json read_resource(const std::string& uri) = 0;

    /// First Ready worker advertising the prompt wins
    virtual json get_prompt(const std::string& name, const json& arguments) = 0;
};

} // namespace rpc
} // namespace mcpgw
