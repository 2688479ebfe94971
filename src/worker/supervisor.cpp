#include "../../include/worker/supervisor.hpp"

#include <thread>

namespace mcpgw::worker {

namespace LogCategory = logging::LogCategory;
using rpc::RpcError;
using rpc::WorkerError;
namespace error_code = rpc::error_code;
namespace method = rpc::method;

namespace {

std::string join(const std::vector<std::string>& parts, const char* separator) {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0)
            out += separator;
        out += parts[i];
    }
    return out;
}

std::string error_message(const json& response) {
    const json& error = response["error"];
    if (error.is_object() && error.contains("message") && error["message"].is_string())
        return error["message"].get<std::string>();
    return "unknown error";
}

// Result of a response envelope, or the worker's error as an exception
json unwrap_result(const std::string& worker, json response) {
    if (rpc::is_error_response(response)) {
        throw WorkerError(response["error"]);
    }
    auto result = response.find("result");
    if (result == response.end()) {
        throw RpcError(error_code::MCP_SERVER_ERROR, "Worker " + worker + " returned neither result nor error");
    }
    return *result;
}

} // namespace

// =============================================================================
// Construction
// =============================================================================

WorkerSupervisor::WorkerSupervisor(std::vector<WorkerDescriptor> descriptors, SupervisorOptions options,
                                   logging::AsyncLogger& logger)
    : descriptors_(std::move(descriptors)), options_(options), logger_(logger) {}

WorkerSupervisor::~WorkerSupervisor() {
    shutdown();
}

void WorkerSupervisor::set_crash_callback(CrashCallback cb) {
    std::lock_guard<std::mutex> lock(crash_mutex_);
    crash_callback_ = std::move(cb);
}

// =============================================================================
// Startup
// =============================================================================

void WorkerSupervisor::initialize() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (initialized_.load(std::memory_order_acquire))
        return;

    auto config_errors = validate_descriptors(descriptors_);
    if (!config_errors.empty()) {
        std::string message = "Invalid worker configuration: " + join(config_errors, "; ");
        {
            std::lock_guard<std::mutex> lock(workers_mutex_);
            last_error_ = message;
        }
        throw RpcError(error_code::MCP_BRIDGE_ERROR, message);
    }

    LOGF_INFO(logger_, LogCategory::System, "Initializing MCP bridge (%zu workers)...", descriptors_.size());

    std::vector<std::shared_ptr<WorkerProcess>> started;
    for (const auto& descriptor : descriptors_) {
        auto worker = std::make_shared<WorkerProcess>(descriptor, options_.max_pending_per_worker, logger_);
        worker->set_exit_callback(
            [this](WorkerProcess& w, int exit_code, int signal) { on_worker_exit(w, exit_code, signal); });
        started.push_back(std::move(worker));
    }

    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers_.clear();
        routing_.clear();
        for (const auto& worker : started) {
            workers_[worker->name()] = worker;
        }
    }

    // Handshakes run concurrently; each thread writes only its own slot
    std::vector<std::string> reasons(started.size());
    std::vector<std::thread> threads;
    threads.reserve(started.size());
    for (size_t i = 0; i < started.size(); ++i) {
        threads.emplace_back([this, &started, &reasons, i]() {
            try {
                start_worker(*started[i]);
            } catch (const std::exception& e) {
                reasons[i] = e.what();
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    std::vector<std::string> failures;
    json failed_workers = json::array();
    for (size_t i = 0; i < started.size(); ++i) {
        if (!reasons[i].empty()) {
            failures.push_back(started[i]->name() + ": " + reasons[i]);
            failed_workers.push_back(started[i]->name());
            LOGF_ERROR(logger_, LogCategory::Worker, "Failed to initialize worker %s: %s",
                       started[i]->name().c_str(), reasons[i].c_str());
        }
    }

    rpc::RoutingTable routing;
    if (failures.empty()) {
        for (const auto& worker : started) {
            for (const auto& tool : worker->capabilities().tools) {
                if (!tool.is_object() || !tool.contains("name") || !tool["name"].is_string()) {
                    LOGF_WARN(logger_, LogCategory::Worker, "Worker %s advertised a tool without a name",
                              worker->name().c_str());
                    continue;
                }
                std::string tool_name = tool["name"].get<std::string>();
                std::string owner;
                if (!routing.add(tool_name, worker->name(), &owner)) {
                    failures.push_back("duplicate tool '" + tool_name + "' advertised by " + owner + " and " +
                                       worker->name());
                }
            }
        }
    }

    if (!failures.empty()) {
        std::string message = join(failures, "; ");
        stop_workers(started);
        {
            std::lock_guard<std::mutex> lock(workers_mutex_);
            workers_.clear();
            routing_.clear();
            last_error_ = message;
        }
        LOGF_ERROR(logger_, LogCategory::System, "MCP bridge initialization failed: %s", message.c_str());
        throw RpcError(error_code::MCP_BRIDGE_ERROR, "MCP bridge initialization failed: " + message,
                       json{{"failedWorkers", failed_workers}});
    }

    size_t routed = routing.size();
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        routing_ = std::move(routing);
        last_error_.clear();
    }
    initialized_.store(true, std::memory_order_release);

    LOGF_INFO(logger_, LogCategory::System, "All MCP workers initialized (%zu tools routed)", routed);
}

void WorkerSupervisor::start_worker(WorkerProcess& worker) {
    LOGF_INFO(logger_, LogCategory::Worker, "Starting MCP worker %s", worker.name().c_str());

    worker.spawn();
    worker.transition(WorkerState::NotReady, WorkerState::Handshaking);

    handshake(worker);
    load_capabilities(worker);

    if (!worker.transition(WorkerState::Handshaking, WorkerState::Ready)) {
        throw RpcError(error_code::MCP_BRIDGE_ERROR,
                       "Worker exited during handshake (state " + std::string(state_to_string(worker.state())) + ")");
    }

    LOGF_INFO(logger_, LogCategory::Worker, "MCP worker %s ready (%zu tools, %zu resources, %zu prompts)",
              worker.name().c_str(), worker.capabilities().tools.size(), worker.capabilities().resources.size(),
              worker.capabilities().prompts.size());
}

void WorkerSupervisor::handshake(WorkerProcess& worker) {
    json params = {
        {"protocolVersion", rpc::PROTOCOL_VERSION},
        {"capabilities", {{"roots", {{"listChanged", false}}}, {"sampling", json::object()}}},
        {"clientInfo", {{"name", rpc::CLIENT_NAME}, {"version", rpc::CLIENT_VERSION}}},
    };

    json response = worker.send_request(rpc::make_request(method::INITIALIZE, params, next_request_id()));

    if (rpc::is_error_response(response)) {
        throw RpcError(error_code::MCP_BRIDGE_ERROR, "Server initialization failed: " + error_message(response));
    }

    auto result = response.find("result");
    if (result == response.end() || !result->is_object()) {
        throw RpcError(error_code::MCP_BRIDGE_ERROR, "Handshake response has no result object");
    }

    auto version = result->find("protocolVersion");
    if (version == result->end() || !version->is_string()) {
        throw RpcError(error_code::MCP_BRIDGE_ERROR, "Handshake response has no protocolVersion");
    }
    if (version->get<std::string>() != rpc::PROTOCOL_VERSION) {
        throw RpcError(error_code::MCP_BRIDGE_ERROR, "Protocol version mismatch: worker speaks " +
                                                         version->get<std::string>() + ", gateway speaks " +
                                                         rpc::PROTOCOL_VERSION);
    }

    auto capabilities = result->find("capabilities");
    if (capabilities == result->end() || !capabilities->is_object()) {
        throw RpcError(error_code::MCP_BRIDGE_ERROR, "Handshake response has no capabilities");
    }

    auto server_info = result->find("serverInfo");
    if (server_info == result->end() || !server_info->is_object()) {
        throw RpcError(error_code::MCP_BRIDGE_ERROR, "Handshake response has no serverInfo");
    }

    LOGF_DEBUG(logger_, LogCategory::Worker, "[%s] handshake ok (%s)", worker.name().c_str(),
               server_info->value("name", std::string("unnamed")).c_str());

    worker.send_notification(rpc::make_notification(method::INITIALIZED));
}

void WorkerSupervisor::load_capabilities(WorkerProcess& worker) {
    CapabilitySet capabilities;
    capabilities.tools = list_capability(worker, method::TOOLS_LIST, "tools", true);

    // Resources and prompts are optional; absence is not an error
    try {
        capabilities.resources = list_capability(worker, method::RESOURCES_LIST, "resources", false);
    } catch (const RpcError& e) {
        LOGF_DEBUG(logger_, LogCategory::Worker, "Worker %s does not support resources: %s", worker.name().c_str(),
                   e.what());
    }

    try {
        capabilities.prompts = list_capability(worker, method::PROMPTS_LIST, "prompts", false);
    } catch (const RpcError& e) {
        LOGF_DEBUG(logger_, LogCategory::Worker, "Worker %s does not support prompts: %s", worker.name().c_str(),
                   e.what());
    }

    worker.publish_capabilities(std::move(capabilities));
}

json WorkerSupervisor::list_capability(WorkerProcess& worker, const char* list_method, const char* key,
                                       bool required) {
    json response = worker.send_request(rpc::make_request(list_method, nullptr, next_request_id()));

    if (rpc::is_error_response(response)) {
        if (required) {
            throw RpcError(error_code::MCP_BRIDGE_ERROR,
                           std::string(list_method) + " failed: " + error_message(response));
        }
        throw WorkerError(response["error"]);
    }

    json list = json::array();
    auto result = response.find("result");
    if (result != response.end() && result->is_object()) {
        auto entries = result->find(key);
        if (entries != result->end() && entries->is_array()) {
            list = *entries;
        }
    }

    for (auto& entry : list) {
        if (entry.is_object()) {
            entry["serverName"] = worker.name();
        }
    }
    return list;
}

void WorkerSupervisor::on_worker_exit(WorkerProcess& worker, int exit_code, int signal) {
    LOGF_ERROR(logger_, LogCategory::Worker, "MCP worker %s crashed (code=%d signal=%d); not restarting",
               worker.name().c_str(), exit_code, signal);

    CrashCallback cb;
    {
        std::lock_guard<std::mutex> lock(crash_mutex_);
        cb = crash_callback_;
    }
    if (cb) {
        cb(worker.name(), exit_code, signal);
    }
}

// =============================================================================
// Shutdown
// =============================================================================

void WorkerSupervisor::shutdown() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

    std::vector<std::shared_ptr<WorkerProcess>> workers;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        for (const auto& [name, worker] : workers_) {
            workers.push_back(worker);
        }
    }
    initialized_.store(false, std::memory_order_release);

    if (workers.empty())
        return;

    LOG_INFO(logger_, LogCategory::System, "Shutting down MCP bridge...");
    stop_workers(workers);

    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers_.clear();
        routing_.clear();
    }
    LOG_INFO(logger_, LogCategory::System, "MCP bridge shutdown complete");
}

void WorkerSupervisor::stop_workers(const std::vector<std::shared_ptr<WorkerProcess>>& workers) {
    std::vector<std::thread> threads;
    threads.reserve(workers.size());
    for (const auto& worker : workers) {
        threads.emplace_back([this, worker]() {
            try {
                worker->terminate(options_.shutdown_grace);
            } catch (const std::exception& e) {
                LOGF_ERROR(logger_, LogCategory::Worker, "Error stopping worker %s: %s", worker->name().c_str(),
                           e.what());
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
}

// =============================================================================
// Forwarding
// =============================================================================

std::shared_ptr<WorkerProcess> WorkerSupervisor::find_worker(const std::string& name) const {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    auto it = workers_.find(name);
    if (it == workers_.end())
        return nullptr;
    return it->second;
}

json WorkerSupervisor::send_request(const std::string& worker_name, const json& request) {
    auto worker = find_worker(worker_name);
    if (!worker) {
        throw RpcError(error_code::MCP_SERVER_ERROR, "Worker " + worker_name + " not found");
    }

    auto m = request.find("method");
    bool bootstrap = m != request.end() && m->is_string() && m->get<std::string>() == method::INITIALIZE;
    if (!worker->is_ready() && !bootstrap) {
        throw RpcError(error_code::MCP_BRIDGE_ERROR, "Worker " + worker_name + " not ready",
                       json{{"state", state_to_string(worker->state())}});
    }

    return worker->send_request(request);
}

json WorkerSupervisor::call_tool(const std::string& worker, const std::string& tool, const json& arguments) {
    json params = {{"name", tool}, {"arguments", arguments.is_null() ? json::object() : arguments}};
    json response = send_request(worker, rpc::make_request(method::TOOLS_CALL, params, next_request_id()));
    return unwrap_result(worker, std::move(response));
}

json WorkerSupervisor::read_resource(const std::string& uri) {
    // worker://path
    auto sep = uri.find("://");
    if (sep == std::string::npos || sep == 0) {
        throw RpcError(error_code::INVALID_PARAMS, "Resource URI must have the form worker://path",
                       json{{"uri", uri}});
    }
    std::string worker = uri.substr(0, sep);
    std::string path = uri.substr(sep + 3);

    json response =
        send_request(worker, rpc::make_request(method::RESOURCES_READ, json{{"uri", path}}, next_request_id()));
    json result = unwrap_result(worker, std::move(response));

    if (!result.is_object() || !result.contains("contents") || !result["contents"].is_array() ||
        result["contents"].empty()) {
        throw RpcError(error_code::MCP_SERVER_ERROR, "Worker " + worker + " returned no resource contents");
    }
    return result["contents"][0];
}

json WorkerSupervisor::get_prompt(const std::string& name, const json& arguments) {
    std::shared_ptr<WorkerProcess> target;
    for (const auto& worker : ready_workers()) {
        for (const auto& prompt : worker->capabilities().prompts) {
            if (prompt.is_object() && prompt.value("name", std::string()) == name) {
                target = worker;
                break;
            }
        }
        if (target)
            break;
    }

    if (!target) {
        throw RpcError(error_code::METHOD_NOT_FOUND, "Prompt " + name + " not found in any worker");
    }

    json params = {{"name", name}};
    if (!arguments.is_null()) {
        params["arguments"] = arguments;
    }
    json response = send_request(target->name(), rpc::make_request(method::PROMPTS_GET, params, next_request_id()));
    return unwrap_result(target->name(), std::move(response));
}

std::optional<std::string> WorkerSupervisor::route_tool(const std::string& tool) const {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    return routing_.lookup(tool);
}

// =============================================================================
// Aggregation and status
// =============================================================================

std::vector<std::shared_ptr<WorkerProcess>> WorkerSupervisor::ready_workers() const {
    std::vector<std::shared_ptr<WorkerProcess>> ready;
    std::lock_guard<std::mutex> lock(workers_mutex_);
    for (const auto& descriptor : descriptors_) {
        auto it = workers_.find(descriptor.name);
        if (it != workers_.end() && it->second->is_ready()) {
            ready.push_back(it->second);
        }
    }
    return ready;
}

json WorkerSupervisor::aggregate(json CapabilitySet::*list) const {
    json all = json::array();
    for (const auto& worker : ready_workers()) {
        for (const auto& entry : worker->capabilities().*list) {
            all.push_back(entry);
        }
    }
    return all;
}

json WorkerSupervisor::all_tools() const {
    return aggregate(&CapabilitySet::tools);
}

json WorkerSupervisor::all_resources() const {
    return aggregate(&CapabilitySet::resources);
}

json WorkerSupervisor::all_prompts() const {
    return aggregate(&CapabilitySet::prompts);
}

json WorkerSupervisor::status() const {
    json out = json::object();
    std::lock_guard<std::mutex> lock(workers_mutex_);
    for (const auto& descriptor : descriptors_) {
        auto it = workers_.find(descriptor.name);
        if (it == workers_.end()) {
            // Configured but not running (never started or torn down after a failed startup)
            out[descriptor.name] = {
                {"ready", false},
                {"state", "stopped"},
                {"pid", nullptr},
                {"description", descriptor.description},
                {"toolCount", 0},
                {"resourceCount", 0},
                {"promptCount", 0},
                {"pendingRequests", 0},
            };
            continue;
        }

        const auto& worker = it->second;
        bool published = worker->capabilities_published();
        const auto& caps = worker->capabilities();
        out[descriptor.name] = {
            {"ready", worker->is_ready()},
            {"state", state_to_string(worker->state())},
            {"pid", worker->pid() > 0 ? json(worker->pid()) : json(nullptr)},
            {"description", descriptor.description},
            {"toolCount", published ? caps.tools.size() : 0},
            {"resourceCount", published ? caps.resources.size() : 0},
            {"promptCount", published ? caps.prompts.size() : 0},
            {"pendingRequests", worker->pending_count()},
        };
    }
    return out;
}

json WorkerSupervisor::stats() const {
    json out = json::object();
    std::lock_guard<std::mutex> lock(workers_mutex_);
    for (const auto& [name, worker] : workers_) {
        bool published = worker->capabilities_published();
        const auto& caps = worker->capabilities();
        out[name] = {
            {"isReady", worker->is_ready()},
            {"pendingRequests", worker->pending_count()},
            {"timeouts", worker->timeouts()},
            {"lateResponses", worker->late_responses()},
            {"discardedLines", worker->discarded_lines()},
            {"timeoutMs", worker->descriptor().timeout.count()},
            {"capabilities",
             {{"tools", published ? caps.tools.size() : 0},
              {"resources", published ? caps.resources.size() : 0},
              {"prompts", published ? caps.prompts.size() : 0}}},
        };
    }
    return out;
}

HealthState WorkerSupervisor::health() const {
    if (!is_initialized())
        return HealthState::Unhealthy;

    std::lock_guard<std::mutex> lock(workers_mutex_);
    if (workers_.empty())
        return HealthState::Unhealthy;

    size_t ready = 0;
    for (const auto& [name, worker] : workers_) {
        if (worker->is_ready())
            ready++;
    }
    if (ready == workers_.size())
        return HealthState::Healthy;
    return ready > 0 ? HealthState::Degraded : HealthState::Unhealthy;
}

std::string WorkerSupervisor::last_error() const {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    return last_error_;
}

} // namespace mcpgw::worker
