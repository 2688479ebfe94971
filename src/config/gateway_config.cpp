#include "../../include/config/gateway_config.hpp"
#include "../../include/logging/async_logger.hpp"

#include <nlohmann/json.hpp>

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <type_traits>

namespace mcpgw::config {

using json = nlohmann::json;
using worker::WorkerDescriptor;

namespace {

bool parse_int(const std::string& text, long long& out) {
    if (text.empty())
        return false;
    char* end = nullptr;
    errno = 0;
    long long value = std::strtoll(text.c_str(), &end, 10);
    if (errno != 0 || end == text.c_str() || *end != '\0')
        return false;
    out = value;
    return true;
}

// "false", "0", "no", "off" disable; anything else enables
bool parse_flag(const std::string& text) {
    return !(text == "false" || text == "0" || text == "no" || text == "off");
}

struct BuiltinWorker {
    const char* name;
    const char* dir;
    int64_t timeout_ms;
    const char* description;
};

constexpr BuiltinWorker BUILTIN_WORKERS[] = {
    {"binance", "binance-mcp", 30000, "Binance exchange integration for market data and trading"},
    {"technical", "crypto-technical-mcp", 15000, "Technical analysis indicators and pattern detection"},
    {"news", "crypto-news-mcp", 10000, "Crypto news aggregation and sentiment analysis"},
    {"social", "crypto-social-mcp", 10000, "Social media sentiment and Fear & Greed index"},
    {"risk", "crypto-risk-mcp", 5000, "Risk management and position sizing calculations"},
    {"ai", "crypto-ai-mcp", 45000, "AI-powered market analysis using Ollama"},
};

WorkerDescriptor parse_descriptor(const json& entry, size_t index) {
    const std::string where = "workers[" + std::to_string(index) + "]";
    if (!entry.is_object()) {
        throw std::runtime_error(where + " must be an object");
    }

    WorkerDescriptor d;

    auto name = entry.find("name");
    if (name == entry.end() || !name->is_string()) {
        throw std::runtime_error(where + ".name must be a string");
    }
    d.name = name->get<std::string>();

    auto command = entry.find("command");
    if (command == entry.end() || !command->is_array()) {
        throw std::runtime_error(where + ".command must be an array of strings");
    }
    for (const auto& arg : *command) {
        if (!arg.is_string()) {
            throw std::runtime_error(where + ".command must be an array of strings");
        }
        d.command.push_back(arg.get<std::string>());
    }

    auto timeout = entry.find("timeout_ms");
    if (timeout != entry.end()) {
        if (!timeout->is_number_integer()) {
            throw std::runtime_error(where + ".timeout_ms must be an integer");
        }
        d.timeout = std::chrono::milliseconds(timeout->get<int64_t>());
    } else {
        d.timeout = std::chrono::milliseconds(workers::DEFAULT_TIMEOUT_MS);
    }

    d.description = entry.value("description", std::string());
    d.working_dir = entry.value("working_dir", std::string());

    auto env = entry.find("env");
    if (env != entry.end()) {
        if (!env->is_object()) {
            throw std::runtime_error(where + ".env must be an object of strings");
        }
        for (const auto& [key, value] : env->items()) {
            if (!value.is_string()) {
                throw std::runtime_error(where + ".env." + key + " must be a string");
            }
            d.env[key] = value.get<std::string>();
        }
    }
    return d;
}

} // namespace

// =============================================================================
// Environment
// =============================================================================

GatewayConfig GatewayConfig::from_env(const std::function<const char*(const char*)>& getenv_fn) {
    GatewayConfig cfg;

    auto get = [&](const char* key) -> std::string {
        const char* value = getenv_fn(key);
        return value ? std::string(value) : std::string();
    };

    auto get_int = [&](const char* key, auto& target) {
        std::string raw = get(key);
        if (raw.empty())
            return;
        long long value = 0;
        if (!parse_int(raw, value)) {
            cfg.parse_errors.push_back(std::string("Invalid ") + key + ": '" + raw + "' is not an integer");
            return;
        }
        target = static_cast<std::remove_reference_t<decltype(target)>>(value);
    };

    std::string value;
    if (!(value = get("MCP_HOST")).empty())
        cfg.host = value;
    get_int("MCP_PORT", cfg.port);

    if (!(value = get("ENABLE_WEBSOCKET")).empty())
        cfg.enable_websocket = parse_flag(value);
    get_int("MCP_WS_PORT", cfg.ws_port);

    long long max_body = -1;
    get_int("MAX_BODY_BYTES", max_body);
    if (max_body > 0)
        cfg.max_body_bytes = static_cast<size_t>(max_body);
    else if (max_body == 0 || max_body < -1)
        cfg.parse_errors.push_back("Invalid MAX_BODY_BYTES: must be positive");

    long long ws_in_flight = static_cast<long long>(cfg.ws_max_in_flight);
    get_int("WS_MAX_IN_FLIGHT", ws_in_flight);
    if (ws_in_flight < 0)
        ws_in_flight = 0; // rejected by validate()
    cfg.ws_max_in_flight = static_cast<size_t>(ws_in_flight);

    if (!(value = get("LOG_LEVEL")).empty())
        cfg.log_level = value;

    if (!(value = get("PYTHON_PATH")).empty())
        cfg.python = value;
    if (!(value = get("MCP_SERVERS_DIR")).empty())
        cfg.servers_dir = value;
    if (!(value = get("MCP_WORKERS_FILE")).empty())
        cfg.workers_file = value;

    long long grace_ms = cfg.shutdown_grace.count();
    get_int("SHUTDOWN_GRACE_MS", grace_ms);
    cfg.shutdown_grace = std::chrono::milliseconds(grace_ms);

    long long max_pending = static_cast<long long>(cfg.max_pending_per_worker);
    get_int("MAX_PENDING_PER_WORKER", max_pending);
    if (max_pending < 0)
        max_pending = 0; // rejected by validate()
    cfg.max_pending_per_worker = static_cast<size_t>(max_pending);

    return cfg;
}

GatewayConfig GatewayConfig::from_env() {
    return from_env([](const char* key) { return std::getenv(key); });
}

// =============================================================================
// Validation
// =============================================================================

std::vector<std::string> GatewayConfig::validate() const {
    std::vector<std::string> errors = parse_errors;

    if (port < 1 || port > 65535) {
        errors.push_back("Invalid port: " + std::to_string(port) + ". Must be between 1 and 65535.");
    }
    if (enable_websocket) {
        if (ws_port < 1 || ws_port > 65535) {
            errors.push_back("Invalid WebSocket port: " + std::to_string(ws_port) + ". Must be between 1 and 65535.");
        } else if (ws_port == port) {
            errors.push_back("WebSocket port " + std::to_string(ws_port) + " must differ from the HTTP port");
        }
    }

    mcpgw::logging::LogLevel level;
    if (!mcpgw::logging::parse_level(log_level, level)) {
        errors.push_back("Invalid log level: " + log_level +
                         ". Must be one of: fatal, error, warn, info, debug, trace");
    }

    if (shutdown_grace.count() < workers::MIN_SHUTDOWN_GRACE_MS) {
        errors.push_back("Shutdown grace period too low: " + std::to_string(shutdown_grace.count()) +
                         "ms. Minimum is " + std::to_string(workers::MIN_SHUTDOWN_GRACE_MS) + "ms.");
    }
    if (max_pending_per_worker < 1) {
        errors.push_back("Max pending requests per worker must be at least 1");
    }
    if (enable_websocket && ws_max_in_flight < 1) {
        errors.push_back("WebSocket in-flight limit must be at least 1");
    }
    if (host.empty()) {
        errors.push_back("Host must not be empty");
    }
    return errors;
}

// =============================================================================
// Workers
// =============================================================================

std::vector<WorkerDescriptor> default_workers(const std::string& python, const std::string& servers_dir) {
    std::vector<WorkerDescriptor> out;
    for (const auto& w : BUILTIN_WORKERS) {
        WorkerDescriptor d;
        d.name = w.name;
        d.command = {python, servers_dir + "/" + w.dir + "/" + workers::ENTRY_POINT};
        d.timeout = std::chrono::milliseconds(w.timeout_ms);
        d.description = w.description;
        out.push_back(std::move(d));
    }
    return out;
}

std::vector<WorkerDescriptor> parse_workers(const std::string& text) {
    json doc = json::parse(text, nullptr, false);
    if (doc.is_discarded()) {
        throw std::runtime_error("Worker descriptor file is not valid JSON");
    }
    if (!doc.is_array()) {
        throw std::runtime_error("Worker descriptor file must contain a JSON array");
    }

    std::vector<WorkerDescriptor> out;
    for (size_t i = 0; i < doc.size(); ++i) {
        out.push_back(parse_descriptor(doc[i], i));
    }
    return out;
}

std::vector<WorkerDescriptor> load_workers_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open worker descriptor file " + path);
    }
    std::stringstream ss;
    ss << in.rdbuf();
    return parse_workers(ss.str());
}

std::vector<WorkerDescriptor> GatewayConfig::load_workers() const {
    if (!workers_file.empty()) {
        return load_workers_file(workers_file);
    }
    return default_workers(python, servers_dir);
}

} // namespace mcpgw::config
