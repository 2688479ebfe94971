/**
 * Transport mapping tests
 *
 * The transport-independent half of the listeners: body parsing, HTTP
 * status selection, health and metrics documents. No sockets involved.
 */

#include "../include/transport/dispatch_gate.hpp"
#include "../include/transport/endpoints.hpp"

#include <cassert>
#include <chrono>
#include <iostream>
#include <string>
#include <thread>

using namespace mcpgw;
using namespace mcpgw::transport;
namespace error_code = mcpgw::rpc::error_code;

#define TEST(name) void name()
#define RUN_TEST(name) do { \
    std::cout << "Running " << #name << "... "; \
    name(); \
    std::cout << "PASSED\n"; \
} while(0)

#define ASSERT_TRUE(x) assert(x)
#define ASSERT_FALSE(x) assert(!(x))
#define ASSERT_EQ(a, b) assert((a) == (b))

// Full gateway wiring around a worker set that cannot start
struct Fixture {
    config::GatewayConfig cfg;
    logging::AsyncLogger logger;
    worker::WorkerSupervisor supervisor;
    rpc::Dispatcher dispatcher;
    GatewayContext ctx;

    Fixture()
        : supervisor(make_descriptors(), worker::SupervisorOptions{}, logger),
          dispatcher(supervisor, logger),
          ctx(cfg, logger, supervisor, dispatcher) {}

    static std::vector<worker::WorkerDescriptor> make_descriptors() {
        worker::WorkerDescriptor d;
        d.name = "market-data";
        d.command = {"/nonexistent/mcp-worker"};
        d.timeout = std::chrono::milliseconds(1000);
        d.description = "Market data";
        return {d};
    }
};

TEST(test_http_status_mapping) {
    ASSERT_EQ(http_status(rpc::Disposition::Dispatched), 200);
    ASSERT_EQ(http_status(rpc::Disposition::EnvelopeError), 400);
    ASSERT_EQ(http_status(rpc::Disposition::InternalError), 500);
}

TEST(test_unparseable_body) {
    Fixture f;
    HttpReply reply = handle_http_body(f.dispatcher, "{\"jsonrpc\":\"2.0\",");
    ASSERT_EQ(reply.status, 400);
    ASSERT_TRUE(reply.parse_error);
    ASSERT_EQ(reply.body["error"]["code"], error_code::PARSE_ERROR);
    ASSERT_EQ(reply.body["error"]["message"], "Parse error");
    ASSERT_TRUE(reply.body["id"].is_null());
    // Never reached the dispatcher
    ASSERT_EQ(f.dispatcher.stats().requests.load(), 0u);
}

TEST(test_invalid_envelope_is_400_with_id) {
    Fixture f;
    HttpReply reply = handle_http_body(f.dispatcher, R"({"method":"tools/list","id":1})");
    ASSERT_EQ(reply.status, 400);
    ASSERT_FALSE(reply.parse_error);
    ASSERT_EQ(reply.body["error"]["code"], error_code::INVALID_REQUEST);
    ASSERT_EQ(reply.body["id"], 1);
}

TEST(test_dispatched_errors_are_200) {
    Fixture f;
    HttpReply unknown = handle_http_body(f.dispatcher, R"({"jsonrpc":"2.0","method":"nope","id":2})");
    ASSERT_EQ(unknown.status, 200);
    ASSERT_EQ(unknown.body["error"]["code"], error_code::METHOD_NOT_FOUND);

    HttpReply no_tool =
        handle_http_body(f.dispatcher, R"({"jsonrpc":"2.0","method":"tools/call","params":{"name":"x"},"id":3})");
    ASSERT_EQ(no_tool.status, 200);
    ASSERT_EQ(no_tool.body["error"]["message"], "Tool not found");

    HttpReply ping = handle_http_body(f.dispatcher, R"({"jsonrpc":"2.0","method":"ping","id":4})");
    ASSERT_EQ(ping.status, 200);
    ASSERT_EQ(ping.body["result"], json::object());
}

TEST(test_failed_initialize_is_reported_not_fatal) {
    Fixture f;
    HttpReply reply = handle_http_body(f.dispatcher, R"({"jsonrpc":"2.0","method":"initialize","id":5})");
    ASSERT_EQ(reply.status, 200);
    ASSERT_EQ(reply.body["error"]["code"], error_code::MCP_BRIDGE_ERROR);
    ASSERT_FALSE(f.supervisor.is_initialized());

    HttpReply health = health_report(f.ctx);
    ASSERT_EQ(health.status, 503);
    ASSERT_EQ(health.body["status"], "unhealthy");
    ASSERT_TRUE(health.body.contains("lastError"));
}

TEST(test_ws_message) {
    Fixture f;
    json parse_failure = handle_ws_message(f.dispatcher, "not json");
    ASSERT_EQ(parse_failure["error"]["code"], error_code::PARSE_ERROR);
    ASSERT_TRUE(parse_failure["id"].is_null());

    json pong = handle_ws_message(f.dispatcher, R"({"jsonrpc":"2.0","method":"ping","id":"w1"})");
    ASSERT_EQ(pong["id"], "w1");
    ASSERT_TRUE(pong.contains("result"));
}

TEST(test_health_before_initialize) {
    Fixture f;
    HttpReply health = health_report(f.ctx);
    ASSERT_EQ(health.status, 503);
    ASSERT_EQ(health.body["status"], "unhealthy");
    ASSERT_EQ(health.body["version"], GATEWAY_VERSION);
    ASSERT_TRUE(health.body["timestamp"].is_string());
    ASSERT_FALSE(health.body.contains("lastError"));

    const json& w = health.body["workers"]["market-data"];
    ASSERT_EQ(w["ready"], false);
    ASSERT_EQ(w["state"], "stopped");
    ASSERT_TRUE(w["pid"].is_null());
    ASSERT_EQ(w["description"], "Market data");
    ASSERT_EQ(w["toolCount"], 0);
}

TEST(test_metrics_document) {
    Fixture f;
    f.ctx.metrics.http_requests.fetch_add(3);
    f.ctx.metrics.http_errors.fetch_add(1);
    f.ctx.metrics.ws_messages.fetch_add(2);
    handle_http_body(f.dispatcher, R"({"jsonrpc":"2.0","method":"ping","id":1})");

    json m = metrics_report(f.ctx);
    ASSERT_EQ(m["requests"], 5);
    ASSERT_EQ(m["errors"], 1);
    ASSERT_EQ(m["http"]["requests"], 3);
    ASSERT_EQ(m["websocket"]["messages"], 2);
    ASSERT_EQ(m["websocket"]["rejected"], 0);
    ASSERT_EQ(m["rpc"]["requests"], 1);
    ASSERT_TRUE(m["logger"].contains("dropped"));
    ASSERT_TRUE(m["workers"].is_object());
}

TEST(test_not_found_body) {
    json body = not_found_body("/admin");
    ASSERT_EQ(body["error"]["code"], error_code::METHOD_NOT_FOUND);
    std::string data = body["error"]["data"];
    ASSERT_TRUE(data.find("/admin") != std::string::npos);
    ASSERT_TRUE(data.find("/mcp") != std::string::npos);
}

TEST(test_serialize_tolerates_invalid_utf8) {
    json value = {{"text", std::string("bad \xff byte")}};
    std::string out = serialize(value);
    ASSERT_FALSE(out.empty());
    ASSERT_TRUE(out.find('\n') == std::string::npos);
}

TEST(test_ws_rejection_replies) {
    json busy = ws_rejection(R"({"jsonrpc":"2.0","method":"tools/call","id":"q7"})", false, 64);
    ASSERT_EQ(busy["error"]["code"], error_code::MCP_RATE_LIMIT_ERROR);
    ASSERT_EQ(busy["id"], "q7");
    ASSERT_TRUE(busy["error"]["data"].get<std::string>().find("64") != std::string::npos);

    json closing = ws_rejection(R"({"jsonrpc":"2.0","method":"ping","id":3})", true, 64);
    ASSERT_EQ(closing["error"]["code"], error_code::MCP_BRIDGE_ERROR);
    ASSERT_EQ(closing["id"], 3);

    ASSERT_TRUE(ws_rejection("not json", false, 1)["id"].is_null());
}

TEST(test_dispatch_gate_caps_concurrency) {
    DispatchGate gate(2);
    ASSERT_TRUE(gate.try_enter());
    ASSERT_TRUE(gate.try_enter());
    ASSERT_FALSE(gate.try_enter());
    ASSERT_EQ(gate.in_flight(), 2u);

    gate.leave();
    ASSERT_TRUE(gate.try_enter());
    gate.leave();
    gate.leave();
    ASSERT_TRUE(gate.wait_idle(std::chrono::milliseconds(0)));
}

TEST(test_closed_gate_drains_admitted_work) {
    DispatchGate gate(4);
    ASSERT_TRUE(gate.try_enter());

    gate.close();
    ASSERT_TRUE(gate.is_closed());
    ASSERT_FALSE(gate.try_enter());
    ASSERT_FALSE(gate.wait_idle(std::chrono::milliseconds(20)));

    std::thread holder([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        gate.leave();
    });
    ASSERT_TRUE(gate.wait_idle(std::chrono::milliseconds(2000)));
    holder.join();

    gate.reopen();
    ASSERT_TRUE(gate.try_enter());
    gate.leave();
}

int main() {
    std::cout << "=== Transport Mapping Tests ===\n";
    RUN_TEST(test_http_status_mapping);
    RUN_TEST(test_unparseable_body);
    RUN_TEST(test_invalid_envelope_is_400_with_id);
    RUN_TEST(test_dispatched_errors_are_200);
    RUN_TEST(test_failed_initialize_is_reported_not_fatal);
    RUN_TEST(test_ws_message);
    RUN_TEST(test_health_before_initialize);
    RUN_TEST(test_metrics_document);
    RUN_TEST(test_not_found_body);
    RUN_TEST(test_serialize_tolerates_invalid_utf8);
    RUN_TEST(test_ws_rejection_replies);
    RUN_TEST(test_dispatch_gate_caps_concurrency);
    RUN_TEST(test_closed_gate_drains_admitted_work);
    std::cout << "All tests passed!\n";
    return 0;
}
