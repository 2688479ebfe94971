/**
 * WorkerSupervisor integration tests
 *
 * Drives real child processes (tests/fake_worker.cpp) through the whole
 * lifecycle: handshake, capability discovery, routing, correlation of
 * concurrent calls, timeouts, crashes and two-phase shutdown.
 */

#include "../include/rpc/dispatcher.hpp"
#include "../include/transport/dispatch_gate.hpp"
#include "../include/worker/supervisor.hpp"

#include <atomic>
#include <cassert>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <functional>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#ifndef FAKE_WORKER_PATH
#error "FAKE_WORKER_PATH must point at the fake_worker binary"
#endif

using namespace mcpgw;
using namespace mcpgw::worker;
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

WorkerDescriptor fake(const std::string& name, std::vector<std::string> flags, int timeout_ms = 2000) {
    WorkerDescriptor d;
    d.name = name;
    d.command = {FAKE_WORKER_PATH, "--name", name};
    for (auto& f : flags)
        d.command.push_back(std::move(f));
    d.timeout = std::chrono::milliseconds(timeout_ms);
    d.description = "Fake " + name;
    return d;
}

// Runs the worker under a shell that leaves a background child holding its stdout
WorkerDescriptor behind_shell(WorkerDescriptor d) {
    std::vector<std::string> command = {"/bin/sh", "-c", "sleep 30 & exec \"$0\" \"$@\""};
    command.insert(command.end(), d.command.begin(), d.command.end());
    d.command = std::move(command);
    return d;
}

SupervisorOptions fast_options() {
    SupervisorOptions options;
    options.shutdown_grace = std::chrono::milliseconds(300);
    options.max_pending_per_worker = 16;
    return options;
}

bool process_gone(pid_t pid) {
    return ::kill(pid, 0) != 0 && errno == ESRCH;
}

pid_t pid_of(const WorkerSupervisor& sup, const std::string& name) {
    return sup.status()[name]["pid"].get<pid_t>();
}

std::string text_of(const json& tool_result) {
    return tool_result["content"][0]["text"].get<std::string>();
}

int expect_rpc_error(const std::function<void()>& fn, std::string* message = nullptr) {
    try {
        fn();
    } catch (const rpc::RpcError& e) {
        if (message)
            *message = e.what();
        return e.code();
    }
    assert(false && "expected RpcError");
    return 0;
}

template <typename Pred>
bool wait_until(Pred pred, int timeout_ms = 3000) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred())
            return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return pred();
}

// ============================================================================
// Startup and discovery
// ============================================================================

TEST(test_initialize_discovers_capabilities) {
    logging::AsyncLogger logger;
    WorkerSupervisor sup({fake("market", {"--tools", "get_price,get_volume", "--resources", "--prompts", "daily_brief"}),
                          fake("trading", {"--tools", "place_order"})},
                         fast_options(), logger);

    sup.initialize();
    ASSERT_TRUE(sup.is_initialized());
    ASSERT_TRUE(sup.health() == HealthState::Healthy);
    ASSERT_TRUE(sup.last_error().empty());

    json tools = sup.all_tools();
    ASSERT_EQ(tools.size(), 3u);
    ASSERT_EQ(tools[0]["name"], "get_price");
    ASSERT_EQ(tools[0]["serverName"], "market");
    ASSERT_EQ(tools[2]["serverName"], "trading");

    ASSERT_EQ(sup.all_resources().size(), 1u);
    ASSERT_EQ(sup.all_prompts().size(), 1u);
    ASSERT_EQ(sup.all_prompts()[0]["serverName"], "market");

    ASSERT_EQ(*sup.route_tool("place_order"), "trading");
    ASSERT_EQ(*sup.route_tool("get_volume"), "market");
    ASSERT_FALSE(sup.route_tool("launch").has_value());

    json status = sup.status();
    ASSERT_EQ(status["market"]["ready"], true);
    ASSERT_EQ(status["market"]["state"], "ready");
    ASSERT_EQ(status["market"]["toolCount"], 2);
    ASSERT_EQ(status["trading"]["resourceCount"], 0);
    ASSERT_TRUE(pid_of(sup, "market") > 0);

    // Second initialize is a no-op
    pid_t before = pid_of(sup, "trading");
    sup.initialize();
    ASSERT_EQ(pid_of(sup, "trading"), before);

    sup.shutdown();
}

TEST(test_noisy_worker_still_works) {
    logging::AsyncLogger logger;
    WorkerSupervisor sup({fake("noisy", {"--tools", "echo", "--noise"})}, fast_options(), logger);
    sup.initialize();

    json result = sup.call_tool("noisy", "echo", json{{"x", 1}});
    ASSERT_EQ(text_of(result), "echo:{\"x\":1}");
    ASSERT_TRUE(sup.stats()["noisy"]["discardedLines"].get<uint64_t>() > 0);
    sup.shutdown();
}

// ============================================================================
// Forwarding
// ============================================================================

TEST(test_concurrent_calls_are_correlated) {
    logging::AsyncLogger logger;
    WorkerSupervisor sup({fake("market", {"--tools", "slow,fast", "--delay-on", "slow:400"})}, fast_options(),
                         logger);
    sup.initialize();

    std::atomic<int> finished{0};
    std::atomic<int> slow_rank{0};
    std::atomic<int> fast_rank{0};
    std::string slow_text;
    std::string fast_text;

    std::thread slow([&]() {
        slow_text = text_of(sup.call_tool("market", "slow", json{{"n", 1}}));
        slow_rank = ++finished;
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    std::thread fast([&]() {
        fast_text = text_of(sup.call_tool("market", "fast", json{{"n", 2}}));
        fast_rank = ++finished;
    });
    slow.join();
    fast.join();

    // Responses came back in reverse order and still reached their callers
    ASSERT_EQ(fast_rank.load(), 1);
    ASSERT_EQ(slow_rank.load(), 2);
    ASSERT_EQ(slow_text, "slow:{\"n\":1}");
    ASSERT_EQ(fast_text, "fast:{\"n\":2}");
    ASSERT_EQ(sup.stats()["market"]["pendingRequests"], 0);
    sup.shutdown();
}

TEST(test_timeout_rejects_once) {
    logging::AsyncLogger logger;
    WorkerSupervisor sup({fake("market", {"--tools", "stuck,ok", "--hang-on", "stuck"}, 200)}, fast_options(),
                         logger);
    sup.initialize();

    auto start = std::chrono::steady_clock::now();
    int code = expect_rpc_error([&]() { sup.call_tool("market", "stuck", json::object()); });
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_EQ(code, error_code::MCP_TIMEOUT_ERROR);
    ASSERT_TRUE(elapsed >= std::chrono::milliseconds(180));
    ASSERT_TRUE(elapsed < std::chrono::milliseconds(2000));

    json stats = sup.stats()["market"];
    ASSERT_EQ(stats["timeouts"], 1);
    ASSERT_EQ(stats["pendingRequests"], 0);

    // The worker is still usable
    ASSERT_EQ(text_of(sup.call_tool("market", "ok", json::object())), "ok:{}");
    sup.shutdown();
}

TEST(test_worker_error_is_passed_through) {
    logging::AsyncLogger logger;
    WorkerSupervisor sup({fake("trading", {"--tools", "place_order", "--error-on", "place_order"})}, fast_options(),
                         logger);
    sup.initialize();

    bool threw = false;
    try {
        sup.call_tool("trading", "place_order", json{{"qty", 1}});
    } catch (const rpc::WorkerError& e) {
        threw = true;
        ASSERT_EQ(e.code(), -32050);
        ASSERT_EQ(e.error_object()["message"], "tool failed");
        ASSERT_EQ(e.error_object()["data"]["tool"], "place_order");
    }
    ASSERT_TRUE(threw);
    sup.shutdown();
}

TEST(test_null_error_member_is_a_success) {
    logging::AsyncLogger logger;
    WorkerSupervisor sup({fake("market", {"--tools", "get_price", "--null-error"})}, fast_options(), logger);
    sup.initialize();
    ASSERT_TRUE(sup.health() == HealthState::Healthy);
    ASSERT_EQ(*sup.route_tool("get_price"), "market");
    ASSERT_EQ(text_of(sup.call_tool("market", "get_price", json::object())), "get_price:{}");
    sup.shutdown();
}

TEST(test_malformed_worker_error_is_normalized) {
    logging::AsyncLogger logger;
    WorkerSupervisor sup({fake("trading", {"--tools", "place_order", "--raw-error-on", "place_order"})},
                         fast_options(), logger);
    rpc::Dispatcher dispatcher(sup, logger);
    sup.initialize();

    json reply = dispatcher.handle(rpc::make_request("tools/call", json{{"name", "place_order"}}, 5));
    ASSERT_FALSE(reply.contains("result"));
    ASSERT_EQ(reply["id"], 5);
    ASSERT_EQ(reply["error"]["code"], error_code::MCP_SERVER_ERROR);
    ASSERT_TRUE(reply["error"]["message"].is_string());
    ASSERT_EQ(reply["error"]["data"], "tool exploded");
    sup.shutdown();
}

TEST(test_resources_and_prompts) {
    logging::AsyncLogger logger;
    WorkerSupervisor sup({fake("market", {"--tools", "get_price", "--resources", "--prompts", "daily_brief"}),
                          fake("alerts", {"--tools", "set_alert", "--prompts", "daily_brief,alert_digest"})},
                         fast_options(), logger);
    sup.initialize();

    json item = sup.read_resource("market://prices/BTCUSDT");
    ASSERT_EQ(item["uri"], "prices/BTCUSDT");
    ASSERT_EQ(item["text"], "resource:prices/BTCUSDT");

    std::string message;
    ASSERT_EQ(expect_rpc_error([&]() { sup.read_resource("nowhere://x"); }, &message), error_code::MCP_SERVER_ERROR);
    ASSERT_TRUE(message.find("not found") != std::string::npos);
    ASSERT_EQ(expect_rpc_error([&]() { sup.read_resource("no-scheme"); }), error_code::INVALID_PARAMS);

    // First worker in configuration order wins
    json prompt = sup.get_prompt("daily_brief", json{{"symbol", "ETH"}});
    ASSERT_EQ(prompt["description"], "Prompt daily_brief");
    ASSERT_EQ(prompt["messages"][0]["content"]["text"], "{\"symbol\":\"ETH\"}");

    json digest = sup.get_prompt("alert_digest", nullptr);
    ASSERT_EQ(digest["messages"][0]["content"]["text"], "{}");

    ASSERT_EQ(expect_rpc_error([&]() { sup.get_prompt("missing", nullptr); }), error_code::METHOD_NOT_FOUND);
    sup.shutdown();
}

TEST(test_dispatcher_end_to_end) {
    logging::AsyncLogger logger;
    WorkerSupervisor sup({fake("market", {"--tools", "get_price"})}, fast_options(), logger);
    rpc::Dispatcher dispatcher(sup, logger);

    json init = dispatcher.handle(rpc::make_request("initialize", json::object(), 1));
    ASSERT_EQ(init["result"]["protocolVersion"], "2024-11-05");

    json call = dispatcher.handle(
        rpc::make_request("tools/call", json{{"name", "get_price"}, {"arguments", {{"symbol", "BTC"}}}}, "c1"));
    ASSERT_EQ(call["id"], "c1");
    ASSERT_EQ(text_of(call["result"]), "get_price:{\"symbol\":\"BTC\"}");

    json list = dispatcher.handle(rpc::make_request("tools/list", nullptr, 2));
    ASSERT_EQ(list["result"]["tools"][0]["serverName"], "market");
    sup.shutdown();
}

// ============================================================================
// Failure handling
// ============================================================================

TEST(test_crash_is_reported) {
    logging::AsyncLogger logger;
    WorkerSupervisor sup({fake("market", {"--tools", "get_price"}),
                          fake("risk", {"--tools", "boom", "--crash-on", "boom"})},
                         fast_options(), logger);

    std::atomic<int> crashes{0};
    std::string crashed;
    std::atomic<int> crash_code{0};
    sup.set_crash_callback([&](const std::string& name, int code, int) {
        crashed = name;
        crash_code = code;
        ++crashes;
    });
    sup.initialize();
    ASSERT_TRUE(sup.health() == HealthState::Healthy);

    std::string message;
    int code = expect_rpc_error([&]() { sup.call_tool("risk", "boom", json::object()); }, &message);
    ASSERT_EQ(code, error_code::MCP_BRIDGE_ERROR);
    ASSERT_TRUE(message.find("exited") != std::string::npos);

    ASSERT_TRUE(wait_until([&]() { return crashes.load() == 1; }));
    ASSERT_EQ(crashed, "risk");
    ASSERT_EQ(crash_code.load(), 3);

    ASSERT_TRUE(sup.health() == HealthState::Degraded);
    ASSERT_EQ(sup.status()["risk"]["state"], "exited");
    ASSERT_EQ(sup.all_tools().size(), 1u);

    // Not restarted; further calls fail fast
    ASSERT_EQ(expect_rpc_error([&]() { sup.call_tool("risk", "boom", json::object()); }, &message),
              error_code::MCP_BRIDGE_ERROR);
    ASSERT_TRUE(message.find("not ready") != std::string::npos);

    // The healthy worker is unaffected
    ASSERT_EQ(text_of(sup.call_tool("market", "get_price", json::object())), "get_price:{}");
    sup.shutdown();
    ASSERT_EQ(crashes.load(), 1);
}

TEST(test_crash_detected_while_stdout_is_held_open) {
    logging::AsyncLogger logger;
    WorkerSupervisor sup({behind_shell(fake("market", {"--tools", "boom", "--crash-on", "boom"}, 10000)),
                          fake("risk", {"--tools", "size_position"})},
                         fast_options(), logger);

    std::atomic<int> crashes{0};
    sup.set_crash_callback([&](const std::string&, int, int) { ++crashes; });
    sup.initialize();

    auto start = std::chrono::steady_clock::now();
    std::string message;
    ASSERT_EQ(expect_rpc_error([&]() { sup.call_tool("market", "boom", json::object()); }, &message),
              error_code::MCP_BRIDGE_ERROR);
    ASSERT_TRUE(message.find("exited") != std::string::npos);
    ASSERT_TRUE(std::chrono::steady_clock::now() - start < std::chrono::seconds(3));

    ASSERT_TRUE(wait_until([&]() { return crashes.load() == 1; }));
    ASSERT_TRUE(sup.health() == HealthState::Degraded);
    ASSERT_EQ(sup.status()["market"]["state"], "exited");
    sup.shutdown();
}

TEST(test_failed_handshake_is_all_or_nothing) {
    logging::AsyncLogger logger;
    WorkerSupervisor sup({fake("good", {"--tools", "a"}), fake("bad", {"--tools", "b", "--fail-init"})},
                         fast_options(), logger);

    bool threw = false;
    try {
        sup.initialize();
    } catch (const rpc::RpcError& e) {
        threw = true;
        ASSERT_EQ(e.code(), error_code::MCP_BRIDGE_ERROR);
        std::string what = e.what();
        ASSERT_TRUE(what.find("bad") != std::string::npos);
        ASSERT_TRUE(what.find("startup failed") != std::string::npos);
        ASSERT_EQ(e.data()["failedWorkers"], json::array({"bad"}));
    }
    ASSERT_TRUE(threw);

    ASSERT_FALSE(sup.is_initialized());
    ASSERT_TRUE(sup.health() == HealthState::Unhealthy);
    ASSERT_TRUE(sup.last_error().find("bad") != std::string::npos);
    ASSERT_EQ(sup.status()["good"]["state"], "stopped");
    ASSERT_TRUE(sup.all_tools().empty());
    ASSERT_FALSE(sup.route_tool("a").has_value());
}

TEST(test_protocol_version_mismatch) {
    logging::AsyncLogger logger;
    WorkerSupervisor sup({fake("old", {"--tools", "a", "--bad-version"})}, fast_options(), logger);

    std::string message;
    ASSERT_EQ(expect_rpc_error([&]() { sup.initialize(); }, &message), error_code::MCP_BRIDGE_ERROR);
    ASSERT_TRUE(message.find("Protocol version mismatch") != std::string::npos);
}

TEST(test_missing_executable) {
    logging::AsyncLogger logger;
    WorkerDescriptor d;
    d.name = "ghost";
    d.command = {"/nonexistent/mcp-worker"};
    WorkerSupervisor sup({d}, fast_options(), logger);

    std::string message;
    ASSERT_EQ(expect_rpc_error([&]() { sup.initialize(); }, &message), error_code::MCP_BRIDGE_ERROR);
    ASSERT_TRUE(message.find("ghost") != std::string::npos);
}

TEST(test_duplicate_tool_is_rejected) {
    logging::AsyncLogger logger;
    WorkerSupervisor sup({fake("technical", {"--tools", "analyze"}), fake("social", {"--tools", "analyze,sentiment"})},
                         fast_options(), logger);

    std::string message;
    ASSERT_EQ(expect_rpc_error([&]() { sup.initialize(); }, &message), error_code::MCP_BRIDGE_ERROR);
    ASSERT_TRUE(message.find("duplicate tool 'analyze'") != std::string::npos);
    ASSERT_TRUE(message.find("technical") != std::string::npos);
    ASSERT_FALSE(sup.is_initialized());
}

TEST(test_invalid_configuration) {
    logging::AsyncLogger logger;
    WorkerSupervisor sup({fake("same", {}), fake("same", {})}, fast_options(), logger);

    std::string message;
    ASSERT_EQ(expect_rpc_error([&]() { sup.initialize(); }, &message), error_code::MCP_BRIDGE_ERROR);
    ASSERT_TRUE(message.find("Duplicate worker name 'same'") != std::string::npos);
}

// ============================================================================
// Shutdown
// ============================================================================

TEST(test_shutdown_stops_every_process) {
    logging::AsyncLogger logger;
    WorkerSupervisor sup({fake("a", {"--tools", "t1"}), fake("b", {"--tools", "t2"})}, fast_options(), logger);
    sup.initialize();

    pid_t a = pid_of(sup, "a");
    pid_t b = pid_of(sup, "b");
    ASSERT_FALSE(process_gone(a));

    sup.shutdown();
    ASSERT_TRUE(process_gone(a));
    ASSERT_TRUE(process_gone(b));
    ASSERT_FALSE(sup.is_initialized());
    ASSERT_TRUE(sup.health() == HealthState::Unhealthy);
    ASSERT_EQ(sup.status()["a"]["state"], "stopped");

    // Shutdown is repeatable and initialize works again afterwards
    sup.shutdown();
    sup.initialize();
    ASSERT_TRUE(sup.health() == HealthState::Healthy);
    sup.shutdown();
}

TEST(test_shutdown_escalates_to_sigkill) {
    logging::AsyncLogger logger;
    WorkerSupervisor sup({fake("stubborn", {"--tools", "t", "--ignore-sigterm"})}, fast_options(), logger);
    sup.initialize();
    pid_t pid = pid_of(sup, "stubborn");

    auto start = std::chrono::steady_clock::now();
    sup.shutdown();
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(process_gone(pid));
    ASSERT_TRUE(elapsed >= std::chrono::milliseconds(250));
    ASSERT_TRUE(elapsed < std::chrono::seconds(5));
}

TEST(test_shutdown_is_bounded_when_stdout_is_held_open) {
    logging::AsyncLogger logger;
    WorkerSupervisor sup({behind_shell(fake("stubborn", {"--tools", "t", "--ignore-sigterm"}))}, fast_options(),
                         logger);
    sup.initialize();
    pid_t pid = pid_of(sup, "stubborn");

    auto start = std::chrono::steady_clock::now();
    sup.shutdown();
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(process_gone(pid));
    // The background sleep shared the worker's process group
    ASSERT_TRUE(wait_until([&]() { return ::kill(-pid, 0) != 0 && errno == ESRCH; }));
    ASSERT_TRUE(elapsed < std::chrono::seconds(3));
}

TEST(test_shutdown_rejects_in_flight_calls) {
    logging::AsyncLogger logger;
    WorkerSupervisor sup({fake("market", {"--tools", "stuck", "--hang-on", "stuck"}, 10000)}, fast_options(), logger);
    sup.initialize();

    std::atomic<int> code{0};
    std::thread caller([&]() {
        code = expect_rpc_error([&]() { sup.call_tool("market", "stuck", json::object()); });
    });
    ASSERT_TRUE(wait_until([&]() { return sup.stats()["market"]["pendingRequests"] == 1; }));

    auto start = std::chrono::steady_clock::now();
    sup.shutdown();
    caller.join();
    ASSERT_EQ(code.load(), error_code::MCP_BRIDGE_ERROR);
    ASSERT_TRUE(std::chrono::steady_clock::now() - start < std::chrono::seconds(5));
}

TEST(test_listener_shutdown_order_releases_dispatches) {
    logging::AsyncLogger logger;
    WorkerSupervisor sup({fake("ai", {"--tools", "analyze", "--hang-on", "analyze"}, 45000)}, fast_options(), logger);
    rpc::Dispatcher dispatcher(sup, logger);
    transport::DispatchGate gate(4);
    sup.initialize();

    // A listener dispatch blocked on a worker with a long deadline
    json reply;
    ASSERT_TRUE(gate.try_enter());
    std::thread dispatch([&]() {
        reply = dispatcher.handle(rpc::make_request("tools/call", json{{"name", "analyze"}}, 11));
        gate.leave();
    });
    ASSERT_TRUE(wait_until([&]() { return sup.stats()["ai"]["pendingRequests"] == 1; }));

    auto start = std::chrono::steady_clock::now();
    gate.close();
    ASSERT_FALSE(gate.try_enter());
    sup.shutdown();
    ASSERT_TRUE(gate.wait_idle(std::chrono::seconds(3)));
    dispatch.join();

    ASSERT_TRUE(std::chrono::steady_clock::now() - start < std::chrono::seconds(3));
    ASSERT_EQ(reply["id"], 11);
    ASSERT_EQ(reply["error"]["code"], error_code::MCP_BRIDGE_ERROR);
}

int main() {
    std::cout << "=== Worker Supervisor Tests ===\n";
    RUN_TEST(test_initialize_discovers_capabilities);
    RUN_TEST(test_noisy_worker_still_works);
    RUN_TEST(test_concurrent_calls_are_correlated);
    RUN_TEST(test_timeout_rejects_once);
    RUN_TEST(test_worker_error_is_passed_through);
    RUN_TEST(test_null_error_member_is_a_success);
    RUN_TEST(test_malformed_worker_error_is_normalized);
    RUN_TEST(test_resources_and_prompts);
    RUN_TEST(test_dispatcher_end_to_end);
    RUN_TEST(test_crash_is_reported);
    RUN_TEST(test_crash_detected_while_stdout_is_held_open);
    RUN_TEST(test_failed_handshake_is_all_or_nothing);
    RUN_TEST(test_protocol_version_mismatch);
    RUN_TEST(test_missing_executable);
    RUN_TEST(test_duplicate_tool_is_rejected);
    RUN_TEST(test_invalid_configuration);
    RUN_TEST(test_shutdown_stops_every_process);
    RUN_TEST(test_shutdown_escalates_to_sigkill);
    RUN_TEST(test_shutdown_is_bounded_when_stdout_is_held_open);
    RUN_TEST(test_shutdown_rejects_in_flight_calls);
    RUN_TEST(test_listener_shutdown_order_releases_dispatches);
    std::cout << "All tests passed!\n";
    return 0;
}
