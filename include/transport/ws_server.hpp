#pragma once

/**
 * WebSocketServer - libwebsockets listener for the gateway
 *
 * One JSON-RPC 2.0 envelope per text message, one reply per message.
 * Runs its own port next to the HTTP listener.
 *
 * Threading:
 *   - the service thread owns every lws call except lws_cancel_service()
 *   - each complete message is dispatched on a short-lived thread, so a
 *     slow worker never blocks other connections; at most
 *     config.ws_max_in_flight run at once and the rest are answered with
 *     MCP_RATE_LIMIT_ERROR
 *   - replies are queued per session and flushed from SERVER_WRITEABLE
 *     after the dispatch thread wakes the service loop
 */

#include "dispatch_gate.hpp"
#include "gateway_context.hpp"

#include <libwebsockets.h>

#include <atomic>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace mcpgw {
namespace transport {

class WebSocketServer {
public:
    explicit WebSocketServer(GatewayContext& ctx);
    ~WebSocketServer();

    WebSocketServer(const WebSocketServer&) = delete;
    WebSocketServer& operator=(const WebSocketServer&) = delete;

    /**
     * Create the lws context bound to config.host:config.ws_port and start
     * the service thread. Returns false if the listener cannot be created.
     */
    bool start();

    /**
     * Refuse new messages but keep delivering replies of dispatches that
     * are already running. Call before shutting the supervisor down.
     */
    void stop_accepting();

    /**
     * Stop servicing, wait for in-flight dispatches, close all connections.
     */
    void stop();

    bool is_running() const { return running_.load(); }
    size_t connection_count() const;
    size_t in_flight() const { return gate_.in_flight(); }

private:
    // Lives in lws per-session storage
    struct SessionSlot {
        uint64_t id;
    };

    struct Session {
        uint64_t id = 0;
        struct lws* wsi = nullptr;
        std::string rx;               // fragments of the current message
        bool oversized = false;       // current message exceeded the limit
        std::deque<std::string> outbox;
        bool open = true;
    };

    GatewayContext& ctx_;
    struct lws_context* context_ = nullptr;
    struct lws_protocols protocols_[2];

    std::atomic<bool> running_{false};
    std::thread service_thread_;

    mutable std::mutex sessions_mutex_;
    std::map<uint64_t, std::shared_ptr<Session>> sessions_;
    uint64_t next_session_id_ = 1;
    bool accepting_ = false; // guarded by sessions_mutex_

    DispatchGate gate_;

    static int ws_callback(struct lws* wsi, enum lws_callback_reasons reason, void* user, void* in, size_t len);

    void on_established(struct lws* wsi, SessionSlot* slot);
    void on_receive(struct lws* wsi, SessionSlot* slot, const char* data, size_t len);
    int on_writeable(struct lws* wsi, SessionSlot* slot);
    void on_closed(SessionSlot* slot);
    void on_wait_cancelled();

    void dispatch_async(std::shared_ptr<Session> session, std::string message);
    void enqueue(const std::shared_ptr<Session>& session, std::string reply);
    std::shared_ptr<Session> find_session(const SessionSlot* slot) const;

    void run_service_loop();
};

} // namespace transport
} // namespace mcpgw
