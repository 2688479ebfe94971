#include "../../include/transport/ws_server.hpp"
#include "../../include/transport/endpoints.hpp"

#include <cstring>
#include <system_error>
#include <vector>

namespace mcpgw::transport {

namespace LogCategory = logging::LogCategory;
namespace error_code = rpc::error_code;

WebSocketServer::WebSocketServer(GatewayContext& ctx) : ctx_(ctx), gate_(ctx.config.ws_max_in_flight) {
    std::memset(protocols_, 0, sizeof(protocols_));
    protocols_[0].name = "mcp-jsonrpc";
    protocols_[0].callback = &WebSocketServer::ws_callback;
    protocols_[0].per_session_data_size = sizeof(SessionSlot);
    protocols_[0].rx_buffer_size = 65536;
    // protocols_[1] stays zeroed as the terminator
}

WebSocketServer::~WebSocketServer() {
    stop();
}

// =============================================================================
// Lifecycle
// =============================================================================

bool WebSocketServer::start() {
    if (context_)
        return true;

    const auto& cfg = ctx_.config;
    lws_set_log_level(LLL_ERR, nullptr);

    struct lws_context_creation_info info;
    std::memset(&info, 0, sizeof(info));
    info.port = cfg.ws_port;
    info.iface = cfg.host == "0.0.0.0" ? nullptr : cfg.host.c_str();
    info.protocols = protocols_;
    info.gid = -1;
    info.uid = -1;
    info.user = this;

    context_ = lws_create_context(&info);
    if (!context_) {
        LOGF_ERROR(ctx_.logger, LogCategory::WebSocket, "Failed to create WebSocket listener on %s:%d",
                   cfg.host.c_str(), cfg.ws_port);
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        accepting_ = true;
    }
    gate_.reopen();
    running_ = true;
    service_thread_ = std::thread(&WebSocketServer::run_service_loop, this);

    LOGF_INFO(ctx_.logger, LogCategory::WebSocket, "WebSocket: ws://%s:%d/", cfg.host.c_str(), cfg.ws_port);
    return true;
}

void WebSocketServer::stop_accepting() {
    if (!context_ || gate_.is_closed())
        return;
    gate_.close();
    LOG_INFO(ctx_.logger, LogCategory::WebSocket, "WebSocket listener no longer accepting messages");
}

void WebSocketServer::stop() {
    if (!context_)
        return;

    gate_.close();
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        accepting_ = false;
    }
    running_ = false;
    lws_cancel_service(context_);
    if (service_thread_.joinable()) {
        service_thread_.join();
    }

    // Dispatch threads hold `this`; their replies are dropped from here on
    gate_.wait_idle();

    lws_context_destroy(context_);
    context_ = nullptr;

    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        sessions_.clear();
    }
    LOG_INFO(ctx_.logger, LogCategory::WebSocket, "WebSocket listener stopped");
}

size_t WebSocketServer::connection_count() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.size();
}

void WebSocketServer::run_service_loop() {
    while (running_) {
        lws_service(context_, 100);
    }
}

// =============================================================================
// lws callback
// =============================================================================

int WebSocketServer::ws_callback(struct lws* wsi, enum lws_callback_reasons reason, void* user, void* in,
                                 size_t len) {
    WebSocketServer* self = static_cast<WebSocketServer*>(lws_context_user(lws_get_context(wsi)));
    if (!self)
        return 0;

    SessionSlot* slot = static_cast<SessionSlot*>(user);

    switch (reason) {
    case LWS_CALLBACK_ESTABLISHED:
        self->on_established(wsi, slot);
        break;

    case LWS_CALLBACK_RECEIVE:
        self->on_receive(wsi, slot, static_cast<const char*>(in), in ? len : 0);
        break;

    case LWS_CALLBACK_SERVER_WRITEABLE:
        return self->on_writeable(wsi, slot);

    case LWS_CALLBACK_CLOSED:
        self->on_closed(slot);
        break;

    case LWS_CALLBACK_EVENT_WAIT_CANCELLED:
        self->on_wait_cancelled();
        break;

    default:
        break;
    }

    return 0;
}

void WebSocketServer::on_established(struct lws* wsi, SessionSlot* slot) {
    uint64_t id;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto session = std::make_shared<Session>();
        session->id = next_session_id_++;
        session->wsi = wsi;
        slot->id = session->id;
        sessions_[session->id] = session;
        id = session->id;
    }
    ctx_.metrics.ws_connections.fetch_add(1, std::memory_order_relaxed);
    ctx_.metrics.ws_connections_total.fetch_add(1, std::memory_order_relaxed);
    LOGF_INFO(ctx_.logger, LogCategory::WebSocket, "WebSocket connection %llu established",
              static_cast<unsigned long long>(id));
}

void WebSocketServer::on_receive(struct lws* wsi, SessionSlot* slot, const char* data, size_t len) {
    auto session = find_session(slot);
    if (!session)
        return;

    // rx and oversized are only touched on the service thread
    if (!session->oversized) {
        if (session->rx.size() + len > ctx_.config.max_body_bytes) {
            session->oversized = true;
            std::string().swap(session->rx);
        } else if (len > 0) {
            session->rx.append(data, len);
        }
    }

    if (!lws_is_final_fragment(wsi) || lws_remaining_packet_payload(wsi) != 0)
        return;

    ctx_.metrics.ws_messages.fetch_add(1, std::memory_order_relaxed);

    if (session->oversized) {
        session->oversized = false;
        ctx_.metrics.ws_errors.fetch_add(1, std::memory_order_relaxed);
        LOGF_WARN(ctx_.logger, LogCategory::WebSocket, "WebSocket message over %zu bytes rejected",
                  ctx_.config.max_body_bytes);
        enqueue(session, serialize(rpc::make_error(error_code::INVALID_REQUEST, "Invalid Request",
                                                   "Message exceeds " + std::to_string(ctx_.config.max_body_bytes) +
                                                       " bytes",
                                                   nullptr)));
        return;
    }

    std::string message;
    message.swap(session->rx);

    if (!gate_.try_enter()) {
        ctx_.metrics.ws_errors.fetch_add(1, std::memory_order_relaxed);
        const bool closing = gate_.is_closed();
        if (!closing) {
            ctx_.metrics.ws_rejected.fetch_add(1, std::memory_order_relaxed);
            LOGF_WARN(ctx_.logger, LogCategory::WebSocket, "WebSocket dispatch limit %zu reached, rejecting message",
                      gate_.limit());
        }
        enqueue(session, serialize(ws_rejection(message, closing, gate_.limit())));
        return;
    }
    dispatch_async(session, std::move(message));
}

int WebSocketServer::on_writeable(struct lws* wsi, SessionSlot* slot) {
    std::string reply;
    bool more = false;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(slot->id);
        if (it == sessions_.end() || it->second->outbox.empty())
            return 0;
        reply = std::move(it->second->outbox.front());
        it->second->outbox.pop_front();
        more = !it->second->outbox.empty();
    }

    std::vector<unsigned char> buf(LWS_PRE + reply.size());
    std::memcpy(buf.data() + LWS_PRE, reply.data(), reply.size());

    int n = lws_write(wsi, buf.data() + LWS_PRE, reply.size(), LWS_WRITE_TEXT);
    if (n < static_cast<int>(reply.size())) {
        ctx_.metrics.ws_errors.fetch_add(1, std::memory_order_relaxed);
        LOGF_ERROR(ctx_.logger, LogCategory::WebSocket, "WebSocket write failed on connection %llu",
                   static_cast<unsigned long long>(slot->id));
        return -1; // close the connection
    }

    if (more) {
        lws_callback_on_writable(wsi);
    }
    return 0;
}

void WebSocketServer::on_closed(SessionSlot* slot) {
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(slot->id);
        if (it == sessions_.end())
            return;
        it->second->open = false;
        sessions_.erase(it);
    }
    ctx_.metrics.ws_connections.fetch_sub(1, std::memory_order_relaxed);
    LOGF_INFO(ctx_.logger, LogCategory::WebSocket, "WebSocket connection %llu closed",
              static_cast<unsigned long long>(slot->id));
}

void WebSocketServer::on_wait_cancelled() {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    for (const auto& [id, session] : sessions_) {
        if (!session->outbox.empty()) {
            lws_callback_on_writable(session->wsi);
        }
    }
}

// =============================================================================
// Dispatch
// =============================================================================

// The caller holds a gate slot; the dispatch thread releases it
void WebSocketServer::dispatch_async(std::shared_ptr<Session> session, std::string message) {
    auto finish = [this]() { gate_.leave(); };

    try {
        std::thread([this, session, message = std::move(message), finish]() {
            json reply;
            try {
                reply = handle_ws_message(ctx_.dispatcher, message);
            } catch (const std::exception& e) {
                LOGF_ERROR(ctx_.logger, LogCategory::WebSocket, "WebSocket message error: %s", e.what());
                reply = rpc::make_error(error_code::INTERNAL_ERROR, "Internal error", e.what(), nullptr);
            }

            int code = rpc::response_error_code(reply);
            if (code != 0) {
                ctx_.metrics.ws_errors.fetch_add(1, std::memory_order_relaxed);
                if (code == error_code::PARSE_ERROR && reply["id"].is_null())
                    ctx_.metrics.parse_errors.fetch_add(1, std::memory_order_relaxed);
            }

            enqueue(session, serialize(reply));
            finish();
        }).detach();
    } catch (const std::system_error& e) {
        LOGF_ERROR(ctx_.logger, LogCategory::WebSocket, "Cannot start dispatch thread: %s", e.what());
        enqueue(session, serialize(rpc::make_error(error_code::INTERNAL_ERROR, "Internal error", e.what(), nullptr)));
        finish();
    }
}

void WebSocketServer::enqueue(const std::shared_ptr<Session>& session, std::string reply) {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    if (!accepting_ || !session->open)
        return;
    session->outbox.push_back(std::move(reply));
    lws_cancel_service(context_);
}

std::shared_ptr<WebSocketServer::Session> WebSocketServer::find_session(const SessionSlot* slot) const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = sessions_.find(slot->id);
    if (it == sessions_.end())
        return nullptr;
    return it->second;
}

} // namespace mcpgw::transport
