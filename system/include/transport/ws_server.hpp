// ============= include/transport/ws_server.hpp =============
/*
 * WebSocket transport (Drogon) - /ws/interact
 *
 * - Una conexión = un QueuedChannel + un hilo con su SessionEngine
 * - Los hilos de red de Drogon solo empujan frames a la cola
 * - handleConnectionClosed → Frame::Closed, la sesión termina sola
 * - shutdown(): cierra todas las conexiones y espera a los hilos
 */

#pragma once
#include "protocol/duplex_channel.hpp"
#include "protocol/session_engine.hpp"
#include <drogon/WebSocketController.h>
#include <atomic>
#include <list>
#include <memory>
#include <mutex>
#include <thread>

class RobiWsController : public drogon::WebSocketController<RobiWsController, false> {
public:
    RobiWsController(SessionServices services, SessionOptions options);
    ~RobiWsController() override;

    void handleNewMessage(const drogon::WebSocketConnectionPtr& conn,
                          std::string&& message,
                          const drogon::WebSocketMessageType& type) override;

    void handleNewConnection(const drogon::HttpRequestPtr& req,
                             const drogon::WebSocketConnectionPtr& conn) override;

    void handleConnectionClosed(const drogon::WebSocketConnectionPtr& conn) override;

    WS_PATH_LIST_BEGIN
    WS_PATH_ADD("/ws/interact");
    WS_PATH_LIST_END

    size_t active_sessions();

    // Closes every live connection and joins the session threads
    void shutdown();

private:
    struct Connection {
        std::shared_ptr<QueuedChannel> channel;
        std::thread worker;
        std::atomic<bool> finished{false};
    };

    SessionServices services;
    SessionOptions options;

    std::mutex connections_mutex;
    std::list<std::shared_ptr<Connection>> connections;

    void reap_finished_locked();
};
