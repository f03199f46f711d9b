// ============= src/transport/ws_server.cpp =============
#include "transport/ws_server.hpp"
#include "config.hpp"
#include <spdlog/spdlog.h>

RobiWsController::RobiWsController(SessionServices services, SessionOptions options)
    : services(services), options(std::move(options)) {}

RobiWsController::~RobiWsController() {
    shutdown();
}

void RobiWsController::handleNewConnection(const drogon::HttpRequestPtr& req,
                                           const drogon::WebSocketConnectionPtr& conn) {
    spdlog::info("🔌 WebSocket conectado: {}", req->peerAddr().toIpPort());

    std::weak_ptr<drogon::WebSocketConnection> weak = conn;

    auto sender = [weak](const std::string& text) {
        if (auto c = weak.lock()) {
            c->send(text, drogon::WebSocketMessageType::Text);
        }
    };
    auto closer = [weak](int code, const std::string& reason) {
        if (auto c = weak.lock()) {
            c->shutdown(static_cast<drogon::CloseCode>(code), reason);
        }
    };

    auto connection = std::make_shared<Connection>();
    connection->channel = std::make_shared<QueuedChannel>(sender, closer);
    conn->setContext(connection->channel);

    std::lock_guard<std::mutex> lock(connections_mutex);
    reap_finished_locked();

    SessionServices svc = services;
    SessionOptions opts = options;
    Connection* raw = connection.get();

    connection->worker = std::thread([raw, svc, opts]() {
        try {
            SessionEngine engine(*raw->channel, svc, opts);
            engine.run();
        } catch (const std::exception& e) {
            spdlog::error("❌ Session thread failed: {}", e.what());
            raw->channel->close(Config::CLOSE_INTERNAL_ERROR, "internal error");
        }
        raw->finished = true;
    });

    connections.push_back(std::move(connection));
}

void RobiWsController::handleNewMessage(const drogon::WebSocketConnectionPtr& conn,
                                        std::string&& message,
                                        const drogon::WebSocketMessageType& type) {
    auto channel = conn->getContext<QueuedChannel>();
    if (!channel) return;

    Frame frame;
    if (type == drogon::WebSocketMessageType::Text) {
        frame.type = Frame::Type::Text;
    } else if (type == drogon::WebSocketMessageType::Binary) {
        frame.type = Frame::Type::Binary;
    } else {
        // ping / pong / close are handled by Drogon
        return;
    }
    frame.data = std::move(message);
    channel->push(std::move(frame));
}

void RobiWsController::handleConnectionClosed(const drogon::WebSocketConnectionPtr& conn) {
    auto channel = conn->getContext<QueuedChannel>();
    if (channel) {
        channel->push_closed();
    }
    conn->clearContext();
    spdlog::info("🔌 WebSocket desconectado");
}

size_t RobiWsController::active_sessions() {
    std::lock_guard<std::mutex> lock(connections_mutex);
    reap_finished_locked();
    return connections.size();
}

void RobiWsController::reap_finished_locked() {
    for (auto it = connections.begin(); it != connections.end();) {
        if ((*it)->finished) {
            if ((*it)->worker.joinable()) (*it)->worker.join();
            it = connections.erase(it);
        } else {
            ++it;
        }
    }
}

void RobiWsController::shutdown() {
    std::list<std::shared_ptr<Connection>> pending;
    {
        std::lock_guard<std::mutex> lock(connections_mutex);
        pending.swap(connections);
    }

    if (!pending.empty()) {
        spdlog::info("Cerrando {} sesiones...", pending.size());
    }

    for (auto& connection : pending) {
        connection->channel->push_closed();
    }
    for (auto& connection : pending) {
        if (connection->worker.joinable()) connection->worker.join();
    }
}
