// ============= include/protocol/duplex_channel.hpp =============
/*
 * Duplex Channel - una conexión bidireccional vista por la sesión
 *
 * - receive(): bloquea hasta el siguiente frame o hasta timeout_ms
 *   (timeout_ms < 0 = sin límite); false = timeout
 * - Frame::Type::Closed marca el cierre del cliente
 *
 * QueuedChannel: implementación con cola bloqueante. El transporte
 * empuja frames desde su hilo de red y la sesión los consume desde el
 * suyo; el envío y el cierre se delegan en callbacks.
 */

#pragma once
#include <condition_variable>
#include <deque>
#include <functional>
#include <mutex>
#include <string>

struct Frame {
    enum class Type { Text, Binary, Closed };

    Type type = Type::Text;
    std::string data;
};

class DuplexChannel {
public:
    virtual ~DuplexChannel() = default;

    virtual bool receive(Frame& frame, int timeout_ms) = 0;
    virtual void send_text(const std::string& text) = 0;
    virtual void close(int code, const std::string& reason) = 0;
    virtual bool is_open() const = 0;
};

class QueuedChannel : public DuplexChannel {
public:
    using SendFn = std::function<void(const std::string&)>;
    using CloseFn = std::function<void(int, const std::string&)>;

    QueuedChannel(SendFn sender, CloseFn closer);

    // Transport side
    void push(Frame frame);
    void push_closed();

    // Session side
    bool receive(Frame& frame, int timeout_ms) override;
    void send_text(const std::string& text) override;
    void close(int code, const std::string& reason) override;
    bool is_open() const override;

    size_t queued() const;

private:
    SendFn sender;
    CloseFn closer;

    mutable std::mutex channel_mutex;
    std::condition_variable frame_ready;
    std::deque<Frame> frames;
    bool open = true;
};
