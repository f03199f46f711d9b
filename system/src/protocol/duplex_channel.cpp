// ============= src/protocol/duplex_channel.cpp =============
#include "protocol/duplex_channel.hpp"
#include <spdlog/spdlog.h>
#include <chrono>

QueuedChannel::QueuedChannel(SendFn sender, CloseFn closer)
    : sender(std::move(sender)), closer(std::move(closer)) {}

void QueuedChannel::push(Frame frame) {
    {
        std::lock_guard<std::mutex> lock(channel_mutex);
        if (!open) return;
        frames.push_back(std::move(frame));
    }
    frame_ready.notify_one();
}

void QueuedChannel::push_closed() {
    Frame frame;
    frame.type = Frame::Type::Closed;
    {
        std::lock_guard<std::mutex> lock(channel_mutex);
        frames.push_back(std::move(frame));
    }
    frame_ready.notify_one();
}

bool QueuedChannel::receive(Frame& frame, int timeout_ms) {
    std::unique_lock<std::mutex> lock(channel_mutex);

    auto ready = [this] { return !frames.empty() || !open; };
    if (timeout_ms < 0) {
        frame_ready.wait(lock, ready);
    } else if (!frame_ready.wait_for(lock, std::chrono::milliseconds(timeout_ms), ready)) {
        return false;
    }

    if (frames.empty()) {
        // closed locally, nothing left to read
        frame.type = Frame::Type::Closed;
        frame.data.clear();
        return true;
    }

    frame = std::move(frames.front());
    frames.pop_front();
    if (frame.type == Frame::Type::Closed) {
        open = false;
    }
    return true;
}

void QueuedChannel::send_text(const std::string& text) {
    {
        std::lock_guard<std::mutex> lock(channel_mutex);
        if (!open) {
            spdlog::debug("send on closed channel dropped ({} bytes)", text.size());
            return;
        }
    }
    sender(text);
}

void QueuedChannel::close(int code, const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(channel_mutex);
        if (!open) return;
        open = false;
        frames.clear();
    }
    frame_ready.notify_all();
    closer(code, reason);
}

bool QueuedChannel::is_open() const {
    std::lock_guard<std::mutex> lock(channel_mutex);
    return open;
}

size_t QueuedChannel::queued() const {
    std::lock_guard<std::mutex> lock(channel_mutex);
    return frames.size();
}
