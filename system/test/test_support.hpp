// ============= test/test_support.hpp =============
/*
 * Dobles de prueba compartidos
 *
 * ScriptedBackend: devuelve guiones de fragmentos en orden, uno por
 * llamada a stream(); puede fallar a mitad de un guion.
 *
 * ScriptedChannel: reproduce frames guionizados y graba todo lo que
 * la sesión envía. Sin frames pendientes devuelve Closed (o timeout
 * si así se configura).
 */

#pragma once
#include "backend/generative_backend.hpp"
#include "protocol/duplex_channel.hpp"
#include "protocol/messages.hpp"
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

struct Script {
    std::vector<std::string> chunks;
    int fail_after = -1;   // throw BackendError after this many chunks, -1 = never
};

class ScriptedBackend : public GenerativeBackend {
public:
    void add(std::vector<std::string> chunks, int fail_after = -1) {
        std::lock_guard<std::mutex> lock(mutex);
        scripts.push_back({std::move(chunks), fail_after});
    }

    void fail_next() {
        add({}, 0);
    }

    std::unique_ptr<TextStream> stream(const BackendRequest& request) override {
        std::lock_guard<std::mutex> lock(mutex);
        requests.push_back(request);

        if (scripts.empty()) {
            throw BackendError("no script left", 503);
        }
        Script script = scripts.front();
        scripts.pop_front();
        return std::make_unique<ScriptStream>(script);
    }

    std::string name() const override { return "scripted"; }

    std::vector<BackendRequest> seen() {
        std::lock_guard<std::mutex> lock(mutex);
        return requests;
    }

private:
    class ScriptStream : public TextStream {
    public:
        explicit ScriptStream(Script script) : script(std::move(script)) {}

        bool next(std::string& fragment) override {
            if (script.fail_after >= 0 && static_cast<int>(position) >= script.fail_after) {
                throw BackendError("scripted failure", 500);
            }
            if (position >= script.chunks.size()) return false;
            fragment = script.chunks[position++];
            return true;
        }

    private:
        Script script;
        size_t position = 0;
    };

    std::mutex mutex;
    std::deque<Script> scripts;
    std::vector<BackendRequest> requests;
};

class ScriptedChannel : public DuplexChannel {
public:
    void text(const std::string& data) {
        frames.push_back({Frame::Type::Text, data});
    }

    void binary(const std::string& data) {
        frames.push_back({Frame::Type::Binary, data});
    }

    void timeout_when_empty() { time_out = true; }

    bool receive(Frame& frame, int) override {
        if (frames.empty()) {
            if (time_out) return false;
            frame.type = Frame::Type::Closed;
            frame.data.clear();
            return true;
        }
        frame = frames.front();
        frames.pop_front();
        return true;
    }

    void send_text(const std::string& text) override {
        if (open) sent.push_back(text);
    }

    void close(int code, const std::string& reason) override {
        if (!open) return;
        open = false;
        close_code = code;
        close_reason = reason;
    }

    bool is_open() const override { return open; }

    // Parsed copies of everything sent
    std::vector<Json::Value> messages() const {
        std::vector<Json::Value> out;
        for (const auto& s : sent) out.push_back(parse_message(s));
        return out;
    }

    std::vector<std::string> types() const {
        std::vector<std::string> out;
        for (const auto& m : messages()) out.push_back(m["type"].asString());
        return out;
    }

    std::vector<std::string> sent;
    int close_code = 0;
    std::string close_reason;

private:
    std::deque<Frame> frames;
    bool open = true;
    bool time_out = false;
};
