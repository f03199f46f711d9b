// ============= include/backend/generative_backend.hpp =============
/*
 * Generative Backend - interfaz del modelo de texto
 *
 * stream() devuelve un TextStream perezoso y finito:
 * - next() bloquea hasta el siguiente fragmento
 * - devuelve false al terminar
 * - puede lanzar BackendError una vez; después el stream no sirve
 */

#pragma once
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

class BackendError : public std::runtime_error {
public:
    explicit BackendError(const std::string& what, int status = 0)
        : std::runtime_error(what), http_status(status) {}

    int status() const { return http_status; }

private:
    int http_status;
};

struct ChatTurn {
    std::string role;      // "user" | "assistant"
    std::string content;
};

struct MediaPart {
    std::string mime_type;
    std::string data;      // raw bytes
};

struct BackendRequest {
    std::vector<ChatTurn> history;
    std::string text;
    std::vector<MediaPart> media;
    std::string context;
};

class TextStream {
public:
    virtual ~TextStream() = default;

    virtual bool next(std::string& fragment) = 0;
};

class GenerativeBackend {
public:
    virtual ~GenerativeBackend() = default;

    virtual std::unique_ptr<TextStream> stream(const BackendRequest& request) = 0;

    virtual std::string name() const = 0;
};

// Drains a stream into one string
std::string collect_text(GenerativeBackend& backend, const BackendRequest& request);
