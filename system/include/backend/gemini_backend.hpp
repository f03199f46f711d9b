// ============= include/backend/gemini_backend.hpp =============
/*
 * Gemini Backend - streamGenerateContent vía libcurl (multi) + SSE
 *
 * POST {base_url}/v1beta/models/{model}:streamGenerateContent?alt=sse&key=...
 *
 * - Cuerpo JSON con jsoncpp: systemInstruction, turnos previos
 *   (user/model), turno actual (contexto + media inline_data + texto)
 * - Cada línea "data: {...}" trae candidates[0].content.parts[*].text
 * - HTTP != 200 → BackendError con el cuerpo de la respuesta
 *
 * Cada stream() abre su propio handle: seguro entre sesiones.
 * curl_global_init() lo hace main().
 */

#pragma once
#include "backend/generative_backend.hpp"
#include "config.hpp"
#include <json/json.h>
#include <string>
#include <vector>

// Splits a byte stream into server-sent-event "data:" payloads
class SseParser {
public:
    std::vector<std::string> feed(const std::string& bytes);

    // Payload of a last event without a trailing blank line
    std::vector<std::string> finish();

private:
    std::string buffer;
    std::string event_data;

    void take_line(const std::string& line, std::vector<std::string>& events);
};

// Text parts of one streamed response object; throws BackendError on an error object
std::vector<std::string> extract_gemini_texts(const std::string& payload);

class GeminiBackend : public GenerativeBackend {
public:
    explicit GeminiBackend(const GeminiConfig& config);

    std::unique_ptr<TextStream> stream(const BackendRequest& request) override;
    std::string name() const override { return "gemini:" + config.model; }

    Json::Value build_payload(const BackendRequest& request) const;
    std::string endpoint_url() const;

    static const char* system_prompt();

private:
    GeminiConfig config;
};
