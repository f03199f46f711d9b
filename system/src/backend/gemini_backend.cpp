// ============= src/backend/gemini_backend.cpp =============
#include "backend/gemini_backend.hpp"
#include "protocol/messages.hpp"
#include "utils.hpp"
#include <spdlog/spdlog.h>
#include <curl/curl.h>
#include <deque>

namespace {
    const char* SYSTEM_PROMPT =
        "Eres Robi, un robot doméstico amigable. Recuerdas a las personas con las que hablas "
        "y adaptas tus respuestas a su contexto.\n\n"
        "FORMATO DE CADA RESPUESTA (obligatorio):\n"
        "1. Empieza con [emotion:TAG] según el sentimiento de TU respuesta. Tags válidos: "
        "happy, excited, sad, empathy, confused, surprised, love, cool, greeting, neutral, "
        "curious, worried, playful.\n"
        "2. Opcionalmente sigue con [emojis:CODIGO,CODIGO] usando códigos OpenMoji (ej. 1F44B).\n"
        "3. Opcionalmente sigue con [actions:paso|paso] donde cada paso es nombre:parametros:duracion_ms. "
        "Gestos: wave, nod, shake_head, rotate_left, rotate_right, spin, celebrate, look_around "
        "(gesto:ms; rotate_left:grados:ms cambia el ángulo). "
        "Primitivas: turn_right_deg:grados:ms, turn_left_deg:grados:ms, move_forward_cm:cm:ms, "
        "move_backward_cm:cm:ms, led_color:r:g:b:ms, led_off:ms, pause:ms.\n"
        "4. Después el texto que se dirá en voz alta.\n\n"
        "ETIQUETAS INTERNAS (nunca se leen en voz alta, puedes ponerlas en cualquier parte):\n"
        "- [person_name:NOMBRE] cuando alguien te diga cómo se llama.\n"
        "- [memory:tipo:contenido] para recordar algo útil; tipo es experience, zone_info, "
        "person_fact o general. Nunca guardes contraseñas, datos bancarios, documentos ni salud.\n"
        "- [zone_learn:nombre:categoria:descripcion] al conocer un lugar nuevo; categoria es "
        "kitchen, living, bedroom, bathroom o unknown.\n"
        "- Si el turno incluye audio, imagen o vídeo, termina con [media_summary: resumen en "
        "máximo quince palabras de lo que contiene], en el idioma del contenido.\n\n"
        "REGLAS PARA VOZ:\n"
        "- Respuestas cortas, un párrafo como mucho salvo que te pidan detalle.\n"
        "- Escribe números y símbolos con palabras (\"quinientos\", \"por ciento\").\n"
        "- Sin listas, tablas, asteriscos ni fórmulas; prosa natural.\n"
        "- Responde siempre en el idioma del usuario.";

    size_t write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
        auto* out = static_cast<std::string*>(userdata);
        out->append(ptr, size * nmemb);
        return size * nmemb;
    }

    Json::Value text_part(const std::string& text) {
        Json::Value part(Json::objectValue);
        part["text"] = text;
        return part;
    }

    // One in-flight streamGenerateContent request
    class GeminiTextStream : public TextStream {
    public:
        GeminiTextStream(const std::string& url, const std::string& body, int timeout_ms)
            : request_body(body)
        {
            easy = curl_easy_init();
            multi = curl_multi_init();
            if (!easy || !multi) {
                cleanup();
                throw BackendError("curl init failed");
            }

            headers = curl_slist_append(headers, "Content-Type: application/json");

            curl_easy_setopt(easy, CURLOPT_URL, url.c_str());
            curl_easy_setopt(easy, CURLOPT_POST, 1L);
            curl_easy_setopt(easy, CURLOPT_HTTPHEADER, headers);
            curl_easy_setopt(easy, CURLOPT_POSTFIELDS, request_body.c_str());
            curl_easy_setopt(easy, CURLOPT_POSTFIELDSIZE, static_cast<long>(request_body.size()));
            curl_easy_setopt(easy, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_ms));
            curl_easy_setopt(easy, CURLOPT_NOSIGNAL, 1L);
            curl_easy_setopt(easy, CURLOPT_WRITEFUNCTION, write_callback);
            curl_easy_setopt(easy, CURLOPT_WRITEDATA, &incoming);

            curl_multi_add_handle(multi, easy);
        }

        ~GeminiTextStream() override {
            cleanup();
        }

        bool next(std::string& fragment) override {
            while (ready.empty()) {
                if (done) return false;
                pump();
            }
            fragment = std::move(ready.front());
            ready.pop_front();
            return true;
        }

    private:
        CURL* easy = nullptr;
        CURLM* multi = nullptr;
        curl_slist* headers = nullptr;

        std::string request_body;
        std::string incoming;
        std::string raw_response;
        SseParser parser;
        std::deque<std::string> ready;
        bool done = false;

        void cleanup() {
            if (multi && easy) curl_multi_remove_handle(multi, easy);
            if (easy) curl_easy_cleanup(easy);
            if (multi) curl_multi_cleanup(multi);
            if (headers) curl_slist_free_all(headers);
            easy = nullptr;
            multi = nullptr;
            headers = nullptr;
        }

        void consume(const std::vector<std::string>& events) {
            for (const auto& payload : events) {
                for (auto& text : extract_gemini_texts(payload)) {
                    if (!text.empty()) ready.push_back(std::move(text));
                }
            }
        }

        void pump() {
            int running = 0;
            CURLMcode mc = curl_multi_perform(multi, &running);
            if (mc != CURLM_OK) {
                done = true;
                throw BackendError(std::string("curl_multi_perform: ") + curl_multi_strerror(mc));
            }

            if (!incoming.empty()) {
                raw_response += incoming;
                std::string chunk;
                chunk.swap(incoming);
                try {
                    consume(parser.feed(chunk));
                } catch (const BackendError&) {
                    done = true;
                    throw;
                }
            }

            if (running > 0) {
                curl_multi_poll(multi, nullptr, 0, 1000, nullptr);
                return;
            }

            // transfer finished
            done = true;

            CURLcode result = CURLE_OK;
            int remaining = 0;
            while (CURLMsg* msg = curl_multi_info_read(multi, &remaining)) {
                if (msg->msg == CURLMSG_DONE) result = msg->data.result;
            }
            if (result != CURLE_OK) {
                throw BackendError(std::string("Gemini request failed: ") + curl_easy_strerror(result));
            }

            long status = 0;
            curl_easy_getinfo(easy, CURLINFO_RESPONSE_CODE, &status);
            if (status != 200) {
                throw BackendError("Gemini HTTP " + std::to_string(status) + ": " + raw_response,
                                   static_cast<int>(status));
            }

            consume(parser.finish());
        }
    };
}

// ==================== SSE ====================

void SseParser::take_line(const std::string& line, std::vector<std::string>& events) {
    if (line.empty()) {
        // blank line ends one event
        if (!event_data.empty()) {
            events.push_back(event_data);
            event_data.clear();
        }
        return;
    }

    if (line.compare(0, 5, "data:") == 0) {
        std::string value = line.substr(5);
        if (!value.empty() && value[0] == ' ') value.erase(0, 1);
        if (!event_data.empty()) event_data += "\n";
        event_data += value;
    }
}

std::vector<std::string> SseParser::feed(const std::string& bytes) {
    std::vector<std::string> events;
    buffer += bytes;

    size_t newline;
    while ((newline = buffer.find('\n')) != std::string::npos) {
        std::string line = buffer.substr(0, newline);
        buffer.erase(0, newline + 1);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        take_line(line, events);
    }
    return events;
}

std::vector<std::string> SseParser::finish() {
    std::vector<std::string> events;
    if (!buffer.empty()) {
        std::string line = buffer;
        buffer.clear();
        if (!line.empty() && line.back() == '\r') line.pop_back();
        take_line(line, events);
    }
    take_line("", events);
    return events;
}

std::vector<std::string> extract_gemini_texts(const std::string& payload) {
    Json::Value root;
    try {
        root = parse_message(payload);
    } catch (const ProtocolError& e) {
        throw BackendError(std::string("Malformed Gemini event: ") + e.what());
    }

    if (root.isMember("error")) {
        const Json::Value& error = root["error"];
        throw BackendError("Gemini error: " + error.get("message", "unknown").asString(),
                           error.get("code", 0).asInt());
    }

    std::vector<std::string> texts;
    const Json::Value& candidates = root["candidates"];
    if (!candidates.isArray() || candidates.empty()) {
        return texts;
    }

    const Json::Value& parts = candidates[0]["content"]["parts"];
    if (!parts.isArray()) {
        return texts;
    }

    for (const auto& part : parts) {
        if (part.isMember("text") && part["text"].isString()) {
            texts.push_back(part["text"].asString());
        }
    }
    return texts;
}

// ==================== BACKEND ====================

GeminiBackend::GeminiBackend(const GeminiConfig& config) : config(config) {
    spdlog::info("🧠 Gemini backend: {}", config.model);
}

const char* GeminiBackend::system_prompt() {
    return SYSTEM_PROMPT;
}

std::string GeminiBackend::endpoint_url() const {
    return config.base_url + "/v1beta/models/" + config.model +
           ":streamGenerateContent?alt=sse&key=" + config.api_key;
}

Json::Value GeminiBackend::build_payload(const BackendRequest& request) const {
    Json::Value doc(Json::objectValue);

    Json::Value sys(Json::objectValue);
    sys["parts"].append(text_part(SYSTEM_PROMPT));
    doc["systemInstruction"] = sys;

    Json::Value contents(Json::arrayValue);
    for (const auto& turn : request.history) {
        Json::Value content(Json::objectValue);
        content["role"] = turn.role == "assistant" ? "model" : "user";
        content["parts"].append(text_part(turn.content));
        contents.append(content);
    }

    Json::Value current(Json::objectValue);
    current["role"] = "user";
    Json::Value parts(Json::arrayValue);

    if (!request.context.empty()) {
        parts.append(text_part("[Contexto]\n" + request.context));
    }
    for (const auto& media : request.media) {
        Json::Value part(Json::objectValue);
        part["inline_data"]["mime_type"] = media.mime_type;
        part["inline_data"]["data"] = base64_encode(media.data);
        parts.append(part);
    }
    if (!request.text.empty()) {
        parts.append(text_part(request.text));
    } else if (!request.media.empty()) {
        parts.append(text_part("Responde al contenido adjunto."));
    }
    if (parts.empty()) {
        parts.append(text_part("..."));
    }

    current["parts"] = parts;
    contents.append(current);
    doc["contents"] = contents;

    Json::Value generation(Json::objectValue);
    generation["maxOutputTokens"] = config.max_output_tokens;
    generation["temperature"] = config.temperature;
    doc["generationConfig"] = generation;

    return doc;
}

std::unique_ptr<TextStream> GeminiBackend::stream(const BackendRequest& request) {
    if (config.api_key.empty()) {
        throw BackendError("Gemini API key not configured");
    }

    std::string body = to_json(build_payload(request));
    spdlog::debug("Gemini request: {} history turns, {} media parts, {} bytes",
                  request.history.size(), request.media.size(), body.size());

    return std::make_unique<GeminiTextStream>(endpoint_url(), body, config.timeout_ms);
}
