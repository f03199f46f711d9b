// ============= include/protocol/session_engine.hpp =============
/*
 * Session Engine - dueño de una conexión /ws/interact de principio a fin
 *
 * ESTADOS: Connecting → Authenticating → Active → Closed
 *
 * AUTENTICACIÓN:
 * - El primer frame debe ser {"type":"auth","api_key":...}
 * - Comparación en tiempo constante contra server.api_key
 * - Cualquier otra cosa o timeout → close(1008) sin más lecturas
 *
 * CICLO DE RESPUESTA (un mensaje a la vez, sin solapar turnos):
 *   emotion → text_chunk* → capture_request? → response_meta → stream_end
 *
 * Después del ciclo se programan en el pool (sin esperar):
 * - historial + compactación
 * - persona (+ embedding pendiente)
 * - cada memoria, cada zona, por separado
 *
 * ERRORES:
 * - Fallo del backend → error recuperable AGENT_ERROR con request_id
 * - Excepción en el bucle externo → INTERNAL_ERROR (no recuperable), fin
 * - El cierre de sesión siempre se registra en el log
 */

#pragma once
#include "backend/generative_backend.hpp"
#include "database/memory_repository.hpp"
#include "database/people_repository.hpp"
#include "database/thread_pool.hpp"
#include "database/zone_repository.hpp"
#include "history/conversation_history.hpp"
#include "protocol/duplex_channel.hpp"
#include "tags/stream_decoder.hpp"
#include <json/json.h>
#include <string>
#include <vector>

enum class SessionState { Connecting, Authenticating, Active, Closed };

const char* session_state_name(SessionState state);

// Shared collaborators; all must outlive the background pool's queued work
struct SessionServices {
    PeopleRepository& people;
    MemoryRepository& memories;
    ZoneRepository& zones;
    ConversationHistory& history;
    GenerativeBackend& backend;
    ThreadPool& background;
};

struct SessionOptions {
    std::string api_key;
    int auth_timeout_ms = 10000;
    size_t max_audio_bytes = 50u * 1024 * 1024;
    int min_importance = 5;
    int context_limit = 5;
    size_t max_header_buffer = 500;
};

class SessionEngine {
public:
    SessionEngine(DuplexChannel& channel, SessionServices services, SessionOptions options);

    // Blocks until the connection ends
    void run();

    SessionState state() const { return session_state; }
    const std::string& session_id() const { return id; }

    // Identity and location as currently known by this session
    const std::string& person_id() const { return current_person_id; }
    const std::string& person_name() const { return current_person_name; }
    const std::string& zone_name() const { return current_zone_name; }

private:
    struct Turn {
        std::string text;
        std::vector<MediaPart> media;
        bool has_audio = false;
    };

    DuplexChannel& channel;
    SessionServices services;
    SessionOptions options;

    SessionState session_state = SessionState::Connecting;
    std::string id;

    // per-session identity and location
    std::string current_person_id;
    std::string current_person_name;
    double current_confidence = -1.0;
    std::string current_zone_name;

    // per-turn state
    std::string request_id;
    std::string audio_buffer;
    bool discarding_audio = false;
    std::vector<float> pending_embedding;

    bool authenticate();
    void reject(const std::string& reason);
    void send(const std::string& message);
    void send_error(const char* code, const std::string& message, bool recoverable);

    std::string resolve_request_id(const Json::Value& msg);
    bool decode_media(const Json::Value& msg, const char* field, const std::string& mime, Turn& turn);

    void dispatch(const Json::Value& msg);
    void handle_binary(const std::string& data);

    void on_interaction_start(const Json::Value& msg);
    void on_text(const Json::Value& msg);
    void on_audio_end(const Json::Value& msg);
    void on_media(const Json::Value& msg, const char* default_mime);
    void on_multimodal(const Json::Value& msg);
    void on_explore_mode(const Json::Value& msg);
    void on_face_scan_mode(const Json::Value& msg);
    void on_zone_update(const Json::Value& msg);
    void on_person_detected(const Json::Value& msg);

    void run_response_cycle(const Turn& turn);
    std::string load_context();

    void schedule_history(const std::string& user_message, const std::string& assistant_message);
    void schedule_person(const std::string& name);
    void schedule_memories(const std::vector<MemoryDirective>& memories);
    void schedule_zones(const std::vector<ZoneDirective>& zones);
};
