// ============= src/protocol/session_engine.cpp =============
#include "protocol/session_engine.hpp"
#include "config.hpp"
#include "motion/expression.hpp"
#include "motion/motion_compiler.hpp"
#include "protocol/intent.hpp"
#include "protocol/messages.hpp"
#include "utils.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <sstream>

const char* session_state_name(SessionState state) {
    switch (state) {
        case SessionState::Connecting:     return "connecting";
        case SessionState::Authenticating: return "authenticating";
        case SessionState::Active:         return "active";
        case SessionState::Closed:         break;
    }
    return "closed";
}

SessionEngine::SessionEngine(DuplexChannel& channel, SessionServices services, SessionOptions options)
    : channel(channel), services(services), options(std::move(options)) {}

// ==================== LIFECYCLE ====================

void SessionEngine::run() {
    if (!authenticate()) {
        session_state = SessionState::Closed;
        return;
    }

    spdlog::info("🤖 Sesión iniciada: {}", id);
    bool fatal = false;

    try {
        while (channel.is_open()) {
            Frame frame;
            if (!channel.receive(frame, -1)) {
                continue;
            }

            if (frame.type == Frame::Type::Closed) {
                spdlog::info("Cliente desconectado: {}", id);
                break;
            }

            if (frame.type == Frame::Type::Binary) {
                handle_binary(frame.data);
                continue;
            }

            Json::Value msg;
            try {
                msg = parse_message(frame.data);
            } catch (const ProtocolError& e) {
                spdlog::debug("[{}] {}", id, e.what());
                send_error(ErrorCode::INVALID_MESSAGE, "Mensaje no es JSON válido", true);
                continue;
            }

            dispatch(msg);
        }
    } catch (const std::exception& e) {
        fatal = true;
        spdlog::error("❌ Error inesperado en sesión {}: {}", id, e.what());
        send(make_error(ErrorCode::INTERNAL_ERROR, "Error interno del servidor", false));
    }

    if (channel.is_open()) {
        channel.close(fatal ? Config::CLOSE_INTERNAL_ERROR : Config::CLOSE_NORMAL,
                      fatal ? "internal error" : "bye");
    }
    session_state = SessionState::Closed;
    services.history.forget(id);
    spdlog::info("Sesión cerrada: {}", id);
}

bool SessionEngine::authenticate() {
    session_state = SessionState::Authenticating;

    Frame frame;
    if (!channel.receive(frame, options.auth_timeout_ms)) {
        reject("Authentication timeout");
        return false;
    }
    if (frame.type == Frame::Type::Closed) {
        spdlog::info("Cliente desconectado antes de autenticar");
        return false;
    }
    if (frame.type != Frame::Type::Text) {
        reject("Expected auth message");
        return false;
    }

    Json::Value msg;
    try {
        msg = parse_message(frame.data);
    } catch (const ProtocolError&) {
        reject("Malformed auth message");
        return false;
    }

    if (get_string(msg, "type") != "auth") {
        reject("Expected auth message");
        return false;
    }

    std::string key = get_string(msg, "api_key");
    if (options.api_key.empty() || !constant_time_equals(key, options.api_key)) {
        reject("Invalid API key");
        return false;
    }

    id = new_uuid();
    session_state = SessionState::Active;
    send(make_auth_ok(id));
    return true;
}

void SessionEngine::reject(const std::string& reason) {
    spdlog::warn("🔒 Conexión rechazada: {}", reason);
    channel.close(Config::CLOSE_POLICY_VIOLATION, reason);
}

void SessionEngine::send(const std::string& message) {
    channel.send_text(message);
}

void SessionEngine::send_error(const char* code, const std::string& message, bool recoverable) {
    send(make_error(code, message, recoverable, request_id));
}

std::string SessionEngine::resolve_request_id(const Json::Value& msg) {
    std::string rid = get_string(msg, "request_id");
    if (!rid.empty()) {
        request_id = rid;
    } else if (request_id.empty()) {
        request_id = new_uuid();
    }
    return request_id;
}

// ==================== DISPATCH ====================

void SessionEngine::dispatch(const Json::Value& msg) {
    std::string type = get_string(msg, "type");
    spdlog::debug("[{}] ← {}", id, type.empty() ? "(sin tipo)" : type);

    if (type == "interaction_start")   on_interaction_start(msg);
    else if (type == "text")           on_text(msg);
    else if (type == "audio_end")      on_audio_end(msg);
    else if (type == "image")          on_media(msg, "image/jpeg");
    else if (type == "video")          on_media(msg, "video/mp4");
    else if (type == "multimodal")     on_multimodal(msg);
    else if (type == "explore_mode")   on_explore_mode(msg);
    else if (type == "face_scan_mode") on_face_scan_mode(msg);
    else if (type == "zone_update")    on_zone_update(msg);
    else if (type == "person_detected") on_person_detected(msg);
    else if (type == "auth") {
        send_error(ErrorCode::INVALID_MESSAGE, "Sesión ya autenticada", true);
    } else {
        send_error(ErrorCode::UNKNOWN_MESSAGE_TYPE, "Tipo de mensaje desconocido: " + type, true);
    }
}

void SessionEngine::handle_binary(const std::string& data) {
    if (discarding_audio) {
        return;
    }

    if (audio_buffer.size() + data.size() > options.max_audio_bytes) {
        spdlog::warn("[{}] Audio excede {} bytes, descartado", id, options.max_audio_bytes);
        audio_buffer.clear();
        discarding_audio = true;
        send_error(ErrorCode::AUDIO_TOO_LARGE, "El audio excede el tamaño máximo", true);
        return;
    }

    audio_buffer += data;
}

void SessionEngine::on_interaction_start(const Json::Value& msg) {
    std::string rid = get_string(msg, "request_id");
    request_id = rid.empty() ? new_uuid() : rid;
    audio_buffer.clear();
    discarding_audio = false;

    std::string person = get_string(msg, "person_id", get_string(msg, "user_id"));
    if (person == "unknown") person.clear();

    if (person != current_person_id) {
        current_person_name.clear();
    }
    current_person_id = person;
    current_confidence = get_double(msg, "face_confidence", get_double(msg, "confidence", -1.0));
    pending_embedding = get_float_array(msg, "face_embedding");

    if (!current_person_id.empty() && current_person_name.empty()) {
        try {
            PersonLookup lookup = services.people.get_by_person_id(current_person_id);
            if (lookup.found) {
                current_person_name = lookup.person.name;
            }
        } catch (const StoreError& e) {
            spdlog::warn("[{}] No se pudo leer la persona {}: {}", id, current_person_id, e.what());
        }
    }

    spdlog::debug("[{}] interaction_start person={} request={} embedding={}",
                  id, current_person_id.empty() ? "unknown" : current_person_id,
                  request_id, pending_embedding.size());
}

void SessionEngine::on_text(const Json::Value& msg) {
    resolve_request_id(msg);

    Turn turn;
    turn.text = get_string(msg, "content");
    if (turn.text.empty()) {
        spdlog::debug("[{}] text vacío ignorado", id);
        return;
    }
    run_response_cycle(turn);
}

void SessionEngine::on_audio_end(const Json::Value& msg) {
    resolve_request_id(msg);

    if (discarding_audio) {
        discarding_audio = false;
        return;
    }

    if (audio_buffer.empty()) {
        send_error(ErrorCode::EMPTY_AUDIO, "No se recibieron datos de audio", true);
        return;
    }

    Turn turn;
    turn.has_audio = true;
    turn.media.push_back({get_string(msg, "mime_type", "audio/webm"), audio_buffer});
    audio_buffer.clear();

    run_response_cycle(turn);
}

bool SessionEngine::decode_media(const Json::Value& msg, const char* field,
                                 const std::string& mime, Turn& turn)
{
    std::string encoded = get_string(msg, field);
    if (encoded.empty()) {
        return false;
    }

    try {
        turn.media.push_back({mime, base64_decode(encoded)});
        return true;
    } catch (const std::invalid_argument& e) {
        spdlog::warn("[{}] Campo '{}' ignorado: {}", id, field, e.what());
        return false;
    }
}

void SessionEngine::on_media(const Json::Value& msg, const char* default_mime) {
    resolve_request_id(msg);

    Turn turn;
    turn.text = get_string(msg, "text");
    std::string mime = get_string(msg, "mime", get_string(msg, "mime_type", default_mime));
    decode_media(msg, "data", mime, turn);

    if (turn.media.empty() && turn.text.empty()) {
        send_error(ErrorCode::INVALID_MESSAGE, "Mensaje sin contenido", true);
        return;
    }
    run_response_cycle(turn);
}

void SessionEngine::on_multimodal(const Json::Value& msg) {
    resolve_request_id(msg);

    Turn turn;
    turn.text = get_string(msg, "text");
    turn.has_audio = decode_media(msg, "audio", get_string(msg, "audio_mime", "audio/webm"), turn);
    decode_media(msg, "image", get_string(msg, "image_mime", "image/jpeg"), turn);
    decode_media(msg, "video", get_string(msg, "video_mime", "video/mp4"), turn);

    if (turn.media.empty() && turn.text.empty()) {
        send_error(ErrorCode::INVALID_MESSAGE, "Mensaje sin contenido", true);
        return;
    }
    run_response_cycle(turn);
}

// ==================== RESPONSE CYCLE ====================

std::string SessionEngine::load_context() {
    try {
        int64_t zone_id = -1;
        if (!current_zone_name.empty()) {
            ZoneLookup zone = services.zones.get_by_name(current_zone_name);
            if (zone.found) zone_id = zone.zone.id;
        }

        MemoryContextBundle bundle = services.memories.get_context_bundle(
            current_person_id, zone_id, options.min_importance, options.context_limit);
        return format_memory_context(bundle, current_zone_name, current_person_name);

    } catch (const StoreError& e) {
        spdlog::warn("[{}] Memorias no disponibles: {}", id, e.what());
        return "";
    }
}

void SessionEngine::run_response_cycle(const Turn& turn) {
    auto start = std::chrono::steady_clock::now();
    const std::string rid = request_id;

    BackendRequest request;
    request.text = turn.text;
    request.media = turn.media;
    request.context = load_context();
    request.history = services.history.get_history(id);

    StreamDecoder decoder(options.max_header_buffer);
    bool emotion_sent = false;
    size_t chunks = 0;

    auto send_emotion = [&]() {
        send(make_emotion(rid, decoder.header().emotion, current_person_id, current_confidence));
        emotion_sent = true;
    };

    try {
        std::unique_ptr<TextStream> stream = services.backend.stream(request);

        std::string fragment;
        while (stream->next(fragment)) {
            std::string visible = decoder.feed(fragment);
            if (!emotion_sent && decoder.header_resolved()) {
                send_emotion();
            }
            if (!visible.empty()) {
                send(make_text_chunk(rid, visible));
                ++chunks;
            }
        }

        std::string tail = decoder.finish();
        if (!emotion_sent) {
            send_emotion();
        }
        if (!tail.empty()) {
            send(make_text_chunk(rid, tail));
            ++chunks;
        }

    } catch (const std::exception& e) {
        spdlog::error("[{}] Error en agente (request {}): {}", id, rid, e.what());
        send(make_error(ErrorCode::AGENT_ERROR, "Error procesando la solicitud", true, rid));
        return;
    }

    DecodedResponse response = decoder.result();

    if (!response.person_name.empty()) {
        current_person_name = response.person_name;
        if (current_person_id.empty()) {
            current_person_id = make_person_slug(response.person_name);
        }
    }

    CaptureIntent intent = classify_intent(response.response_text);
    if (intent != CaptureIntent::None) {
        send(make_capture_request(rid, capture_type_name(intent)));
    }

    Expression expression = build_expression(response.header.emotion, response.header.emojis);

    std::vector<MoveSequence> actions;
    if (!response.header.actions.empty()) {
        actions.push_back(build_move_sequence("Movimiento sugerido por Robi",
                                              response.header.actions,
                                              response.header.emotion));
    }

    send(make_response_meta(rid, response.response_text, expression, actions, response.person_name));

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    send(make_stream_end(rid, elapsed));

    spdlog::debug("[{}] turno {} completo: emotion={} chunks={} {}ms",
                  id, rid, response.header.emotion, chunks, elapsed);

    // ---- background persistence, never awaited ----
    std::string user_message = turn.text;
    if (!turn.media.empty()) {
        if (!response.media_summary.empty()) {
            user_message = response.media_summary;
        } else {
            spdlog::warn("[{}] Sin [media_summary:] para turno multimedia, usando placeholder", id);
            user_message = turn.has_audio ? "[audio]" : "[imagen/video]";
        }
    }
    schedule_history(user_message, response.response_text);

    if (!response.person_name.empty() || (!pending_embedding.empty() && !current_person_id.empty())) {
        schedule_person(response.person_name.empty() ? current_person_name : response.person_name);
    }
    schedule_memories(response.memories);
    schedule_zones(response.zones);
}

// ==================== BACKGROUND TASKS ====================

void SessionEngine::schedule_history(const std::string& user_message, const std::string& assistant_message) {
    // the turn's place in the log is fixed here, the write happens on the pool
    services.history.schedule_turn(id, user_message, assistant_message, current_person_id);
}

void SessionEngine::schedule_person(const std::string& name) {
    PeopleRepository* people = &services.people;
    std::string slug = current_person_id;
    std::string display = name.empty() ? slug : name;
    std::vector<float> embedding;
    embedding.swap(pending_embedding);

    services.background.post("person:" + slug, [people, slug, display, name, embedding]() {
        GetOrCreateResult result = people->get_or_create(slug, display);
        if (!result.created && !name.empty() && result.person.name != name) {
            people->update_name(slug, name);
        }
        if (!embedding.empty()) {
            people->add_embedding(slug, embedding);
        }
    }, ThreadPool::Priority::High);
}

void SessionEngine::schedule_memories(const std::vector<MemoryDirective>& memories) {
    MemoryRepository* repo = &services.memories;
    ZoneRepository* zones = &services.zones;

    for (const auto& memory : memories) {
        // facts about someone stay with that person; zone facts go to the current zone
        std::string person;
        if (memory.type == MemoryType::PersonFact || memory.type == MemoryType::Experience) {
            person = current_person_id;
        }
        std::string zone_name = memory.type == MemoryType::ZoneInfo ? current_zone_name : "";

        services.background.post("memory:" + std::string(memory_type_name(memory.type)),
            [repo, zones, person, zone_name, memory]() {
                int64_t zone_id = -1;
                if (!zone_name.empty()) {
                    ZoneLookup zone = zones->get_by_name(zone_name);
                    if (zone.found) zone_id = zone.zone.id;
                }
                repo->save(person, memory.type, memory.content, memory.importance, zone_id);
            });
    }
}

void SessionEngine::schedule_zones(const std::vector<ZoneDirective>& zones) {
    ZoneRepository* repo = &services.zones;

    for (const auto& zone : zones) {
        services.background.post("zone:" + zone.name, [repo, zone]() {
            ZoneGetOrCreateResult result = repo->get_or_create(zone.name, zone.category, zone.description);
            if (!result.created && result.zone.description.empty() && !zone.description.empty()) {
                repo->update_description(zone.name, zone.description);
            }
        });
    }
}

// ==================== MODE COMMANDS ====================

void SessionEngine::on_explore_mode(const Json::Value& msg) {
    const std::string rid = resolve_request_id(msg);
    int minutes = get_int(msg, "duration_minutes", Config::DEFAULT_EXPLORE_MINUTES);

    DecodedResponse reply;
    try {
        std::ostringstream known;
        for (const auto& zone : services.zones.list_all()) {
            if (known.tellp() > 0) known << ", ";
            known << zone.name;
        }

        BackendRequest request;
        request.text =
            "Modo exploración activado durante " + std::to_string(minutes) + " minutos. "
            "Zona actual: " + (current_zone_name.empty() ? "desconocida" : current_zone_name) + ". "
            "Zonas conocidas: " + (known.tellp() > 0 ? known.str() : "ninguna") + ". "
            "Di en una frase qué vas a explorar y sugiere movimientos con [actions:...]. "
            "Si identificas una zona nueva usa [zone_learn:nombre:categoria:descripcion].";

        reply = decode_complete(collect_text(services.backend, request), options.max_header_buffer);

    } catch (const std::exception& e) {
        spdlog::error("[{}] Error en exploración: {}", id, e.what());
        send(make_error(ErrorCode::EXPLORATION_ERROR, "No se pudo iniciar la exploración", true, rid));
        return;
    }

    std::vector<MoveSequence> actions;
    if (reply.header.actions.empty()) {
        actions.push_back(build_look_around_sequence());
    } else {
        actions.push_back(build_move_sequence("Exploración", reply.header.actions, reply.header.emotion));
    }

    send(make_exploration_actions(rid, actions, reply.response_text));
    schedule_zones(reply.zones);

    spdlog::info("🧭 [{}] Exploración {} min, {} zonas nuevas sugeridas", id, minutes, reply.zones.size());
}

void SessionEngine::on_face_scan_mode(const Json::Value& msg) {
    const std::string rid = resolve_request_id(msg);
    send(make_face_scan_actions(rid, {build_face_scan_sequence()}));
}

void SessionEngine::on_zone_update(const Json::Value& msg) {
    resolve_request_id(msg);

    std::string name = trim(get_string(msg, "zone_name"));
    std::string action = to_lower_utf8(get_string(msg, "action"));
    ZoneCategory category = parse_zone_category(get_string(msg, "category"));
    ZoneRepository* zones = &services.zones;

    if (action == "leave") {
        if (name.empty() || name == current_zone_name) {
            current_zone_name.clear();
            services.background.post("zone:leave", [zones]() {
                zones->clear_current_zone();
            });
        }
        return;
    }

    if (action != "enter" && action != "discover") {
        send_error(ErrorCode::INVALID_MESSAGE, "Acción de zona inválida: " + action, true);
        return;
    }
    if (name.empty()) {
        send_error(ErrorCode::INVALID_MESSAGE, "zone_name requerido", true);
        return;
    }

    if (action == "discover") {
        services.background.post("zone:" + name, [zones, name, category]() {
            zones->get_or_create(name, category);
        });
        return;
    }

    std::string previous = current_zone_name;
    current_zone_name = name;

    services.background.post("zone:" + name, [zones, name, category, previous]() {
        Zone zone = zones->get_or_create(name, category).zone;
        zones->set_current_zone(zone.id);

        if (previous.empty() || previous == name) return;

        // learn the route we just walked
        Zone from = zones->get_or_create(previous).zone;
        for (const auto& path : zones->get_paths_from(from.id)) {
            if (path.to_zone_id == zone.id) return;
        }
        zones->add_path(from.id, zone.id, "desde " + previous + " hacia " + name);
    }, ThreadPool::Priority::High);
}

void SessionEngine::on_person_detected(const Json::Value& msg) {
    resolve_request_id(msg);

    bool known = get_bool(msg, "known");
    std::string person = get_string(msg, "person_id");

    if (!known || person.empty()) {
        current_person_id.clear();
        current_person_name.clear();
        current_confidence = -1.0;
        return;
    }

    if (person != current_person_id) {
        current_person_name.clear();
    }
    current_person_id = person;
    current_confidence = get_double(msg, "confidence", -1.0);

    PeopleRepository* people = &services.people;
    std::string display = get_string(msg, "name", person);
    services.background.post("person:" + person, [people, person, display]() {
        people->get_or_create(person, display);
    }, ThreadPool::Priority::High);
}
