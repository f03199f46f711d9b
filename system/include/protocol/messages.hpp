// ============= include/protocol/messages.hpp =============
/*
 * Mensajes del protocolo /ws/interact (JSON, jsoncpp)
 *
 * Cliente → servidor: auth, interaction_start, text, audio_end (+ frames
 * binarios), image, video, multimodal, explore_mode, face_scan_mode,
 * zone_update, person_detected
 *
 * Servidor → cliente: auth_ok, emotion, text_chunk, capture_request,
 * response_meta, stream_end, error, exploration_actions, face_scan_actions
 */

#pragma once
#include "motion/expression.hpp"
#include "motion/motion_compiler.hpp"
#include <json/json.h>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace ErrorCode {
    constexpr const char* INVALID_MESSAGE = "INVALID_MESSAGE";
    constexpr const char* UNKNOWN_MESSAGE_TYPE = "UNKNOWN_MESSAGE_TYPE";
    constexpr const char* EMPTY_AUDIO = "EMPTY_AUDIO";
    constexpr const char* AUDIO_TOO_LARGE = "AUDIO_TOO_LARGE";
    constexpr const char* AGENT_ERROR = "AGENT_ERROR";
    constexpr const char* EXPLORATION_ERROR = "EXPLORATION_ERROR";
    constexpr const char* INTERNAL_ERROR = "INTERNAL_ERROR";
}

class ProtocolError : public std::runtime_error {
public:
    ProtocolError(const std::string& code, const std::string& what)
        : std::runtime_error(what), error_code(code) {}

    const std::string& code() const { return error_code; }

private:
    std::string error_code;
};

// Throws ProtocolError(INVALID_MESSAGE) unless the text is a JSON object
Json::Value parse_message(const std::string& text);

// Compact single-line JSON, UTF-8 kept as is
std::string to_json(const Json::Value& value);

// Typed field access with defaults (wrong type → default)
std::string get_string(const Json::Value& msg, const char* key, const std::string& def = "");
int get_int(const Json::Value& msg, const char* key, int def = 0);
double get_double(const Json::Value& msg, const char* key, double def = 0.0);
bool get_bool(const Json::Value& msg, const char* key, bool def = false);

// Empty vector when the field is missing or not a numeric array
std::vector<float> get_float_array(const Json::Value& msg, const char* key);

Json::Value move_sequence_to_json(const MoveSequence& sequence);

// ==================== SERVER → CLIENT ====================

std::string make_auth_ok(const std::string& session_id);

// confidence < 0 → omitted
std::string make_emotion(const std::string& request_id, const std::string& emotion,
                         const std::string& person_identified = "", double confidence = -1.0);

std::string make_text_chunk(const std::string& request_id, const std::string& text);

std::string make_capture_request(const std::string& request_id, const std::string& capture_type);

std::string make_response_meta(const std::string& request_id,
                               const std::string& response_text,
                               const Expression& expression,
                               const std::vector<MoveSequence>& actions,
                               const std::string& person_name = "");

std::string make_stream_end(const std::string& request_id, int64_t processing_time_ms);

std::string make_error(const std::string& error_code, const std::string& message,
                       bool recoverable, const std::string& request_id = "");

std::string make_exploration_actions(const std::string& request_id,
                                     const std::vector<MoveSequence>& actions,
                                     const std::string& exploration_speech);

std::string make_face_scan_actions(const std::string& request_id,
                                   const std::vector<MoveSequence>& actions);
