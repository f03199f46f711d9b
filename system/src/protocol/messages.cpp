// ============= src/protocol/messages.cpp =============
#include "protocol/messages.hpp"
#include <memory>

// ==================== PARSE / SERIALIZE ====================

Json::Value parse_message(const std::string& text) {
    Json::CharReaderBuilder builder;
    builder["collectComments"] = false;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());

    Json::Value root;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
        throw ProtocolError(ErrorCode::INVALID_MESSAGE, "Mensaje no es JSON válido: " + errors);
    }
    if (!root.isObject()) {
        throw ProtocolError(ErrorCode::INVALID_MESSAGE, "Mensaje JSON debe ser un objeto");
    }
    return root;
}

std::string to_json(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, value);
}

std::string get_string(const Json::Value& msg, const char* key, const std::string& def) {
    const Json::Value& v = msg[key];
    return v.isString() ? v.asString() : def;
}

int get_int(const Json::Value& msg, const char* key, int def) {
    const Json::Value& v = msg[key];
    if (v.isInt()) return v.asInt();
    if (v.isDouble()) return static_cast<int>(v.asDouble());
    return def;
}

double get_double(const Json::Value& msg, const char* key, double def) {
    const Json::Value& v = msg[key];
    return v.isNumeric() ? v.asDouble() : def;
}

bool get_bool(const Json::Value& msg, const char* key, bool def) {
    const Json::Value& v = msg[key];
    return v.isBool() ? v.asBool() : def;
}

std::vector<float> get_float_array(const Json::Value& msg, const char* key) {
    const Json::Value& v = msg[key];
    std::vector<float> values;
    if (!v.isArray()) return values;

    values.reserve(v.size());
    for (const auto& item : v) {
        if (!item.isNumeric()) return {};
        values.push_back(static_cast<float>(item.asDouble()));
    }
    return values;
}

Json::Value move_sequence_to_json(const MoveSequence& sequence) {
    Json::Value action(Json::objectValue);
    action["type"] = "move_sequence";
    action["description"] = sequence.description;
    action["emotion_during"] = sequence.emotion_during;
    action["total_duration_ms"] = static_cast<Json::Int64>(sequence.total_duration_ms);
    action["step_count"] = sequence.step_count();

    Json::Value steps(Json::arrayValue);
    for (const auto& step : sequence.steps) {
        Json::Value s(Json::objectValue);
        s["action"] = step.action;
        if (step.has_duration) {
            s["duration_ms"] = step.duration_ms;
        }
        for (const auto& param : step.params) {
            s[param.first] = param.second;
        }
        if (!step.raw_args.empty()) {
            Json::Value args(Json::arrayValue);
            for (int a : step.raw_args) args.append(a);
            s["args"] = args;
        }
        steps.append(s);
    }
    action["steps"] = steps;
    return action;
}

namespace {
    Json::Value base(const char* type) {
        Json::Value msg(Json::objectValue);
        msg["type"] = type;
        return msg;
    }

    Json::Value actions_array(const std::vector<MoveSequence>& actions) {
        Json::Value arr(Json::arrayValue);
        for (const auto& seq : actions) {
            arr.append(move_sequence_to_json(seq));
        }
        return arr;
    }
}

// ==================== SERVER → CLIENT ====================

std::string make_auth_ok(const std::string& session_id) {
    Json::Value msg = base("auth_ok");
    msg["session_id"] = session_id;
    return to_json(msg);
}

std::string make_emotion(const std::string& request_id, const std::string& emotion,
                         const std::string& person_identified, double confidence)
{
    Json::Value msg = base("emotion");
    msg["request_id"] = request_id;
    msg["emotion"] = emotion;
    if (!person_identified.empty()) {
        msg["person_identified"] = person_identified;
    }
    if (confidence >= 0.0) {
        msg["confidence"] = confidence;
    }
    return to_json(msg);
}

std::string make_text_chunk(const std::string& request_id, const std::string& text) {
    Json::Value msg = base("text_chunk");
    msg["request_id"] = request_id;
    msg["text"] = text;
    return to_json(msg);
}

std::string make_capture_request(const std::string& request_id, const std::string& capture_type) {
    Json::Value msg = base("capture_request");
    msg["request_id"] = request_id;
    msg["capture_type"] = capture_type;
    return to_json(msg);
}

std::string make_response_meta(const std::string& request_id,
                               const std::string& response_text,
                               const Expression& expression,
                               const std::vector<MoveSequence>& actions,
                               const std::string& person_name)
{
    Json::Value msg = base("response_meta");
    msg["request_id"] = request_id;
    msg["response_text"] = response_text;

    Json::Value expr(Json::objectValue);
    Json::Value emojis(Json::arrayValue);
    for (const auto& e : expression.emojis) emojis.append(e);
    expr["emojis"] = emojis;
    expr["duration_per_emoji"] = expression.duration_per_emoji;
    expr["transition"] = expression.transition;
    msg["expression"] = expr;

    msg["actions"] = actions_array(actions);
    if (!person_name.empty()) {
        msg["person_name"] = person_name;
    }
    return to_json(msg);
}

std::string make_stream_end(const std::string& request_id, int64_t processing_time_ms) {
    Json::Value msg = base("stream_end");
    msg["request_id"] = request_id;
    msg["processing_time_ms"] = static_cast<Json::Int64>(processing_time_ms);
    return to_json(msg);
}

std::string make_error(const std::string& error_code, const std::string& message,
                       bool recoverable, const std::string& request_id)
{
    Json::Value msg = base("error");
    msg["error_code"] = error_code;
    msg["message"] = message;
    msg["recoverable"] = recoverable;
    if (!request_id.empty()) {
        msg["request_id"] = request_id;
    }
    return to_json(msg);
}

std::string make_exploration_actions(const std::string& request_id,
                                     const std::vector<MoveSequence>& actions,
                                     const std::string& exploration_speech)
{
    Json::Value msg = base("exploration_actions");
    msg["request_id"] = request_id;
    msg["actions"] = actions_array(actions);
    msg["exploration_speech"] = exploration_speech;
    return to_json(msg);
}

std::string make_face_scan_actions(const std::string& request_id,
                                   const std::vector<MoveSequence>& actions)
{
    Json::Value msg = base("face_scan_actions");
    msg["request_id"] = request_id;
    msg["actions"] = actions_array(actions);
    return to_json(msg);
}
