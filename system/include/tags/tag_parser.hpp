// ============= include/tags/tag_parser.hpp =============
/*
 * Parsers de etiquetas de control emitidas por el modelo
 *
 * CABECERA (ancladas al inicio, en este orden):
 *   [emotion:TAG] [emojis:CODE,CODE] [actions:paso|paso]
 *
 * DIRECTIVAS (en cualquier parte del cuerpo, pueden repetirse):
 *   [memory:tipo:contenido] [person_name:NOMBRE]
 *   [zone_learn:nombre:categoria:descripcion] [media_summary: texto]
 *
 * Todo sin distinguir mayúsculas. Cada parser de cabecera devuelve
 * si hubo coincidencia y el texto restante (sin espacios iniciales).
 */

#pragma once
#include "database/entities.hpp"
#include <string>
#include <vector>

// Upper bound for one step's duration (10 min)
constexpr int MAX_STEP_DURATION_MS = 600000;

// Raw step "name:arg:...:duration_ms" before alias expansion
struct MotionStep {
    std::string action;
    std::vector<int> args;
    int duration_ms = 0;
    bool has_duration = false;
};

struct EmotionTag {
    bool matched = false;
    std::string emotion = "neutral";
    std::string remaining;
};

struct EmojisTag {
    bool matched = false;
    std::vector<std::string> codes;
    std::string remaining;
};

struct ActionsTag {
    bool matched = false;
    std::vector<MotionStep> steps;
    std::string remaining;
};

struct MemoryDirective {
    MemoryType type = MemoryType::General;
    std::string content;
    int importance = 5;
};

struct ZoneDirective {
    std::string name;
    ZoneCategory category = ZoneCategory::Unknown;
    std::string description;
};

namespace Tags {
    constexpr const char* EMOTION = "[emotion:";
    constexpr const char* EMOJIS = "[emojis:";
    constexpr const char* ACTIONS = "[actions:";
    constexpr const char* MEDIA_SUMMARY = "[media_summary:";
    constexpr const char* MEMORY = "[memory:";
    constexpr const char* PERSON_NAME = "[person_name:";
    constexpr const char* ZONE_LEARN = "[zone_learn:";

    // Every marker the client must never see
    const std::vector<std::string>& all_markers();
}

const std::vector<std::string>& emotion_vocabulary();
bool is_known_emotion(const std::string& tag);

// Leading-tag parsers. No tag → matched=false and remaining == text.
// An unknown emotion is still stripped and reported as "neutral".
EmotionTag parse_emotion_tag(const std::string& text);
EmojisTag parse_emojis_tag(const std::string& text);
ActionsTag parse_actions_tag(const std::string& text);

MotionStep parse_motion_step(const std::string& step);

// Non-anchored passes over complete text
std::vector<MemoryDirective> extract_memory_tags(const std::string& text);
std::string extract_person_name(const std::string& text);   // first one, "" if none
std::vector<ZoneDirective> extract_zone_learn_tags(const std::string& text);
std::string extract_media_summary(const std::string& text); // "" if none

// Removes every complete control tag; an unclosed marker is cut to the end
std::string strip_control_tags(const std::string& text);

// Position of the first marker at or after pos, npos if none; marker_len gets its length
size_t find_marker(const std::string& text, size_t pos, size_t& marker_len);
