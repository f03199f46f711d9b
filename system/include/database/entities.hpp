// ============= include/database/entities.hpp =============
/*
 * Entidades persistidas por el robot
 *
 * people            → Person (slug único, contador de interacciones)
 * face_embeddings   → FaceEmbedding (muchos por persona, nunca clave de identidad)
 * zones             → Zone (nombre único, una sola con is_current = 1)
 * zone_paths        → ZonePath (aristas dirigidas)
 * memories          → MemoryRecord (person_id vacío = memoria general)
 * conversation_history → ConversationMessage (orden por message_index)
 *
 * Timestamps: epoch en milisegundos (INTEGER).
 */

#pragma once
#include <cstdint>
#include <string>
#include <vector>

struct Person {
    int64_t id = -1;
    std::string person_id;      // slug, ej. "persona_ana"
    std::string name;
    int64_t first_seen = 0;
    int64_t last_seen = 0;
    int interaction_count = 0;
    std::string notes;
};

struct FaceEmbedding {
    int64_t id = -1;
    std::string person_id;
    std::vector<float> embedding;
    int64_t captured_at = 0;
    std::string source_lighting;  // "day" | "night" | ""
};

enum class ZoneCategory { Kitchen, Living, Bedroom, Bathroom, Unknown };

const char* zone_category_name(ZoneCategory category);
ZoneCategory parse_zone_category(const std::string& text);  // unknown text → Unknown

struct Zone {
    int64_t id = -1;
    std::string name;
    ZoneCategory category = ZoneCategory::Unknown;
    std::string description;
    int64_t known_since = 0;
    bool accessible = true;
    bool is_current = false;
};

struct ZonePath {
    int64_t id = -1;
    int64_t from_zone_id = -1;
    int64_t to_zone_id = -1;
    std::string direction_hint;
    int distance_cm = -1;  // -1 = unknown
};

enum class MemoryType { Experience, ZoneInfo, PersonFact, General };

const char* memory_type_name(MemoryType type);
MemoryType parse_memory_type(const std::string& text);  // unknown text → General

struct MemoryRecord {
    int64_t id = -1;
    std::string person_id;   // empty = general pool
    int64_t zone_id = -1;    // -1 = no zone
    MemoryType type = MemoryType::General;
    std::string content;
    int importance = 5;      // 1..10
    int64_t created_at = 0;
    int64_t expires_at = 0;  // 0 = never
};

enum class MessageRole { User, Assistant };

const char* message_role_name(MessageRole role);

struct ConversationMessage {
    int64_t id = -1;
    std::string session_id;
    MessageRole role = MessageRole::User;
    std::string content;
    int64_t message_index = 0;
    bool is_compacted = false;
    int64_t timestamp = 0;
    std::string person_id;
};
