#include "database/entities.hpp"
#include "utils.hpp"

const char* zone_category_name(ZoneCategory category) {
    switch (category) {
        case ZoneCategory::Kitchen:  return "kitchen";
        case ZoneCategory::Living:   return "living";
        case ZoneCategory::Bedroom:  return "bedroom";
        case ZoneCategory::Bathroom: return "bathroom";
        case ZoneCategory::Unknown:  break;
    }
    return "unknown";
}

ZoneCategory parse_zone_category(const std::string& text) {
    std::string key = to_lower_utf8(trim(text));
    if (key == "kitchen")  return ZoneCategory::Kitchen;
    if (key == "living")   return ZoneCategory::Living;
    if (key == "bedroom")  return ZoneCategory::Bedroom;
    if (key == "bathroom") return ZoneCategory::Bathroom;
    return ZoneCategory::Unknown;
}

const char* memory_type_name(MemoryType type) {
    switch (type) {
        case MemoryType::Experience: return "experience";
        case MemoryType::ZoneInfo:   return "zone_info";
        case MemoryType::PersonFact: return "person_fact";
        case MemoryType::General:    break;
    }
    return "general";
}

MemoryType parse_memory_type(const std::string& text) {
    std::string key = to_lower_utf8(trim(text));
    if (key == "experience")  return MemoryType::Experience;
    if (key == "zone_info")   return MemoryType::ZoneInfo;
    if (key == "person_fact") return MemoryType::PersonFact;
    return MemoryType::General;
}

const char* message_role_name(MessageRole role) {
    return role == MessageRole::Assistant ? "assistant" : "user";
}
