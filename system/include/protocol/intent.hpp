// ============= include/protocol/intent.hpp =============
#pragma once
#include <string>

enum class CaptureIntent { None, Photo, Video };

// Bilingual keyword match on the final response text; video wins over photo
CaptureIntent classify_intent(const std::string& text);

// "photo" | "video" | ""
const char* capture_type_name(CaptureIntent intent);
