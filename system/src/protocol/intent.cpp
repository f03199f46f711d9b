// ============= src/protocol/intent.cpp =============
#include "protocol/intent.hpp"
#include "utils.hpp"

namespace {
    // "record" alone would also match "recordar"
    const char* VIDEO_KEYWORDS[] = {
        "video", "vídeo", "graba", "grabar", "record a video", "record video", "recording",
        "qué está pasando", "que esta pasando", "what's happening",
    };

    const char* PHOTO_KEYWORDS[] = {
        "foto", "fotografía", "picture", "photo", "muéstrame tu cara", "muestrame tu cara",
        "show me your face", "selfie",
    };

    template<size_t N>
    bool matches_any(const std::string& lower, const char* (&keywords)[N]) {
        for (const char* keyword : keywords) {
            if (lower.find(keyword) != std::string::npos) return true;
        }
        return false;
    }
}

CaptureIntent classify_intent(const std::string& text) {
    std::string lower = to_lower_utf8(text);

    if (matches_any(lower, VIDEO_KEYWORDS)) return CaptureIntent::Video;
    if (matches_any(lower, PHOTO_KEYWORDS)) return CaptureIntent::Photo;
    return CaptureIntent::None;
}

const char* capture_type_name(CaptureIntent intent) {
    switch (intent) {
        case CaptureIntent::Photo: return "photo";
        case CaptureIntent::Video: return "video";
        case CaptureIntent::None:  break;
    }
    return "";
}
