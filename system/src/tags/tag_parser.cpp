// ============= src/tags/tag_parser.cpp =============
#include "tags/tag_parser.hpp"
#include "utils.hpp"
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <cstring>

namespace {
    struct RawTag {
        bool matched = false;
        std::string value;
        std::string remaining;
    };

    // Tag anchored after optional leading whitespace
    RawTag parse_leading(const std::string& text, const char* marker) {
        RawTag tag;
        tag.remaining = text;

        size_t pos = text.find_first_not_of(" \t\r\n");
        if (pos == std::string::npos || !starts_with_icase(text, pos, marker)) {
            return tag;
        }

        size_t start = pos + std::strlen(marker);
        size_t close = text.find(']', start);
        if (close == std::string::npos) {
            return tag;
        }

        tag.matched = true;
        tag.value = trim(text.substr(start, close - start));
        tag.remaining = ltrim(text.substr(close + 1));
        return tag;
    }

    size_t find_icase(const std::string& text, const char* marker, size_t pos) {
        for (size_t i = text.find('[', pos); i != std::string::npos; i = text.find('[', i + 1)) {
            if (starts_with_icase(text, i, marker)) return i;
        }
        return std::string::npos;
    }

    // Contents of every complete "[marker...]" occurrence
    std::vector<std::string> find_all(const std::string& text, const char* marker) {
        std::vector<std::string> values;
        size_t marker_len = std::strlen(marker);

        size_t pos = find_icase(text, marker, 0);
        while (pos != std::string::npos) {
            size_t start = pos + marker_len;
            size_t close = text.find(']', start);
            if (close == std::string::npos) break;

            values.push_back(trim(text.substr(start, close - start)));
            pos = find_icase(text, marker, close + 1);
        }
        return values;
    }

    bool parse_int(const std::string& field, int& value) {
        std::string t = trim(field);
        if (t.empty()) return false;

        char* end = nullptr;
        errno = 0;
        long long v = std::strtoll(t.c_str(), &end, 10);
        if (end == t.c_str() || *end != '\0') return false;

        // out of int range: not a usable number
        if (errno == ERANGE || v < INT_MIN || v > INT_MAX) return false;

        value = static_cast<int>(v);
        return true;
    }

    std::string to_upper_ascii(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return s;
    }
}

// ==================== VOCABULARY ====================

const std::vector<std::string>& Tags::all_markers() {
    static const std::vector<std::string> markers = {
        EMOTION, EMOJIS, ACTIONS, MEDIA_SUMMARY, MEMORY, PERSON_NAME, ZONE_LEARN
    };
    return markers;
}

const std::vector<std::string>& emotion_vocabulary() {
    static const std::vector<std::string> vocabulary = {
        "happy", "excited", "sad", "empathy", "confused", "surprised", "love",
        "cool", "greeting", "neutral", "curious", "worried", "playful"
    };
    return vocabulary;
}

bool is_known_emotion(const std::string& tag) {
    const auto& vocabulary = emotion_vocabulary();
    return std::find(vocabulary.begin(), vocabulary.end(), tag) != vocabulary.end();
}

// ==================== HEADER TAGS ====================

EmotionTag parse_emotion_tag(const std::string& text) {
    EmotionTag result;
    RawTag raw = parse_leading(text, Tags::EMOTION);

    result.matched = raw.matched;
    result.remaining = raw.remaining;
    if (raw.matched) {
        std::string tag = to_lower_utf8(raw.value);
        result.emotion = is_known_emotion(tag) ? tag : "neutral";
    }
    return result;
}

EmojisTag parse_emojis_tag(const std::string& text) {
    EmojisTag result;
    RawTag raw = parse_leading(text, Tags::EMOJIS);

    result.matched = raw.matched;
    result.remaining = raw.remaining;
    if (raw.matched) {
        for (const auto& code : split(raw.value, ',')) {
            std::string c = trim(code);
            if (!c.empty()) {
                result.codes.push_back(to_upper_ascii(c));
            }
        }
    }
    return result;
}

MotionStep parse_motion_step(const std::string& step) {
    MotionStep result;
    std::vector<std::string> fields = split(step, ':');

    result.action = to_lower_utf8(trim(fields[0]));

    std::vector<int> numbers;
    for (size_t i = 1; i < fields.size(); ++i) {
        int value = 0;
        if (parse_int(fields[i], value)) {
            numbers.push_back(value);
        }
    }

    // "name:...:duration_ms" - the last number is always the duration
    if (!numbers.empty()) {
        result.duration_ms = std::min(std::max(0, numbers.back()), MAX_STEP_DURATION_MS);
        result.has_duration = true;
        numbers.pop_back();
    }
    result.args = numbers;
    return result;
}

ActionsTag parse_actions_tag(const std::string& text) {
    ActionsTag result;
    RawTag raw = parse_leading(text, Tags::ACTIONS);

    result.matched = raw.matched;
    result.remaining = raw.remaining;
    if (raw.matched) {
        for (const auto& step : split(raw.value, '|')) {
            if (trim(step).empty()) continue;
            MotionStep parsed = parse_motion_step(step);
            if (!parsed.action.empty()) {
                result.steps.push_back(parsed);
            }
        }
    }
    return result;
}

// ==================== BODY DIRECTIVES ====================

std::vector<MemoryDirective> extract_memory_tags(const std::string& text) {
    std::vector<MemoryDirective> memories;

    for (const auto& value : find_all(text, Tags::MEMORY)) {
        // type:content (content may contain ':')
        size_t colon = value.find(':');
        MemoryDirective m;
        if (colon == std::string::npos) {
            m.content = value;
        } else {
            m.type = parse_memory_type(value.substr(0, colon));
            m.content = trim(value.substr(colon + 1));
        }
        if (!m.content.empty()) {
            memories.push_back(m);
        }
    }
    return memories;
}

std::string extract_person_name(const std::string& text) {
    for (const auto& value : find_all(text, Tags::PERSON_NAME)) {
        if (!value.empty()) return value;
    }
    return "";
}

std::vector<ZoneDirective> extract_zone_learn_tags(const std::string& text) {
    std::vector<ZoneDirective> zones;

    for (const auto& value : find_all(text, Tags::ZONE_LEARN)) {
        ZoneDirective z;
        size_t first = value.find(':');
        z.name = trim(value.substr(0, first));
        if (first != std::string::npos) {
            size_t second = value.find(':', first + 1);
            z.category = parse_zone_category(value.substr(first + 1, second == std::string::npos
                                                                     ? std::string::npos
                                                                     : second - first - 1));
            if (second != std::string::npos) {
                z.description = trim(value.substr(second + 1));
            }
        }
        if (!z.name.empty()) {
            zones.push_back(z);
        }
    }
    return zones;
}

std::string extract_media_summary(const std::string& text) {
    for (const auto& value : find_all(text, Tags::MEDIA_SUMMARY)) {
        if (!value.empty()) return value;
    }
    return "";
}

// ==================== STRIPPING ====================

size_t find_marker(const std::string& text, size_t pos, size_t& marker_len) {
    for (size_t i = text.find('[', pos); i != std::string::npos; i = text.find('[', i + 1)) {
        for (const auto& marker : Tags::all_markers()) {
            if (starts_with_icase(text, i, marker)) {
                marker_len = marker.size();
                return i;
            }
        }
    }
    return std::string::npos;
}

std::string strip_control_tags(const std::string& text) {
    std::string out;
    size_t pos = 0;

    while (pos < text.size()) {
        size_t marker_len = 0;
        size_t start = find_marker(text, pos, marker_len);
        if (start == std::string::npos) {
            out += text.substr(pos);
            break;
        }

        out += text.substr(pos, start - pos);
        size_t close = text.find(']', start + marker_len);
        if (close == std::string::npos) {
            break;
        }

        pos = text.find_first_not_of(" \t\r\n", close + 1);
        if (pos == std::string::npos) break;
    }
    return out;
}
