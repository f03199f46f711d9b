// ============= src/tags/stream_decoder.cpp =============
#include "tags/stream_decoder.hpp"
#include "utils.hpp"
#include <spdlog/spdlog.h>

StreamDecoder::StreamDecoder(size_t max_header_buffer)
    : max_header_buffer(max_header_buffer) {}

// ==================== HEADER ====================

bool StreamDecoder::try_resolve_header(bool force) {
    bool full = force || header_buf.size() >= max_header_buffer;
    if (!full && header_buf.find(']') == std::string::npos) {
        return false;
    }

    // A header tag must close inside the first max_header_buffer bytes
    std::string view = header_buf;
    std::string tail;
    if (header_buf.size() > max_header_buffer) {
        view = header_buf.substr(0, max_header_buffer);
        tail = header_buf.substr(max_header_buffer);
    }

    // Empty text or an unclosed '[' may still become the next header tag
    auto waiting = [full](const std::string& remaining) {
        if (full) return false;
        std::string rest = ltrim(remaining);
        if (rest.empty()) return true;
        return rest[0] == '[' && rest.find(']') == std::string::npos;
    };

    EmotionTag emotion = parse_emotion_tag(view);
    if (waiting(emotion.remaining)) return false;

    EmojisTag emojis = parse_emojis_tag(emotion.remaining);
    if (waiting(emojis.remaining)) return false;

    ActionsTag actions = parse_actions_tag(emojis.remaining);
    if (waiting(actions.remaining)) return false;

    decoded_header.emotion = emotion.emotion;
    decoded_header.emojis = emojis.codes;
    decoded_header.actions = actions.steps;

    // Cap reached inside a tag that never closed: the header text is plain text
    std::string rest = ltrim(actions.remaining);
    bool capped = header_buf.size() >= max_header_buffer;
    if (capped && !rest.empty() && rest[0] == '[' && rest.find(']') == std::string::npos) {
        spdlog::debug("Header unresolved after {} bytes, forwarding as text", view.size());
        passthrough = actions.remaining;
        pending = tail;
    } else {
        pending = actions.remaining + tail;
    }

    header_buf.clear();
    resolved = true;
    return true;
}

// ==================== BODY ====================

std::string StreamDecoder::drain_body(bool final) {
    std::string out;
    out.swap(passthrough);

    while (true) {
        if (skip_ws) {
            size_t start = pending.find_first_not_of(" \t\r\n");
            if (start == std::string::npos) {
                pending.clear();
                break;
            }
            pending.erase(0, start);
            skip_ws = false;
        }

        size_t open = pending.find('[');
        if (open == std::string::npos) {
            out += pending;
            pending.clear();
            break;
        }

        out += pending.substr(0, open);
        pending.erase(0, open);

        // pending now starts with '['
        const std::string* full_marker = nullptr;
        bool partial = false;
        for (const auto& marker : Tags::all_markers()) {
            if (starts_with_icase(pending, 0, marker)) {
                full_marker = &marker;
                break;
            }
            if (pending.size() < marker.size() && starts_with_icase(marker, 0, pending)) {
                partial = true;
            }
        }

        if (full_marker) {
            size_t close = pending.find(']', full_marker->size());
            if (close == std::string::npos) {
                if (!final) break;

                // never closed: drop the marker only, the text after it is still speech
                spdlog::debug("Unclosed tag {} at end of stream, keeping the text", *full_marker);
                pending.erase(0, full_marker->size());
                continue;
            }
            pending.erase(0, close + 1);
            skip_ws = true;
            continue;
        }

        if (partial) {
            if (final) {
                out += pending;
                pending.clear();
            }
            break;
        }

        // ordinary bracket
        out += '[';
        pending.erase(0, 1);
    }

    visible += out;
    return out;
}

// ==================== PUBLIC API ====================

std::string StreamDecoder::feed(const std::string& chunk) {
    if (finished || chunk.empty()) return "";

    raw += chunk;

    if (!resolved) {
        header_buf += chunk;
        if (!try_resolve_header(false)) {
            return "";
        }
        return drain_body(false);
    }

    pending += chunk;
    return drain_body(false);
}

std::string StreamDecoder::finish() {
    if (finished) return "";
    finished = true;

    if (!resolved) {
        try_resolve_header(true);
    }
    return drain_body(true);
}

DecodedResponse StreamDecoder::result() const {
    DecodedResponse response;
    response.header = decoded_header;
    response.visible_text = visible;
    response.response_text = trim(visible);
    response.raw_text = raw;
    response.media_summary = extract_media_summary(raw);
    response.person_name = extract_person_name(raw);
    response.memories = extract_memory_tags(raw);
    response.zones = extract_zone_learn_tags(raw);
    return response;
}

DecodedResponse decode_complete(const std::string& text, size_t max_header_buffer) {
    StreamDecoder decoder(max_header_buffer);
    decoder.feed(text);
    decoder.finish();
    return decoder.result();
}
