// ============= src/backend/generative_backend.cpp =============
#include "backend/generative_backend.hpp"

std::string collect_text(GenerativeBackend& backend, const BackendRequest& request) {
    std::unique_ptr<TextStream> stream = backend.stream(request);

    std::string text;
    std::string fragment;
    while (stream->next(fragment)) {
        text += fragment;
    }
    return text;
}
