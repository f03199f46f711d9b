// ============= include/tags/stream_decoder.hpp =============
/*
 * Stream Decoder - separa texto visible de etiquetas de control
 * mientras el modelo va entregando fragmentos
 *
 * FASE 1 (cabecera):
 * - Se acumula el prefijo hasta ver un ']' (o MAX_HEADER_BUFFER bytes)
 * - Se intenta emotion → emojis → actions, cada una anclada al inicio
 * - Si queda texto vacío o un '[' sin cerrar, se sigue esperando
 * - Al llegar al límite con una etiqueta sin cerrar, la cabecera
 *   se reenvía como texto literal
 *
 * FASE 2 (cuerpo):
 * - Todo lo anterior a un '[' sale inmediatamente
 * - Un prefijo parcial de marcador (ej. "[mem") se retiene
 * - Un marcador completo se retiene hasta su ']' y se descarta
 *
 * finish(): resuelve lo pendiente. Un marcador sin cerrar se corta
 * hasta el final; un prefijo parcial sale como texto literal.
 *
 * El texto visible y las etiquetas resultantes no dependen de cómo
 * se hayan partido los fragmentos.
 */

#pragma once
#include "tags/tag_parser.hpp"
#include <string>
#include <vector>

struct DecodedHeader {
    std::string emotion = "neutral";
    std::vector<std::string> emojis;     // contextual emojis, may be empty
    std::vector<MotionStep> actions;
};

struct DecodedResponse {
    DecodedHeader header;
    std::string visible_text;            // concatenation of every returned chunk
    std::string response_text;           // visible_text trimmed
    std::string raw_text;                // everything the model produced
    std::string media_summary;
    std::string person_name;
    std::vector<MemoryDirective> memories;
    std::vector<ZoneDirective> zones;
};

class StreamDecoder {
public:
    explicit StreamDecoder(size_t max_header_buffer = 500);

    // Returns text that can be forwarded now (possibly empty)
    std::string feed(const std::string& chunk);

    // Resolves everything still held back; returns the last visible text
    std::string finish();

    bool header_resolved() const { return resolved; }
    const DecodedHeader& header() const { return decoded_header; }

    // Complete only after finish()
    DecodedResponse result() const;

private:
    size_t max_header_buffer;

    bool resolved = false;
    bool finished = false;
    DecodedHeader decoded_header;

    std::string header_buf;
    std::string passthrough;
    std::string pending;
    bool skip_ws = false;

    std::string raw;
    std::string visible;

    bool try_resolve_header(bool force);
    std::string drain_body(bool final);
};

// Decodes a complete response in one go
DecodedResponse decode_complete(const std::string& text, size_t max_header_buffer = 500);
