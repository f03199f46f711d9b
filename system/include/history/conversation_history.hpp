// ============= include/history/conversation_history.hpp =============
/*
 * Conversation History - log ordenado por sesión + compactación
 *
 * - Cache en memoria por sesión, respaldada por conversation_history
 * - add_message() asigna el siguiente message_index
 * - add_turn() guarda usuario + asistente con índices consecutivos
 * - schedule_turn() fija el orden del turno al llamarlo y lo persiste
 *   en el pool; los turnos de una sesión se escriben en ese orden
 * - compact_if_needed(): si hay >= threshold mensajes, programa en el
 *   pool (prioridad baja) un resumen de todo menos los últimos K
 * - compact(): pide el resumen al backend y reemplaza el prefijo por
 *   un único mensaje "[RESUMEN] ..." dentro de una transacción
 * - Un fallo deja el historial intacto (solo se registra en el log)
 * - Como mucho una compactación en curso por sesión
 * - forget() libera la cache; si aún hay turnos o una compactación
 *   pendientes, se libera cuando terminan
 */

#pragma once
#include "backend/generative_backend.hpp"
#include "database/history_repository.hpp"
#include "database/thread_pool.hpp"
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

class ConversationHistory {
public:
    ConversationHistory(HistoryRepository& repository,
                        GenerativeBackend& backend,
                        ThreadPool& pool,
                        int compaction_threshold = 20,
                        int keep_recent = 5);

    ConversationMessage add_message(const std::string& session_id,
                                    MessageRole role,
                                    const std::string& content,
                                    const std::string& person_id = "");

    std::pair<ConversationMessage, ConversationMessage> add_turn(const std::string& session_id,
                                                                 const std::string& user_message,
                                                                 const std::string& assistant_message,
                                                                 const std::string& person_id = "");

    // Non-blocking. Turns of one session are stored in call order.
    void schedule_turn(const std::string& session_id,
                       const std::string& user_message,
                       const std::string& assistant_message,
                       const std::string& person_id = "");

    // Role/content pairs in index order, ready for the backend
    std::vector<ChatTurn> get_history(const std::string& session_id);

    std::vector<ConversationMessage> get_messages(const std::string& session_id);

    // Rebuilds the cache from the store; returns the number of messages
    size_t load_from_db(const std::string& session_id);

    int message_count(const std::string& session_id);

    // true when a compaction was scheduled by this call
    bool compact_if_needed(const std::string& session_id);

    // Synchronous; true when the prefix was replaced
    bool compact(const std::string& session_id);

    bool compaction_in_flight(const std::string& session_id);

    // Frees the cache of a closed session (rows stay in the store)
    void forget(const std::string& session_id);

    bool is_cached(const std::string& session_id);

    int threshold() const { return compaction_threshold; }
    int recent_to_keep() const { return keep_recent; }

private:
    struct PendingTurn {
        std::string user_message;
        std::string assistant_message;
        std::string person_id;
    };

    struct SessionLog {
        std::vector<ConversationMessage> messages;
        std::deque<PendingTurn> pending;
        bool compacting = false;
        bool forgotten = false;
    };

    HistoryRepository& repository;
    GenerativeBackend& backend;
    ThreadPool& pool;
    int compaction_threshold;
    int keep_recent;

    std::mutex history_mutex;
    std::map<std::string, SessionLog> sessions;

    // history_mutex must be held
    SessionLog& session_locked(const std::string& session_id);
    ConversationMessage append_locked(SessionLog& log, const std::string& session_id,
                                      MessageRole role, const std::string& content,
                                      const std::string& person_id);
    std::pair<ConversationMessage, ConversationMessage> add_turn_locked(SessionLog& log,
                                                                        const std::string& session_id,
                                                                        const PendingTurn& turn);
    void release_if_forgotten_locked(const std::string& session_id);

    void flush_turns(const std::string& session_id);
    bool post_compaction(const std::string& session_id);
    void finish_compaction(const std::string& session_id);
};

// Prompt asking the backend to summarize the given messages
BackendRequest make_summary_request(const std::vector<ConversationMessage>& messages);
