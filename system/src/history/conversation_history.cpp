// ============= src/history/conversation_history.cpp =============
#include "history/conversation_history.hpp"
#include "utils.hpp"
#include <spdlog/spdlog.h>
#include <sstream>

namespace {
    const char* SUMMARY_PREFIX = "[RESUMEN] ";
}

ConversationHistory::ConversationHistory(HistoryRepository& repository,
                                         GenerativeBackend& backend,
                                         ThreadPool& pool,
                                         int compaction_threshold,
                                         int keep_recent)
    : repository(repository), backend(backend), pool(pool),
      compaction_threshold(compaction_threshold), keep_recent(keep_recent) {}

ConversationHistory::SessionLog& ConversationHistory::session_locked(const std::string& session_id) {
    auto it = sessions.find(session_id);
    if (it != sessions.end()) {
        return it->second;
    }

    SessionLog& log = sessions[session_id];
    log.messages = repository.get_session(session_id);
    return log;
}

ConversationMessage ConversationHistory::append_locked(SessionLog& log,
                                                      const std::string& session_id,
                                                      MessageRole role,
                                                      const std::string& content,
                                                      const std::string& person_id)
{
    ConversationMessage message;
    message.session_id = session_id;
    message.role = role;
    message.content = content;
    message.person_id = person_id;
    message.message_index = log.messages.empty() ? 0 : log.messages.back().message_index + 1;

    ConversationMessage stored = repository.append(message);
    log.messages.push_back(stored);
    return stored;
}

ConversationMessage ConversationHistory::add_message(const std::string& session_id,
                                                     MessageRole role,
                                                     const std::string& content,
                                                     const std::string& person_id)
{
    std::lock_guard<std::mutex> lock(history_mutex);
    return append_locked(session_locked(session_id), session_id, role, content, person_id);
}

// ==================== TURNS ====================

std::pair<ConversationMessage, ConversationMessage>
ConversationHistory::add_turn_locked(SessionLog& log, const std::string& session_id, const PendingTurn& turn) {
    ConversationMessage user;
    user.session_id = session_id;
    user.role = MessageRole::User;
    user.content = turn.user_message;
    user.person_id = turn.person_id;
    user.message_index = log.messages.empty() ? 0 : log.messages.back().message_index + 1;

    ConversationMessage assistant = user;
    assistant.role = MessageRole::Assistant;
    assistant.content = turn.assistant_message;
    assistant.message_index = user.message_index + 1;

    auto stored = repository.append_pair(user, assistant);
    log.messages.push_back(stored.first);
    log.messages.push_back(stored.second);
    return stored;
}

std::pair<ConversationMessage, ConversationMessage>
ConversationHistory::add_turn(const std::string& session_id,
                              const std::string& user_message,
                              const std::string& assistant_message,
                              const std::string& person_id)
{
    std::lock_guard<std::mutex> lock(history_mutex);
    return add_turn_locked(session_locked(session_id), session_id,
                           {user_message, assistant_message, person_id});
}

void ConversationHistory::schedule_turn(const std::string& session_id,
                                        const std::string& user_message,
                                        const std::string& assistant_message,
                                        const std::string& person_id)
{
    {
        std::lock_guard<std::mutex> lock(history_mutex);
        session_locked(session_id).pending.push_back({user_message, assistant_message, person_id});
    }

    bool posted = pool.post("history:" + session_id, [this, session_id]() {
        flush_turns(session_id);
    });

    if (!posted) {
        std::lock_guard<std::mutex> lock(history_mutex);
        auto it = sessions.find(session_id);
        if (it != sessions.end()) {
            spdlog::warn("History {}: {} turns not stored", session_id, it->second.pending.size());
            it->second.pending.clear();
        }
        release_if_forgotten_locked(session_id);
    }
}

// Whichever task runs first writes every queued turn, in order
void ConversationHistory::flush_turns(const std::string& session_id) {
    bool start_compaction = false;
    {
        std::lock_guard<std::mutex> lock(history_mutex);
        auto it = sessions.find(session_id);
        if (it == sessions.end()) return;
        SessionLog& log = it->second;

        while (!log.pending.empty()) {
            PendingTurn turn = std::move(log.pending.front());
            log.pending.pop_front();
            try {
                add_turn_locked(log, session_id, turn);
            } catch (const StoreError& e) {
                spdlog::error("History {}: turn lost: {}", session_id, e.what());
            }
        }

        if (static_cast<int>(log.messages.size()) >= compaction_threshold && !log.compacting) {
            log.compacting = true;
            start_compaction = true;
        } else {
            release_if_forgotten_locked(session_id);
        }
    }

    if (start_compaction) {
        post_compaction(session_id);
    }
}

std::vector<ChatTurn> ConversationHistory::get_history(const std::string& session_id) {
    std::vector<ChatTurn> turns;
    for (const auto& m : get_messages(session_id)) {
        turns.push_back({message_role_name(m.role), m.content});
    }
    return turns;
}

std::vector<ConversationMessage> ConversationHistory::get_messages(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(history_mutex);
    return session_locked(session_id).messages;
}

size_t ConversationHistory::load_from_db(const std::string& session_id) {
    std::vector<ConversationMessage> messages = repository.get_session(session_id);

    std::lock_guard<std::mutex> lock(history_mutex);
    SessionLog& log = sessions[session_id];
    log.messages = std::move(messages);

    spdlog::debug("History {}: {} messages loaded", session_id, log.messages.size());
    return log.messages.size();
}

int ConversationHistory::message_count(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(history_mutex);
    return static_cast<int>(session_locked(session_id).messages.size());
}

bool ConversationHistory::compaction_in_flight(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(history_mutex);
    auto it = sessions.find(session_id);
    return it != sessions.end() && it->second.compacting;
}

void ConversationHistory::forget(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(history_mutex);
    auto it = sessions.find(session_id);
    if (it == sessions.end()) return;

    it->second.forgotten = true;
    release_if_forgotten_locked(session_id);
}

bool ConversationHistory::is_cached(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(history_mutex);
    return sessions.count(session_id) > 0;
}

void ConversationHistory::release_if_forgotten_locked(const std::string& session_id) {
    auto it = sessions.find(session_id);
    if (it == sessions.end()) return;

    const SessionLog& log = it->second;
    if (log.forgotten && !log.compacting && log.pending.empty()) {
        sessions.erase(it);
    }
}

// ==================== COMPACTION ====================

bool ConversationHistory::compact_if_needed(const std::string& session_id) {
    {
        std::lock_guard<std::mutex> lock(history_mutex);
        SessionLog& log = session_locked(session_id);

        if (static_cast<int>(log.messages.size()) < compaction_threshold || log.compacting) {
            return false;
        }
        log.compacting = true;
    }
    return post_compaction(session_id);
}

bool ConversationHistory::post_compaction(const std::string& session_id) {
    bool posted = pool.post("compact:" + session_id, [this, session_id]() {
        compact(session_id);
        finish_compaction(session_id);
    }, ThreadPool::Priority::Low);

    if (!posted) {
        finish_compaction(session_id);
    }
    return posted;
}

void ConversationHistory::finish_compaction(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(history_mutex);
    auto it = sessions.find(session_id);
    if (it != sessions.end()) {
        it->second.compacting = false;
    }
    release_if_forgotten_locked(session_id);
}

bool ConversationHistory::compact(const std::string& session_id) {
    std::vector<ConversationMessage> prefix;
    {
        std::lock_guard<std::mutex> lock(history_mutex);
        const auto& messages = session_locked(session_id).messages;

        if (static_cast<int>(messages.size()) <= keep_recent) {
            return false;
        }
        prefix.assign(messages.begin(), messages.end() - keep_recent);
    }

    spdlog::info("🗜  Compacting session {}: {} messages → 1 summary", session_id, prefix.size());

    try {
        std::string summary_text = trim(collect_text(backend, make_summary_request(prefix)));
        if (summary_text.empty()) {
            throw BackendError("empty summary");
        }

        ConversationMessage summary;
        summary.session_id = session_id;
        summary.role = MessageRole::User;
        summary.content = SUMMARY_PREFIX + summary_text;
        summary.message_index = prefix.front().message_index;
        summary.is_compacted = true;

        int64_t last_index = prefix.back().message_index;
        ConversationMessage stored = repository.replace_prefix(session_id, last_index, summary);

        std::lock_guard<std::mutex> lock(history_mutex);
        auto& messages = session_locked(session_id).messages;

        std::vector<ConversationMessage> rebuilt{stored};
        for (const auto& m : messages) {
            if (m.message_index > last_index) {
                rebuilt.push_back(m);
            }
        }
        messages = std::move(rebuilt);

    } catch (const std::exception& e) {
        spdlog::warn("Compaction failed for {}: {} (history unchanged)", session_id, e.what());
        return false;
    }

    spdlog::info("✓ Session {} compacted", session_id);
    return true;
}

BackendRequest make_summary_request(const std::vector<ConversationMessage>& messages) {
    std::ostringstream transcript;
    for (const auto& m : messages) {
        transcript << (m.role == MessageRole::Assistant ? "Robi" : "Usuario")
                   << ": " << m.content << "\n";
    }

    BackendRequest request;
    request.text =
        "Resume la siguiente conversación en un párrafo breve en español. "
        "Conserva nombres, preferencias y hechos importantes. "
        "No uses etiquetas entre corchetes.\n\n" + transcript.str();
    return request;
}
