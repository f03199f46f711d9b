// ============= src/database/history_repository.cpp =============
#include "database/history_repository.hpp"
#include "utils.hpp"
#include <spdlog/spdlog.h>

HistoryRepository::HistoryRepository(RobotStore& store) : store(store) {}

ConversationMessage HistoryRepository::insert_locked(const ConversationMessage& message) {
    ConversationMessage stored = message;
    if (stored.timestamp == 0) {
        stored.timestamp = now_ms();
    }

    Statement stmt(store,
        "INSERT INTO conversation_history "
        "(session_id, role, content, message_index, is_compacted, timestamp, person_id) "
        "VALUES (?, ?, ?, ?, ?, ?, ?)");
    stmt.bind(1, stored.session_id)
        .bind(2, std::string(message_role_name(stored.role)))
        .bind(3, stored.content)
        .bind(4, stored.message_index)
        .bind(5, stored.is_compacted ? 1 : 0)
        .bind(6, stored.timestamp);
    if (stored.person_id.empty()) stmt.bind_null(7); else stmt.bind(7, stored.person_id);
    stmt.step();

    stored.id = sqlite3_last_insert_rowid(store.handle());
    return stored;
}

ConversationMessage HistoryRepository::append(const ConversationMessage& message) {
    std::lock_guard<std::mutex> lock(store.mutex());
    return insert_locked(message);
}

std::pair<ConversationMessage, ConversationMessage>
HistoryRepository::append_pair(const ConversationMessage& first, const ConversationMessage& second) {
    std::lock_guard<std::mutex> lock(store.mutex());
    Transaction tx(store);

    ConversationMessage a = insert_locked(first);
    ConversationMessage b = insert_locked(second);
    tx.commit();
    return {a, b};
}

std::vector<ConversationMessage> HistoryRepository::get_session(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(store.mutex());

    Statement stmt(store,
        "SELECT id, session_id, role, content, message_index, is_compacted, timestamp, person_id "
        "FROM conversation_history WHERE session_id = ? ORDER BY message_index ASC, id ASC");
    stmt.bind(1, session_id);

    std::vector<ConversationMessage> messages;
    while (stmt.step()) {
        ConversationMessage m;
        m.id = stmt.column_int64(0);
        m.session_id = stmt.column_text(1);
        m.role = stmt.column_text(2) == "assistant" ? MessageRole::Assistant : MessageRole::User;
        m.content = stmt.column_text(3);
        m.message_index = stmt.column_int64(4);
        m.is_compacted = stmt.column_int(5) != 0;
        m.timestamp = stmt.column_int64(6);
        m.person_id = stmt.column_is_null(7) ? "" : stmt.column_text(7);
        messages.push_back(m);
    }
    return messages;
}

int HistoryRepository::count(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(store.mutex());

    Statement stmt(store, "SELECT COUNT(*) FROM conversation_history WHERE session_id = ?");
    stmt.bind(1, session_id);
    return stmt.step() ? stmt.column_int(0) : 0;
}

int64_t HistoryRepository::next_index(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(store.mutex());

    Statement stmt(store,
        "SELECT COALESCE(MAX(message_index) + 1, 0) FROM conversation_history WHERE session_id = ?");
    stmt.bind(1, session_id);
    return stmt.step() ? stmt.column_int64(0) : 0;
}

ConversationMessage HistoryRepository::replace_prefix(const std::string& session_id,
                                                      int64_t last_index,
                                                      const ConversationMessage& summary)
{
    std::lock_guard<std::mutex> lock(store.mutex());
    Transaction tx(store);

    Statement del(store,
        "DELETE FROM conversation_history WHERE session_id = ? AND message_index <= ?");
    del.bind(1, session_id).bind(2, last_index);
    del.step();
    int removed = sqlite3_changes(store.handle());

    ConversationMessage stored = insert_locked(summary);
    tx.commit();

    spdlog::debug("✓ History {}: {} rows replaced by summary", session_id, removed);
    return stored;
}
