// ============= include/database/history_repository.hpp =============
#pragma once
#include "database/entities.hpp"
#include "database/robot_store.hpp"
#include <string>
#include <utility>
#include <vector>

class HistoryRepository {
public:
    explicit HistoryRepository(RobotStore& store);

    // Fills id and timestamp (when 0) on the stored copy
    ConversationMessage append(const ConversationMessage& message);

    // Both rows or none
    std::pair<ConversationMessage, ConversationMessage> append_pair(const ConversationMessage& first,
                                                                    const ConversationMessage& second);

    // Ordered by message_index
    std::vector<ConversationMessage> get_session(const std::string& session_id);

    int count(const std::string& session_id);

    // Next free index (0 for an empty session)
    int64_t next_index(const std::string& session_id);

    // Atomically deletes every row with message_index <= last_index and inserts
    // the summary. Nothing changes if any statement fails.
    ConversationMessage replace_prefix(const std::string& session_id,
                                       int64_t last_index,
                                       const ConversationMessage& summary);

private:
    RobotStore& store;

    ConversationMessage insert_locked(const ConversationMessage& message);
};
