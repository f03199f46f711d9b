// ============= test/test_conversation_history.cpp =============
#include "history/conversation_history.hpp"
#include "test_support.hpp"
#include <gtest/gtest.h>
#include <future>
#include <thread>
#include <vector>

namespace {
    class ConversationHistoryTest : public ::testing::Test {
    protected:
        RobotStore store{":memory:"};
        HistoryRepository repository{store};
        ScriptedBackend backend;
        ThreadPool pool{1};
        ConversationHistory history{repository, backend, pool, 20, 5};

        // Occupies the only worker until the returned promise is set
        std::promise<void> block_pool() {
            std::promise<void> gate;
            std::shared_future<void> opened = gate.get_future().share();
            pool.post("gate", [opened]() { opened.wait(); }, ThreadPool::Priority::High);
            return gate;
        }

        void fill(const std::string& session, int n) {
            for (int i = 0; i < n; ++i) {
                history.add_message(session,
                                    i % 2 == 0 ? MessageRole::User : MessageRole::Assistant,
                                    "mensaje " + std::to_string(i));
            }
        }
    };
}

TEST_F(ConversationHistoryTest, IndicesAreSequential) {
    fill("s1", 3);
    auto messages = history.get_messages("s1");
    ASSERT_EQ(messages.size(), 3u);
    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(messages[i].message_index, i);
        EXPECT_GT(messages[i].id, 0);
    }

    auto turns = history.get_history("s1");
    ASSERT_EQ(turns.size(), 3u);
    EXPECT_EQ(turns[0].role, "user");
    EXPECT_EQ(turns[1].role, "assistant");
    EXPECT_EQ(turns[2].content, "mensaje 2");
}

TEST_F(ConversationHistoryTest, SessionsAreIndependent) {
    fill("s1", 4);
    fill("s2", 1);
    EXPECT_EQ(history.message_count("s1"), 4);
    EXPECT_EQ(history.message_count("s2"), 1);
}

TEST_F(ConversationHistoryTest, BelowThresholdNoCompaction) {
    fill("s1", 19);
    EXPECT_FALSE(history.compact_if_needed("s1"));
    pool.wait_all();
    EXPECT_EQ(history.message_count("s1"), 19);
    EXPECT_TRUE(backend.seen().empty());
}

TEST_F(ConversationHistoryTest, CompactionKeepsSummaryPlusRecent) {
    backend.add({"Hablaron ", "del clima y de la cena."});
    fill("s1", 20);

    EXPECT_TRUE(history.compact_if_needed("s1"));
    pool.wait_all();

    auto messages = history.get_messages("s1");
    ASSERT_EQ(messages.size(), 6u);
    EXPECT_EQ(messages[0].content, "[RESUMEN] Hablaron del clima y de la cena.");
    EXPECT_TRUE(messages[0].is_compacted);
    EXPECT_EQ(messages[0].role, MessageRole::User);
    EXPECT_EQ(messages[1].content, "mensaje 15");
    EXPECT_EQ(messages[5].content, "mensaje 19");
    EXPECT_FALSE(history.compaction_in_flight("s1"));

    // the store matches the cache
    EXPECT_EQ(repository.count("s1"), 6);
    EXPECT_EQ(repository.get_session("s1")[0].content, messages[0].content);

    // the summary request carried the compacted prefix
    auto requests = backend.seen();
    ASSERT_EQ(requests.size(), 1u);
    std::string prompt = requests[0].text + requests[0].context;
    EXPECT_NE(prompt.find("mensaje 0"), std::string::npos);
    EXPECT_NE(prompt.find("mensaje 14"), std::string::npos);
    EXPECT_EQ(prompt.find("mensaje 15"), std::string::npos);
}

TEST_F(ConversationHistoryTest, NewMessagesAfterCompactionContinueIndices) {
    backend.add({"resumen"});
    fill("s1", 20);
    history.compact_if_needed("s1");
    pool.wait_all();

    ConversationMessage next = history.add_message("s1", MessageRole::User, "otra");
    EXPECT_EQ(next.message_index, 20);
    EXPECT_EQ(history.message_count("s1"), 7);
}

TEST_F(ConversationHistoryTest, FailedCompactionLeavesHistoryUnchanged) {
    backend.fail_next();
    fill("s1", 20);

    EXPECT_TRUE(history.compact_if_needed("s1"));
    pool.wait_all();

    EXPECT_EQ(history.message_count("s1"), 20);
    EXPECT_EQ(repository.count("s1"), 20);
    EXPECT_FALSE(history.compaction_in_flight("s1"));
    EXPECT_EQ(pool.failed_tasks(), 0u);
}

TEST_F(ConversationHistoryTest, EmptySummaryCountsAsFailure) {
    backend.add({"   "});
    fill("s1", 20);
    EXPECT_FALSE(history.compact("s1"));
    EXPECT_EQ(history.message_count("s1"), 20);
}

TEST_F(ConversationHistoryTest, LoadFromDbRebuildsCache) {
    fill("s1", 3);

    ConversationHistory fresh(repository, backend, pool, 20, 5);
    EXPECT_EQ(fresh.load_from_db("s1"), 3u);
    EXPECT_EQ(fresh.get_messages("s1")[2].content, "mensaje 2");
}

TEST_F(ConversationHistoryTest, ForgetDropsOnlyTheCache) {
    fill("s1", 2);
    history.forget("s1");
    EXPECT_EQ(repository.count("s1"), 2);
    EXPECT_EQ(history.message_count("s1"), 2);  // reloaded lazily
}

// ==================== TURNS ====================

TEST_F(ConversationHistoryTest, AddTurnPairsStayAdjacentUnderConcurrency) {
    std::vector<std::thread> writers;
    for (int t = 0; t < 4; ++t) {
        writers.emplace_back([this, t]() {
            for (int i = 0; i < 25; ++i) {
                std::string tag = std::to_string(t) + "-" + std::to_string(i);
                history.add_turn("s1", "u" + tag, "a" + tag);
            }
        });
    }
    for (auto& w : writers) w.join();

    auto messages = repository.get_session("s1");
    ASSERT_EQ(messages.size(), 200u);
    for (size_t k = 0; k < messages.size(); k += 2) {
        EXPECT_EQ(messages[k].message_index, static_cast<int64_t>(k));
        EXPECT_EQ(messages[k].role, MessageRole::User);
        EXPECT_EQ(messages[k + 1].role, MessageRole::Assistant);
        EXPECT_EQ("a" + messages[k].content.substr(1), messages[k + 1].content);
    }
}

TEST_F(ConversationHistoryTest, ScheduledTurnsKeepCallOrderOnManyWorkers) {
    ThreadPool workers(4);
    ConversationHistory shared(repository, backend, workers, 1000, 5);

    for (int i = 0; i < 50; ++i) {
        shared.schedule_turn("s1", "u" + std::to_string(i), "a" + std::to_string(i), "persona_ana");
    }
    workers.wait_all();
    workers.stop();

    auto messages = repository.get_session("s1");
    ASSERT_EQ(messages.size(), 100u);
    for (int i = 0; i < 50; ++i) {
        EXPECT_EQ(messages[2 * i].content, "u" + std::to_string(i));
        EXPECT_EQ(messages[2 * i + 1].content, "a" + std::to_string(i));
        EXPECT_EQ(messages[2 * i + 1].message_index, 2 * i + 1);
    }
    EXPECT_EQ(messages[0].person_id, "persona_ana");
}

TEST_F(ConversationHistoryTest, ScheduledTurnTriggersCompaction) {
    backend.add({"resumen"});
    fill("s1", 18);

    history.schedule_turn("s1", "pregunta", "respuesta");
    pool.wait_all();

    auto messages = history.get_messages("s1");
    ASSERT_EQ(messages.size(), 6u);
    EXPECT_EQ(messages[0].content, "[RESUMEN] resumen");
    EXPECT_EQ(messages[5].content, "respuesta");
}

TEST_F(ConversationHistoryTest, ForgetWhileCompactingReleasesCacheAfterwards) {
    backend.add({"resumen"});
    fill("s1", 20);

    std::promise<void> gate = block_pool();
    ASSERT_TRUE(history.compact_if_needed("s1"));

    history.forget("s1");
    EXPECT_TRUE(history.is_cached("s1"));
    EXPECT_TRUE(history.compaction_in_flight("s1"));

    gate.set_value();
    pool.wait_all();

    EXPECT_FALSE(history.is_cached("s1"));
    EXPECT_EQ(repository.count("s1"), 6);
}

TEST_F(ConversationHistoryTest, ForgetWithPendingTurnsStoresThemThenReleases) {
    fill("s1", 2);

    std::promise<void> gate = block_pool();
    history.schedule_turn("s1", "hola", "¡hola!");
    history.forget("s1");
    EXPECT_TRUE(history.is_cached("s1"));

    gate.set_value();
    pool.wait_all();

    EXPECT_FALSE(history.is_cached("s1"));
    auto stored = repository.get_session("s1");
    ASSERT_EQ(stored.size(), 4u);
    EXPECT_EQ(stored[3].content, "¡hola!");
}

TEST_F(ConversationHistoryTest, ForgetIdleSessionReleasesAtOnce) {
    fill("s1", 2);
    history.forget("s1");
    EXPECT_FALSE(history.is_cached("s1"));
}

TEST(SummaryRequest, TranscriptUsesSpeakerNames) {
    ConversationMessage user;
    user.role = MessageRole::User;
    user.content = "¿Qué hora es?";
    ConversationMessage robot;
    robot.role = MessageRole::Assistant;
    robot.content = "Son las tres.";

    BackendRequest request = make_summary_request({user, robot});
    std::string prompt = request.text + request.context;
    EXPECT_NE(prompt.find("Usuario: ¿Qué hora es?"), std::string::npos);
    EXPECT_NE(prompt.find("Robi: Son las tres."), std::string::npos);
    EXPECT_TRUE(request.history.empty());
}
