// ============= test/test_messages.cpp =============
#include "protocol/duplex_channel.hpp"
#include "protocol/messages.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <thread>

TEST(Messages, ParseRejectsNonObjects) {
    EXPECT_NO_THROW(parse_message("{\"type\":\"text\"}"));

    try {
        parse_message("no es json");
        FAIL() << "expected ProtocolError";
    } catch (const ProtocolError& e) {
        EXPECT_EQ(e.code(), ErrorCode::INVALID_MESSAGE);
    }
    EXPECT_THROW(parse_message("[1,2,3]"), ProtocolError);
    EXPECT_THROW(parse_message(""), ProtocolError);
}

TEST(Messages, TypedFieldsFallBackToDefaults) {
    Json::Value msg = parse_message(
        "{\"s\":\"hola\",\"n\":3,\"d\":0.5,\"b\":true,\"emb\":[0.5,1,2],\"bad\":[\"x\"]}");

    EXPECT_EQ(get_string(msg, "s"), "hola");
    EXPECT_EQ(get_string(msg, "n", "def"), "def");
    EXPECT_EQ(get_int(msg, "n"), 3);
    EXPECT_EQ(get_int(msg, "missing", 9), 9);
    EXPECT_DOUBLE_EQ(get_double(msg, "d"), 0.5);
    EXPECT_TRUE(get_bool(msg, "b"));
    EXPECT_FALSE(get_bool(msg, "s"));

    auto emb = get_float_array(msg, "emb");
    ASSERT_EQ(emb.size(), 3u);
    EXPECT_FLOAT_EQ(emb[2], 2.0f);
    EXPECT_TRUE(get_float_array(msg, "bad").empty());
    EXPECT_TRUE(get_float_array(msg, "missing").empty());
}

TEST(Messages, JsonKeepsUtf8) {
    std::string out = make_text_chunk("r1", "¡Hola, señor!");
    EXPECT_NE(out.find("¡Hola, señor!"), std::string::npos);
    EXPECT_EQ(out.find('\n'), std::string::npos);
}

TEST(Messages, EmotionOptionalFields) {
    Json::Value bare = parse_message(make_emotion("r1", "happy"));
    EXPECT_EQ(bare["type"].asString(), "emotion");
    EXPECT_FALSE(bare.isMember("person_identified"));
    EXPECT_FALSE(bare.isMember("confidence"));

    Json::Value full = parse_message(make_emotion("r1", "happy", "persona_ana", 0.92));
    EXPECT_EQ(full["person_identified"].asString(), "persona_ana");
    EXPECT_DOUBLE_EQ(full["confidence"].asDouble(), 0.92);
}

TEST(Messages, ResponseMetaShape) {
    Expression expression = build_expression("happy", {"1F382"});
    MotionStep wave;
    wave.action = "wave";
    MoveSequence seq = build_move_sequence("Saludo", {wave}, "happy");

    Json::Value meta = parse_message(make_response_meta("r1", "Hola", expression, {seq}, "Ana"));
    EXPECT_EQ(meta["type"].asString(), "response_meta");
    EXPECT_EQ(meta["response_text"].asString(), "Hola");
    EXPECT_EQ(meta["expression"]["emojis"][0].asString(), "1F382");
    EXPECT_EQ(meta["expression"]["transition"].asString(), "bounce");
    EXPECT_EQ(meta["person_name"].asString(), "Ana");

    const Json::Value& action = meta["actions"][0];
    EXPECT_EQ(action["type"].asString(), "move_sequence");
    EXPECT_EQ(action["step_count"].asInt(), 3);
    EXPECT_EQ(action["total_duration_ms"].asInt(), 1500);
    EXPECT_EQ(action["steps"][0]["action"].asString(), "turn_right_deg");
    EXPECT_EQ(action["steps"][0]["degrees"].asInt(), 20);
}

TEST(Messages, ErrorMessage) {
    Json::Value err = parse_message(make_error(ErrorCode::EMPTY_AUDIO, "sin audio", true, "r9"));
    EXPECT_EQ(err["type"].asString(), "error");
    EXPECT_EQ(err["error_code"].asString(), "EMPTY_AUDIO");
    EXPECT_TRUE(err["recoverable"].asBool());
    EXPECT_EQ(err["request_id"].asString(), "r9");

    Json::Value no_rid = parse_message(make_error(ErrorCode::INTERNAL_ERROR, "x", false));
    EXPECT_FALSE(no_rid.isMember("request_id"));
}

// ==================== QUEUED CHANNEL ====================

TEST(QueuedChannel, DeliversFramesInOrder) {
    std::vector<std::string> sent;
    QueuedChannel channel([&sent](const std::string& s) { sent.push_back(s); },
                          [](int, const std::string&) {});

    channel.push({Frame::Type::Text, "uno"});
    channel.push({Frame::Type::Binary, "dos"});

    Frame frame;
    ASSERT_TRUE(channel.receive(frame, 0));
    EXPECT_EQ(frame.data, "uno");
    ASSERT_TRUE(channel.receive(frame, 0));
    EXPECT_EQ(frame.type, Frame::Type::Binary);

    EXPECT_FALSE(channel.receive(frame, 10));  // timeout

    channel.send_text("hola");
    EXPECT_EQ(sent.size(), 1u);
}

TEST(QueuedChannel, ReceiveWakesUpOnPush) {
    QueuedChannel channel([](const std::string&) {}, [](int, const std::string&) {});

    std::thread producer([&channel]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
        channel.push({Frame::Type::Text, "tarde"});
    });

    Frame frame;
    EXPECT_TRUE(channel.receive(frame, -1));
    EXPECT_EQ(frame.data, "tarde");
    producer.join();
}

TEST(QueuedChannel, CloseCallsCloserOnceAndDropsSends) {
    int closes = 0;
    int last_code = 0;
    std::vector<std::string> sent;
    QueuedChannel channel([&sent](const std::string& s) { sent.push_back(s); },
                          [&](int code, const std::string&) { closes++; last_code = code; });

    channel.push({Frame::Type::Text, "pendiente"});
    channel.close(1008, "policy");
    channel.close(1000, "again");

    EXPECT_EQ(closes, 1);
    EXPECT_EQ(last_code, 1008);
    EXPECT_FALSE(channel.is_open());
    EXPECT_EQ(channel.queued(), 0u);

    channel.send_text("perdido");
    EXPECT_TRUE(sent.empty());

    Frame frame;
    ASSERT_TRUE(channel.receive(frame, 0));
    EXPECT_EQ(frame.type, Frame::Type::Closed);
}

TEST(QueuedChannel, RemoteCloseEndsChannel) {
    QueuedChannel channel([](const std::string&) {}, [](int, const std::string&) {});
    channel.push_closed();

    Frame frame;
    ASSERT_TRUE(channel.receive(frame, 0));
    EXPECT_EQ(frame.type, Frame::Type::Closed);
    EXPECT_FALSE(channel.is_open());
}
