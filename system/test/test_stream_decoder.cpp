// ============= test/test_stream_decoder.cpp =============
#include "tags/stream_decoder.hpp"
#include <gtest/gtest.h>

namespace {
    const std::string FULL_RESPONSE =
        "[emotion:happy] [emojis:1F44B] [actions:wave] Hola [memory:general:Hoy llovió] amigo. "
        "[person_name:Ana][media_summary: saludo con la mano]";

    struct DecodeRun {
        std::vector<std::string> emitted;
        std::string visible;
        DecodedResponse result;
    };

    DecodeRun run_chunks(const std::vector<std::string>& chunks, size_t cap = 500) {
        DecodeRun run;
        StreamDecoder decoder(cap);
        for (const auto& c : chunks) {
            std::string out = decoder.feed(c);
            if (!out.empty()) run.emitted.push_back(out);
            run.visible += out;
        }
        std::string tail = decoder.finish();
        if (!tail.empty()) run.emitted.push_back(tail);
        run.visible += tail;
        run.result = decoder.result();
        return run;
    }

    bool leaks_marker(const std::string& text) {
        for (const auto& marker : Tags::all_markers()) {
            if (text.find(marker) != std::string::npos) return true;
        }
        return false;
    }
}

TEST(StreamDecoder, SplitEmotionTag) {
    StreamDecoder decoder;

    EXPECT_EQ(decoder.feed("[emot"), "");
    EXPECT_FALSE(decoder.header_resolved());

    EXPECT_EQ(decoder.feed("ion:sad] Lo "), "Lo ");
    EXPECT_TRUE(decoder.header_resolved());
    EXPECT_EQ(decoder.header().emotion, "sad");

    EXPECT_EQ(decoder.feed("siento."), "siento.");
    EXPECT_EQ(decoder.finish(), "");

    DecodedResponse r = decoder.result();
    EXPECT_EQ(r.visible_text, "Lo siento.");
    EXPECT_EQ(r.response_text, "Lo siento.");
}

TEST(StreamDecoder, FullHeaderAndDirectives) {
    DecodedResponse r = decode_complete(FULL_RESPONSE);

    EXPECT_EQ(r.header.emotion, "happy");
    ASSERT_EQ(r.header.emojis.size(), 1u);
    EXPECT_EQ(r.header.emojis[0], "1F44B");
    ASSERT_EQ(r.header.actions.size(), 1u);
    EXPECT_EQ(r.header.actions[0].action, "wave");

    EXPECT_EQ(r.response_text, "Hola amigo.");
    EXPECT_EQ(r.media_summary, "saludo con la mano");
    EXPECT_EQ(r.person_name, "Ana");
    ASSERT_EQ(r.memories.size(), 1u);
    EXPECT_EQ(r.memories[0].content, "Hoy llovió");
    EXPECT_EQ(r.raw_text, FULL_RESPONSE);
}

TEST(StreamDecoder, ChunkBoundariesDoNotChangeOutput) {
    DecodeRun whole = run_chunks({FULL_RESPONSE});

    for (size_t cut = 1; cut < FULL_RESPONSE.size(); ++cut) {
        DecodeRun split = run_chunks({FULL_RESPONSE.substr(0, cut), FULL_RESPONSE.substr(cut)});
        ASSERT_EQ(split.visible, whole.visible) << "cut at " << cut;
        ASSERT_EQ(split.result.header.emotion, "happy") << "cut at " << cut;
        ASSERT_EQ(split.result.header.actions.size(), 1u) << "cut at " << cut;
        ASSERT_EQ(split.result.person_name, "Ana");
    }

    std::vector<std::string> bytes;
    for (char c : FULL_RESPONSE) bytes.push_back(std::string(1, c));
    DecodeRun byte_by_byte = run_chunks(bytes);
    EXPECT_EQ(byte_by_byte.visible, whole.visible);
    EXPECT_EQ(byte_by_byte.result.media_summary, "saludo con la mano");
}

TEST(StreamDecoder, NoPartialTagEverEmitted) {
    for (size_t cut = 1; cut < FULL_RESPONSE.size(); ++cut) {
        DecodeRun split = run_chunks({FULL_RESPONSE.substr(0, cut), FULL_RESPONSE.substr(cut)});
        for (const auto& chunk : split.emitted) {
            ASSERT_EQ(chunk.find('['), std::string::npos) << "cut at " << cut << ": " << chunk;
        }
    }
}

TEST(StreamDecoder, NoHeaderMeansNeutral) {
    DecodeRun run = run_chunks({"Hola ", "mundo"});
    EXPECT_EQ(run.visible, "Hola mundo");
    EXPECT_EQ(run.result.header.emotion, "neutral");
    EXPECT_TRUE(run.result.header.emojis.empty());
}

TEST(StreamDecoder, OrdinaryBracketsPassThrough) {
    DecodeRun run = run_chunks({"[emotion:cool] Cuesta [aprox", "] diez euros"});
    EXPECT_EQ(run.visible, "Cuesta [aprox] diez euros");
}

TEST(StreamDecoder, PartialMarkerAtEndIsLiteral) {
    DecodeRun run = run_chunks({"[emotion:neutral] Mira [me"});
    EXPECT_EQ(run.visible, "Mira [me");
}

TEST(StreamDecoder, UnclosedDirectiveDropsOnlyItsMarker) {
    DecodeRun run = run_chunks({"[emotion:sad] Adiós [memory:general:sin cierre"});
    EXPECT_EQ(run.visible, "Adiós general:sin cierre");
    EXPECT_FALSE(leaks_marker(run.visible));
    EXPECT_TRUE(run.result.memories.empty());
}

TEST(StreamDecoder, UnclosedDirectiveKeepsRestOfReply) {
    DecodedResponse response = decode_complete(
        "[emotion:happy] Hola [memory:general:te gusta el te. Quieres algo mas? "
        "Te cuento una historia larga");
    EXPECT_NE(response.visible_text.find("Quieres algo mas? Te cuento una historia larga"),
              std::string::npos);
    EXPECT_EQ(response.visible_text.find("[memory:"), std::string::npos);
    EXPECT_TRUE(response.memories.empty());
}

TEST(StreamDecoder, UnclosedDirectiveSplitAcrossChunks) {
    DecodeRun run = run_chunks({"[emotion:happy] Hola [mem", "ory:general:sin cierre. Adiós"});
    EXPECT_EQ(run.visible, "Hola general:sin cierre. Adiós");
    EXPECT_FALSE(leaks_marker(run.visible));
}

TEST(StreamDecoder, HeaderCapForwardsUnclosedTagAsText) {
    std::string never_closed = "[emotion:happy y el modelo sigue hablando sin cerrar";
    StreamDecoder decoder(20);

    std::string out = decoder.feed(never_closed);
    EXPECT_TRUE(decoder.header_resolved());
    EXPECT_EQ(out, never_closed);
    EXPECT_EQ(decoder.header().emotion, "neutral");
}

TEST(StreamDecoder, HeaderWaitsForMoreTagsBeforeResolving) {
    StreamDecoder decoder;
    EXPECT_EQ(decoder.feed("[emotion:love] "), "");
    EXPECT_FALSE(decoder.header_resolved());
    EXPECT_EQ(decoder.feed("[emojis:2764] "), "");
    EXPECT_FALSE(decoder.header_resolved());
    EXPECT_EQ(decoder.feed("Te quiero"), "Te quiero");
    EXPECT_TRUE(decoder.header_resolved());
    ASSERT_EQ(decoder.header().emojis.size(), 1u);
}

TEST(StreamDecoder, StrayHeaderTagInBodyIsRemoved) {
    DecodeRun run = run_chunks({"[emotion:happy] Uno [emotion:sad] dos"});
    EXPECT_EQ(run.visible, "Uno dos");
    EXPECT_EQ(run.result.header.emotion, "happy");
}
