// ============= test/test_utils.cpp =============
#include "utils.hpp"
#include "protocol/intent.hpp"
#include <gtest/gtest.h>
#include <set>

TEST(Utils, LowercasesSpanishLetters) {
    EXPECT_EQ(to_lower_utf8("CONTRASEÑA"), "contraseña");
    EXPECT_EQ(to_lower_utf8("Él Está AQUÍ"), "él está aquí");
    EXPECT_TRUE(contains_icase("Mi DIRECCIÓN es", "dirección"));
}

TEST(Utils, TrimAndSplit) {
    EXPECT_EQ(trim("  hola \n"), "hola");
    EXPECT_EQ(ltrim("  a "), "a ");
    EXPECT_EQ(rtrim(" a  "), " a");
    EXPECT_EQ(trim("   "), "");

    auto parts = split("wave:1500||nod", '|');
    ASSERT_EQ(parts.size(), 3u);
    EXPECT_EQ(parts[0], "wave:1500");
    EXPECT_EQ(parts[1], "");
    EXPECT_EQ(parts[2], "nod");
}

TEST(Utils, StartsWithIgnoresCase) {
    EXPECT_TRUE(starts_with_icase("x[EMOTION:happy]", 1, "[emotion:"));
    EXPECT_FALSE(starts_with_icase("[emo", 0, "[emotion:"));
    EXPECT_FALSE(starts_with_icase("abc", 5, "a"));
}

TEST(Utils, ConstantTimeEquals) {
    EXPECT_TRUE(constant_time_equals("secret-key", "secret-key"));
    EXPECT_FALSE(constant_time_equals("secret-key", "secret-kez"));
    EXPECT_FALSE(constant_time_equals("secret", "secret-key"));
    EXPECT_FALSE(constant_time_equals("", "x"));
}

TEST(Utils, Base64) {
    EXPECT_EQ(base64_encode("Robi"), "Um9iaQ==");
    EXPECT_EQ(base64_decode("Um9iaQ=="), "Robi");

    std::string binary("\x00\xff\x10\x80", 4);
    EXPECT_EQ(base64_decode(base64_encode(binary)), binary);

    EXPECT_THROW(base64_decode("no*valid"), std::invalid_argument);
}

TEST(Utils, UuidsAreDistinctV4) {
    std::set<std::string> ids;
    for (int i = 0; i < 50; ++i) {
        std::string id = new_uuid();
        ASSERT_EQ(id.size(), 36u);
        EXPECT_EQ(id[14], '4');
        ids.insert(id);
    }
    EXPECT_EQ(ids.size(), 50u);
}

TEST(Utils, FormatTimestamp) {
    EXPECT_EQ(format_timestamp(0), "1970-01-01 00:00:00.000");
    EXPECT_EQ(format_timestamp(1500), "1970-01-01 00:00:01.500");
}

// ==================== CAPTURE INTENT ====================

TEST(CaptureIntent, PhotoKeywords) {
    EXPECT_EQ(classify_intent("Déjame tomar una FOTO"), CaptureIntent::Photo);
    EXPECT_EQ(classify_intent("Let me take a picture"), CaptureIntent::Photo);
    EXPECT_STREQ(capture_type_name(CaptureIntent::Photo), "photo");
}

TEST(CaptureIntent, VideoWinsOverPhoto) {
    EXPECT_EQ(classify_intent("Voy a grabar un vídeo y una foto"), CaptureIntent::Video);
    EXPECT_STREQ(capture_type_name(CaptureIntent::Video), "video");
}

TEST(CaptureIntent, NoneForPlainText) {
    EXPECT_EQ(classify_intent("Hola, ¿cómo estás?"), CaptureIntent::None);
    EXPECT_EQ(classify_intent("Voy a recordar eso"), CaptureIntent::None);
    EXPECT_STREQ(capture_type_name(CaptureIntent::None), "");
}
