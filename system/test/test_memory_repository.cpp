// ============= test/test_memory_repository.cpp =============
#include "database/memory_repository.hpp"
#include "utils.hpp"
#include <gtest/gtest.h>

namespace {
    class MemoryRepositoryTest : public ::testing::Test {
    protected:
        RobotStore store{":memory:"};
        MemoryRepository memories{store};
    };
}

// ==================== PRIVACY ====================

TEST(PrivacyFilter, BilingualCaseInsensitive) {
    EXPECT_TRUE(contains_private_data("Mi CONTRASEÑA es 1234"));
    EXPECT_TRUE(contains_private_data("my Credit Card number"));
    EXPECT_TRUE(contains_private_data("Toma un medicamento cada noche"));
    EXPECT_TRUE(contains_private_data("Su Diagnosis fue ayer"));
    EXPECT_FALSE(contains_private_data("Le gusta el café con leche"));
}

TEST_F(MemoryRepositoryTest, PrivateContentIsNotStored) {
    SaveOutcome outcome = memories.save("persona_ana", MemoryType::PersonFact, "Su password es hunter2", 9);
    EXPECT_FALSE(outcome.stored());
    EXPECT_EQ(outcome.status, SaveStatus::RejectedPrivate);
    EXPECT_EQ(outcome.record.id, -1);
    EXPECT_EQ(memories.count(), 0);
}

TEST_F(MemoryRepositoryTest, SaveClampsImportance) {
    SaveOutcome high = memories.save("", MemoryType::General, "Hoy hubo tormenta", 42);
    ASSERT_TRUE(high.stored());
    EXPECT_GT(high.record.id, 0);
    EXPECT_EQ(high.record.importance, 10);

    SaveOutcome low = memories.save("", MemoryType::General, "Nada especial", -3);
    EXPECT_EQ(low.record.importance, 1);
    EXPECT_EQ(memories.count(), 2);
}

TEST_F(MemoryRepositoryTest, ScopesAreSeparate) {
    memories.save("", MemoryType::General, "El robot vive en Madrid", 5);
    memories.save("persona_ana", MemoryType::PersonFact, "Le gusta el té verde", 7);
    memories.save("persona_luis", MemoryType::PersonFact, "Toca la guitarra", 6);

    auto general = memories.get_for_scope("");
    ASSERT_EQ(general.size(), 1u);
    EXPECT_EQ(general[0].person_id, "");

    auto ana = memories.get_for_scope("persona_ana");
    ASSERT_EQ(ana.size(), 1u);
    EXPECT_EQ(ana[0].content, "Le gusta el té verde");
    EXPECT_EQ(ana[0].type, MemoryType::PersonFact);
}

TEST_F(MemoryRepositoryTest, ScopeOrderedByImportance) {
    memories.save("persona_ana", MemoryType::Experience, "Jugamos al ajedrez", 3);
    memories.save("persona_ana", MemoryType::PersonFact, "Cumple años en mayo", 9);
    memories.save("persona_ana", MemoryType::Experience, "Vimos una película", 6);

    auto all = memories.get_for_scope("persona_ana");
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].importance, 9);
    EXPECT_EQ(all[1].importance, 6);
    EXPECT_EQ(all[2].importance, 3);
}

TEST_F(MemoryRepositoryTest, ExpiredExcludedUnlessRequested) {
    memories.save("persona_ana", MemoryType::Experience, "Viene mañana", 8, -1, now_ms() - 1000);
    memories.save("persona_ana", MemoryType::Experience, "Vuelve el lunes", 8, -1, now_ms() + 3600000);

    EXPECT_EQ(memories.get_for_scope("persona_ana").size(), 1u);
    EXPECT_EQ(memories.get_for_scope("persona_ana", true).size(), 2u);
    EXPECT_EQ(memories.get_recent_important("persona_ana", 5, 10).size(), 1u);
}

TEST_F(MemoryRepositoryTest, RecentImportantRespectsThresholdAndLimit) {
    for (int i = 0; i < 6; ++i) {
        memories.save("", MemoryType::General, "Hecho " + std::to_string(i), 5 + (i % 2));
    }
    memories.save("", MemoryType::General, "Sin importancia", 2);

    auto top = memories.get_recent_important("", 5, 4);
    ASSERT_EQ(top.size(), 4u);
    EXPECT_EQ(top[0].content, "Hecho 5");
    for (const auto& m : top) {
        EXPECT_GE(m.importance, 5);
    }
}

TEST_F(MemoryRepositoryTest, ContextBundleAndFormatting) {
    memories.save("", MemoryType::General, "La casa tiene dos plantas", 6);
    memories.save("persona_ana", MemoryType::PersonFact, "Tiene un gato llamado Michi", 7);
    memories.save("", MemoryType::ZoneInfo, "La ventana da al jardín", 5, 3);
    memories.save("", MemoryType::ZoneInfo, "Otra zona", 5, 4);

    MemoryContextBundle bundle = memories.get_context_bundle("persona_ana", 3, 5, 5);
    EXPECT_EQ(bundle.personal.size(), 1u);
    ASSERT_EQ(bundle.zone.size(), 1u);
    EXPECT_EQ(bundle.zone[0].content, "La ventana da al jardín");

    std::string context = format_memory_context(bundle, "Cocina", "Ana");
    EXPECT_NE(context.find("Estás hablando con Ana."), std::string::npos);
    EXPECT_NE(context.find("Ubicación actual: Cocina."), std::string::npos);
    EXPECT_NE(context.find("- Tiene un gato llamado Michi"), std::string::npos);
    EXPECT_NE(context.find("Datos de esta zona:"), std::string::npos);

    MemoryContextBundle anonymous = memories.get_context_bundle("", -1, 5, 5);
    EXPECT_TRUE(anonymous.personal.empty());
    EXPECT_TRUE(anonymous.zone.empty());
}

TEST(MemoryContext, EmptyWhenNothingKnown) {
    EXPECT_EQ(format_memory_context(MemoryContextBundle{}, "", ""), "");
}
