// ============= test/test_people_repository.cpp =============
#include "database/people_repository.hpp"
#include <gtest/gtest.h>
#include <chrono>
#include <thread>

namespace {
    class PeopleRepositoryTest : public ::testing::Test {
    protected:
        RobotStore store{":memory:"};
        PeopleRepository people{store, 4};
    };
}

TEST_F(PeopleRepositoryTest, GetOrCreateTouchesExisting) {
    GetOrCreateResult first = people.get_or_create("persona_ana", "Ana");
    EXPECT_TRUE(first.created);
    EXPECT_EQ(first.person.name, "Ana");
    EXPECT_EQ(first.person.interaction_count, 0);

    GetOrCreateResult second = people.get_or_create("persona_ana", "Otro nombre");
    EXPECT_FALSE(second.created);
    EXPECT_EQ(second.person.id, first.person.id);
    EXPECT_EQ(second.person.name, "Ana");
    EXPECT_EQ(second.person.interaction_count, 1);
    EXPECT_GE(second.person.last_seen, first.person.last_seen);

    EXPECT_EQ(people.count_persons(), 1);
}

TEST_F(PeopleRepositoryTest, LookupAndUpdates) {
    EXPECT_FALSE(people.get_by_person_id("persona_nadie").found);
    EXPECT_FALSE(people.update_name("persona_nadie", "X"));

    people.get_or_create("persona_luis", "Luis");
    EXPECT_TRUE(people.update_name("persona_luis", "Luis Miguel"));
    EXPECT_TRUE(people.update_notes("persona_luis", "Prefiere hablar en inglés"));

    PersonLookup lookup = people.get_by_person_id("persona_luis");
    ASSERT_TRUE(lookup.found);
    EXPECT_EQ(lookup.person.name, "Luis Miguel");
    EXPECT_EQ(lookup.person.notes, "Prefiere hablar en inglés");
}

TEST_F(PeopleRepositoryTest, ListAllMostRecentFirst) {
    people.get_or_create("persona_a", "A");
    people.get_or_create("persona_b", "B");
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    people.get_or_create("persona_a", "A");

    auto all = people.list_all();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[0].person_id, "persona_a");
}

TEST_F(PeopleRepositoryTest, Embeddings) {
    people.get_or_create("persona_ana", "Ana");

    FaceEmbedding stored = people.add_embedding("persona_ana", {0.1f, 0.2f, 0.3f, 0.4f}, "day");
    EXPECT_GT(stored.id, 0);
    people.add_embedding("persona_ana", {1.0f, 0.0f, 0.0f, 0.0f});

    auto embeddings = people.get_embeddings("persona_ana");
    ASSERT_EQ(embeddings.size(), 2u);
    ASSERT_EQ(embeddings[0].embedding.size(), 4u);
    EXPECT_FLOAT_EQ(embeddings[0].embedding[2], 0.3f);
    EXPECT_EQ(embeddings[0].source_lighting, "day");
    EXPECT_EQ(embeddings[1].source_lighting, "");
}

TEST_F(PeopleRepositoryTest, EmbeddingErrors) {
    EXPECT_THROW(people.add_embedding("persona_nadie", {0.f, 0.f, 0.f, 0.f}), StoreError);

    people.get_or_create("persona_ana", "Ana");
    EXPECT_THROW(people.add_embedding("persona_ana", {0.f, 0.f}), std::invalid_argument);
    EXPECT_TRUE(people.get_embeddings("persona_ana").empty());
}

TEST(PersonSlug, FoldsAccentsAndCollapsesSeparators) {
    EXPECT_EQ(make_person_slug("Ana María"), "persona_ana_maria");
    EXPECT_EQ(make_person_slug("  José  Núñez!! "), "persona_jose_nunez");
    EXPECT_EQ(make_person_slug("O'Brien"), "persona_o_brien");
    EXPECT_EQ(make_person_slug("!!!"), "persona_desconocido");
}
