// ============= test/test_zone_repository.cpp =============
#include "database/zone_repository.hpp"
#include <gtest/gtest.h>

namespace {
    class ZoneRepositoryTest : public ::testing::Test {
    protected:
        RobotStore store{":memory:"};
        ZoneRepository zones{store};

        int64_t id_of(const std::string& name) {
            return zones.get_or_create(name).zone.id;
        }

        int current_count() {
            int n = 0;
            for (const auto& z : zones.list_all()) {
                if (z.is_current) n++;
            }
            return n;
        }
    };
}

TEST_F(ZoneRepositoryTest, GetOrCreateIsIdempotent) {
    ZoneGetOrCreateResult first = zones.get_or_create("Cocina", ZoneCategory::Kitchen, "Huele a pan");
    EXPECT_TRUE(first.created);
    EXPECT_EQ(first.zone.category, ZoneCategory::Kitchen);

    ZoneGetOrCreateResult again = zones.get_or_create("Cocina", ZoneCategory::Bedroom, "otra cosa");
    EXPECT_FALSE(again.created);
    EXPECT_EQ(again.zone.id, first.zone.id);
    EXPECT_EQ(again.zone.category, ZoneCategory::Kitchen);
    EXPECT_EQ(again.zone.description, "Huele a pan");

    EXPECT_EQ(zones.list_all().size(), 1u);
}

TEST_F(ZoneRepositoryTest, LookupsAndUpdates) {
    EXPECT_FALSE(zones.get_by_name("Garaje").found);
    EXPECT_FALSE(zones.get_by_id(999).found);
    EXPECT_FALSE(zones.update_description("Garaje", "x"));

    int64_t salon = id_of("Salón");
    EXPECT_TRUE(zones.update_description("Salón", "Sofá gris"));
    EXPECT_TRUE(zones.set_accessible("Salón", false));

    ZoneLookup lookup = zones.get_by_id(salon);
    ASSERT_TRUE(lookup.found);
    EXPECT_EQ(lookup.zone.description, "Sofá gris");
    EXPECT_FALSE(lookup.zone.accessible);
}

TEST_F(ZoneRepositoryTest, ExactlyOneCurrentZone) {
    int64_t cocina = id_of("Cocina");
    int64_t salon = id_of("Salón");

    EXPECT_FALSE(zones.get_current_zone().found);

    EXPECT_TRUE(zones.set_current_zone(cocina));
    EXPECT_TRUE(zones.set_current_zone(salon));
    EXPECT_EQ(current_count(), 1);
    EXPECT_EQ(zones.get_current_zone().zone.name, "Salón");

    // unknown id: nothing changes
    EXPECT_FALSE(zones.set_current_zone(12345));
    EXPECT_EQ(zones.get_current_zone().zone.id, salon);

    zones.clear_current_zone();
    EXPECT_EQ(current_count(), 0);
}

TEST_F(ZoneRepositoryTest, PathsFrom) {
    int64_t a = id_of("A");
    int64_t b = id_of("B");

    ZonePath p = zones.add_path(a, b, "a la derecha", 350);
    EXPECT_GT(p.id, 0);
    zones.add_path(a, b, "por el pasillo");

    auto paths = zones.get_paths_from(a);
    ASSERT_EQ(paths.size(), 2u);
    EXPECT_EQ(paths[0].direction_hint, "a la derecha");
    EXPECT_EQ(paths[0].distance_cm, 350);
    EXPECT_EQ(paths[1].distance_cm, -1);
    EXPECT_TRUE(zones.get_paths_from(b).empty());
}

TEST_F(ZoneRepositoryTest, FindPathShortestByHops) {
    int64_t entrada = id_of("Entrada");
    int64_t pasillo = id_of("Pasillo");
    int64_t salon = id_of("Salón");
    int64_t cocina = id_of("Cocina");

    // long route first, short route second
    zones.add_path(entrada, pasillo, "recto", 100);
    zones.add_path(pasillo, salon, "izquierda", 100);
    zones.add_path(salon, cocina, "al fondo", 100);
    zones.add_path(entrada, cocina, "puerta lateral", 5000);

    auto route = zones.find_path("Entrada", "Cocina");
    ASSERT_EQ(route.size(), 1u);
    EXPECT_EQ(route[0].direction_hint, "puerta lateral");

    auto to_salon = zones.find_path("Entrada", "Salón");
    ASSERT_EQ(to_salon.size(), 2u);
    EXPECT_EQ(to_salon[0].to_zone_id, pasillo);
    EXPECT_EQ(to_salon[1].to_zone_id, salon);
}

TEST_F(ZoneRepositoryTest, FindPathFirstAmongEqualLength) {
    int64_t a = id_of("A");
    int64_t b = id_of("B");
    int64_t c = id_of("C");
    int64_t d = id_of("D");

    zones.add_path(a, b, "via B");
    zones.add_path(a, c, "via C");
    zones.add_path(c, d, "C-D");
    zones.add_path(b, d, "B-D");

    auto route = zones.find_path("A", "D");
    ASSERT_EQ(route.size(), 2u);
    EXPECT_EQ(route[0].direction_hint, "via B");
    EXPECT_EQ(route[1].direction_hint, "B-D");
}

TEST_F(ZoneRepositoryTest, FindPathEmptyCases) {
    int64_t a = id_of("A");
    int64_t b = id_of("B");
    zones.add_path(a, b, "ida");

    EXPECT_TRUE(zones.find_path("B", "A").empty());      // edges are directed
    EXPECT_TRUE(zones.find_path("A", "A").empty());
    EXPECT_TRUE(zones.find_path("A", "Marte").empty());
    EXPECT_TRUE(zones.find_path("Marte", "A").empty());
}
