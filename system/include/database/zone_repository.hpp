// ============= include/database/zone_repository.hpp =============
/*
 * Zone Repository - mapa del entorno como grafo dirigido
 *
 * - Nodos: zonas con nombre único
 * - Aristas: ZonePath dirigidos (ida y vuelta = dos filas)
 * - Ubicación actual: a lo sumo una zona con is_current = 1
 *   (limpiar + marcar dentro de la misma transacción, índice único parcial)
 * - find_path(): BFS por número de saltos, no por distancia
 */

#pragma once
#include "database/entities.hpp"
#include "database/robot_store.hpp"
#include <string>
#include <vector>

struct ZoneLookup {
    Zone zone;
    bool found = false;
};

struct ZoneGetOrCreateResult {
    Zone zone;
    bool created = false;
};

class ZoneRepository {
public:
    explicit ZoneRepository(RobotStore& store);

    // Idempotent by name; an existing zone keeps its category/description
    ZoneGetOrCreateResult get_or_create(const std::string& name,
                                        ZoneCategory category = ZoneCategory::Unknown,
                                        const std::string& description = "");

    ZoneLookup get_by_name(const std::string& name);
    ZoneLookup get_by_id(int64_t id);
    ZoneLookup get_current_zone();

    std::vector<Zone> list_all();

    bool update_description(const std::string& name, const std::string& description);
    bool set_accessible(const std::string& name, bool accessible);

    // Clears every other flag and sets this one, in one transaction.
    // Returns false if the zone id does not exist (nothing changes)
    bool set_current_zone(int64_t zone_id);
    void clear_current_zone();

    ZonePath add_path(int64_t from_zone_id, int64_t to_zone_id,
                      const std::string& direction_hint = "",
                      int distance_cm = -1);

    std::vector<ZonePath> get_paths_from(int64_t zone_id);

    // First shortest route by hop count; empty when unreachable,
    // when either name is unknown, or when from == to
    std::vector<ZonePath> find_path(const std::string& from_name, const std::string& to_name);

private:
    RobotStore& store;

    ZoneLookup find_one_locked(const char* where_sql, const std::string& text_arg, int64_t int_arg);
};
