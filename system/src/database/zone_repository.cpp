// ============= src/database/zone_repository.cpp =============
#include "database/zone_repository.hpp"
#include "utils.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <map>
#include <queue>
#include <set>

namespace {
    const char* ZONE_COLUMNS =
        "SELECT id, name, category, description, known_since, accessible, is_current FROM zones ";

    Zone row_to_zone(const Statement& stmt) {
        Zone z;
        z.id = stmt.column_int64(0);
        z.name = stmt.column_text(1);
        z.category = parse_zone_category(stmt.column_text(2));
        z.description = stmt.column_text(3);
        z.known_since = stmt.column_int64(4);
        z.accessible = stmt.column_int(5) != 0;
        z.is_current = stmt.column_int(6) != 0;
        return z;
    }

    ZonePath row_to_path(const Statement& stmt) {
        ZonePath p;
        p.id = stmt.column_int64(0);
        p.from_zone_id = stmt.column_int64(1);
        p.to_zone_id = stmt.column_int64(2);
        p.direction_hint = stmt.column_text(3);
        p.distance_cm = stmt.column_is_null(4) ? -1 : stmt.column_int(4);
        return p;
    }
}

ZoneRepository::ZoneRepository(RobotStore& store) : store(store) {}

// An empty text_arg binds int_arg to the single placeholder instead
ZoneLookup ZoneRepository::find_one_locked(const char* where_sql, const std::string& text_arg, int64_t int_arg) {
    ZoneLookup result;

    std::string sql = std::string(ZONE_COLUMNS) + where_sql;
    Statement stmt(store, sql.c_str());
    if (sql.find('?') != std::string::npos) {
        if (text_arg.empty()) stmt.bind(1, int_arg);
        else stmt.bind(1, text_arg);
    }

    if (stmt.step()) {
        result.zone = row_to_zone(stmt);
        result.found = true;
    }
    return result;
}

ZoneGetOrCreateResult ZoneRepository::get_or_create(const std::string& name,
                                                    ZoneCategory category,
                                                    const std::string& description)
{
    std::lock_guard<std::mutex> lock(store.mutex());

    ZoneGetOrCreateResult result;
    ZoneLookup existing = find_one_locked("WHERE name = ?", name, 0);
    if (existing.found) {
        result.zone = existing.zone;
        return result;
    }

    Statement stmt(store,
        "INSERT INTO zones (name, category, description, known_since, accessible, is_current) "
        "VALUES (?, ?, ?, ?, 1, 0)");
    stmt.bind(1, name)
        .bind(2, std::string(zone_category_name(category)))
        .bind(3, description)
        .bind(4, now_ms());
    stmt.step();

    result.zone = find_one_locked("WHERE name = ?", name, 0).zone;
    result.created = true;

    spdlog::info("✓ Zone created: {} (ID={}, {})", name, result.zone.id, zone_category_name(category));
    return result;
}

ZoneLookup ZoneRepository::get_by_name(const std::string& name) {
    std::lock_guard<std::mutex> lock(store.mutex());
    return find_one_locked("WHERE name = ?", name, 0);
}

ZoneLookup ZoneRepository::get_by_id(int64_t id) {
    std::lock_guard<std::mutex> lock(store.mutex());
    return find_one_locked("WHERE id = ?", "", id);
}

ZoneLookup ZoneRepository::get_current_zone() {
    std::lock_guard<std::mutex> lock(store.mutex());
    return find_one_locked("WHERE is_current = 1", "", 0);
}

std::vector<Zone> ZoneRepository::list_all() {
    std::lock_guard<std::mutex> lock(store.mutex());

    std::string sql = std::string(ZONE_COLUMNS) + "ORDER BY name ASC";
    Statement stmt(store, sql.c_str());

    std::vector<Zone> zones;
    while (stmt.step()) {
        zones.push_back(row_to_zone(stmt));
    }
    return zones;
}

bool ZoneRepository::update_description(const std::string& name, const std::string& description) {
    std::lock_guard<std::mutex> lock(store.mutex());

    Statement stmt(store, "UPDATE zones SET description = ? WHERE name = ?");
    stmt.bind(1, description).bind(2, name);
    stmt.step();
    return sqlite3_changes(store.handle()) > 0;
}

bool ZoneRepository::set_accessible(const std::string& name, bool accessible) {
    std::lock_guard<std::mutex> lock(store.mutex());

    Statement stmt(store, "UPDATE zones SET accessible = ? WHERE name = ?");
    stmt.bind(1, accessible ? 1 : 0).bind(2, name);
    stmt.step();
    return sqlite3_changes(store.handle()) > 0;
}

// ==================== CURRENT LOCATION ====================

bool ZoneRepository::set_current_zone(int64_t zone_id) {
    std::lock_guard<std::mutex> lock(store.mutex());
    Transaction tx(store);

    Statement clear(store, "UPDATE zones SET is_current = 0 WHERE is_current = 1 AND id != ?");
    clear.bind(1, zone_id);
    clear.step();

    Statement set(store, "UPDATE zones SET is_current = 1 WHERE id = ?");
    set.bind(1, zone_id);
    set.step();

    if (sqlite3_changes(store.handle()) == 0) {
        // unknown id: roll back so the previous location survives
        spdlog::warn("Zone {} not found, current location unchanged", zone_id);
        return false;
    }

    tx.commit();
    spdlog::debug("📍 Current zone → {}", zone_id);
    return true;
}

void ZoneRepository::clear_current_zone() {
    std::lock_guard<std::mutex> lock(store.mutex());
    store.exec("UPDATE zones SET is_current = 0 WHERE is_current = 1;");
}

// ==================== PATHS ====================

ZonePath ZoneRepository::add_path(int64_t from_zone_id, int64_t to_zone_id,
                                  const std::string& direction_hint,
                                  int distance_cm)
{
    std::lock_guard<std::mutex> lock(store.mutex());

    Statement stmt(store,
        "INSERT INTO zone_paths (from_zone_id, to_zone_id, direction_hint, distance_cm) "
        "VALUES (?, ?, ?, ?)");
    stmt.bind(1, from_zone_id).bind(2, to_zone_id).bind(3, direction_hint);
    if (distance_cm < 0) stmt.bind_null(4); else stmt.bind(4, distance_cm);
    stmt.step();

    ZonePath path;
    path.id = sqlite3_last_insert_rowid(store.handle());
    path.from_zone_id = from_zone_id;
    path.to_zone_id = to_zone_id;
    path.direction_hint = direction_hint;
    path.distance_cm = distance_cm;

    spdlog::debug("✓ Path {} → {} ({})", from_zone_id, to_zone_id, direction_hint);
    return path;
}

std::vector<ZonePath> ZoneRepository::get_paths_from(int64_t zone_id) {
    std::lock_guard<std::mutex> lock(store.mutex());

    Statement stmt(store,
        "SELECT id, from_zone_id, to_zone_id, direction_hint, distance_cm FROM zone_paths "
        "WHERE from_zone_id = ? ORDER BY id ASC");
    stmt.bind(1, zone_id);

    std::vector<ZonePath> paths;
    while (stmt.step()) {
        paths.push_back(row_to_path(stmt));
    }
    return paths;
}

std::vector<ZonePath> ZoneRepository::find_path(const std::string& from_name, const std::string& to_name) {
    int64_t start = -1;
    int64_t goal = -1;
    std::map<int64_t, std::vector<ZonePath>> adjacency;

    {
        std::lock_guard<std::mutex> lock(store.mutex());

        ZoneLookup from = find_one_locked("WHERE name = ?", from_name, 0);
        ZoneLookup to = find_one_locked("WHERE name = ?", to_name, 0);
        if (!from.found || !to.found || from.zone.id == to.zone.id) {
            return {};
        }
        start = from.zone.id;
        goal = to.zone.id;

        // whole edge set in one read; maps are small
        Statement stmt(store,
            "SELECT id, from_zone_id, to_zone_id, direction_hint, distance_cm FROM zone_paths "
            "ORDER BY id ASC");
        while (stmt.step()) {
            ZonePath p = row_to_path(stmt);
            adjacency[p.from_zone_id].push_back(p);
        }
    }

    std::map<int64_t, ZonePath> came_by;
    std::set<int64_t> visited{start};
    std::queue<int64_t> frontier;
    frontier.push(start);

    while (!frontier.empty()) {
        int64_t current = frontier.front();
        frontier.pop();

        auto it = adjacency.find(current);
        if (it == adjacency.end()) continue;

        for (const auto& edge : it->second) {
            if (visited.count(edge.to_zone_id)) continue;
            visited.insert(edge.to_zone_id);
            came_by[edge.to_zone_id] = edge;

            if (edge.to_zone_id == goal) {
                std::vector<ZonePath> route;
                int64_t node = goal;
                while (node != start) {
                    const ZonePath& step = came_by[node];
                    route.push_back(step);
                    node = step.from_zone_id;
                }
                std::reverse(route.begin(), route.end());
                return route;
            }
            frontier.push(edge.to_zone_id);
        }
    }

    return {};
}
