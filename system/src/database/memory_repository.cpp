// ============= src/database/memory_repository.cpp =============
#include "database/memory_repository.hpp"
#include "utils.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <sstream>

namespace {
    const char* SENSITIVE_KEYWORDS[] = {
        // español
        "contraseña", "password", "clave", "pin", "tarjeta", "crédito", "débito",
        "cuenta bancaria", "dni", "pasaporte", "número de seguridad", "seguridad social",
        "dirección", "domicilio", "medicamento", "diagnóstico", "enfermedad", "tratamiento",
        // english
        "address", "passport", "credit card", "debit card", "bank account",
        "social security", "medication", "diagnosis",
    };

    const char* MEMORY_COLUMNS =
        "SELECT id, person_id, zone_id, memory_type, content, importance, created_at, expires_at "
        "FROM memories ";

    // expires_at NULL or in the future
    const char* NOT_EXPIRED = "(expires_at IS NULL OR expires_at > ?)";

    MemoryRecord row_to_memory(const Statement& stmt) {
        MemoryRecord m;
        m.id = stmt.column_int64(0);
        m.person_id = stmt.column_is_null(1) ? "" : stmt.column_text(1);
        m.zone_id = stmt.column_is_null(2) ? -1 : stmt.column_int64(2);
        m.type = parse_memory_type(stmt.column_text(3));
        m.content = stmt.column_text(4);
        m.importance = stmt.column_int(5);
        m.created_at = stmt.column_int64(6);
        m.expires_at = stmt.column_is_null(7) ? 0 : stmt.column_int64(7);
        return m;
    }

    // general pool is stored as NULL
    std::string scope_clause(const std::string& person_id) {
        return person_id.empty() ? "person_id IS NULL" : "person_id = ?";
    }
}

bool contains_private_data(const std::string& content) {
    std::string lower = to_lower_utf8(content);
    for (const char* keyword : SENSITIVE_KEYWORDS) {
        if (lower.find(keyword) != std::string::npos) {
            return true;
        }
    }
    return false;
}

MemoryRepository::MemoryRepository(RobotStore& store) : store(store) {}

SaveOutcome MemoryRepository::save(const std::string& person_id,
                                   MemoryType type,
                                   const std::string& content,
                                   int importance,
                                   int64_t zone_id,
                                   int64_t expires_at)
{
    SaveOutcome outcome;
    outcome.record.person_id = person_id;
    outcome.record.zone_id = zone_id;
    outcome.record.type = type;
    outcome.record.content = content;
    outcome.record.importance = std::max(1, std::min(10, importance));
    outcome.record.created_at = now_ms();
    outcome.record.expires_at = expires_at;

    if (contains_private_data(content)) {
        spdlog::info("🔒 Memoria descartada por privacidad ({})", memory_type_name(type));
        outcome.status = SaveStatus::RejectedPrivate;
        return outcome;
    }

    std::lock_guard<std::mutex> lock(store.mutex());

    Statement stmt(store,
        "INSERT INTO memories (person_id, zone_id, memory_type, content, importance, created_at, expires_at) "
        "VALUES (?, ?, ?, ?, ?, ?, ?)");

    if (person_id.empty()) stmt.bind_null(1); else stmt.bind(1, person_id);
    if (zone_id < 0) stmt.bind_null(2); else stmt.bind(2, zone_id);
    stmt.bind(3, std::string(memory_type_name(type)))
        .bind(4, content)
        .bind(5, outcome.record.importance)
        .bind(6, outcome.record.created_at);
    if (expires_at <= 0) stmt.bind_null(7); else stmt.bind(7, expires_at);
    stmt.step();

    outcome.record.id = sqlite3_last_insert_rowid(store.handle());
    outcome.status = SaveStatus::Stored;

    spdlog::debug("✓ Memory saved (ID={}, type={}, person={})",
                  outcome.record.id, memory_type_name(type),
                  person_id.empty() ? "general" : person_id);
    return outcome;
}

std::vector<MemoryRecord> MemoryRepository::get_for_scope(const std::string& person_id,
                                                          bool include_expired)
{
    std::lock_guard<std::mutex> lock(store.mutex());

    std::string sql = std::string(MEMORY_COLUMNS) + "WHERE " + scope_clause(person_id);
    if (!include_expired) {
        sql += std::string(" AND ") + NOT_EXPIRED;
    }
    sql += " ORDER BY importance DESC, created_at DESC, id DESC";

    Statement stmt(store, sql.c_str());
    int idx = 1;
    if (!person_id.empty()) stmt.bind(idx++, person_id);
    if (!include_expired) stmt.bind(idx++, now_ms());

    std::vector<MemoryRecord> records;
    while (stmt.step()) {
        records.push_back(row_to_memory(stmt));
    }
    return records;
}

std::vector<MemoryRecord> MemoryRepository::get_recent_important(const std::string& person_id,
                                                                 int min_importance,
                                                                 int limit)
{
    std::lock_guard<std::mutex> lock(store.mutex());

    std::string sql = std::string(MEMORY_COLUMNS) + "WHERE " + scope_clause(person_id) +
                      " AND importance >= ? AND " + NOT_EXPIRED +
                      " ORDER BY created_at DESC, id DESC LIMIT ?";

    Statement stmt(store, sql.c_str());
    int idx = 1;
    if (!person_id.empty()) stmt.bind(idx++, person_id);
    stmt.bind(idx++, min_importance);
    stmt.bind(idx++, now_ms());
    stmt.bind(idx++, limit);

    std::vector<MemoryRecord> records;
    while (stmt.step()) {
        records.push_back(row_to_memory(stmt));
    }
    return records;
}

std::vector<MemoryRecord> MemoryRepository::get_zone_facts(int64_t zone_id, int limit) {
    std::lock_guard<std::mutex> lock(store.mutex());

    std::string sql = std::string(MEMORY_COLUMNS) +
                      "WHERE zone_id = ? AND memory_type = 'zone_info' AND " + NOT_EXPIRED +
                      " ORDER BY importance DESC, created_at DESC, id DESC LIMIT ?";

    Statement stmt(store, sql.c_str());
    stmt.bind(1, zone_id).bind(2, now_ms()).bind(3, limit);

    std::vector<MemoryRecord> records;
    while (stmt.step()) {
        records.push_back(row_to_memory(stmt));
    }
    return records;
}

MemoryContextBundle MemoryRepository::get_context_bundle(const std::string& person_id,
                                                         int64_t zone_id,
                                                         int min_importance,
                                                         int limit)
{
    MemoryContextBundle bundle;
    bundle.general = get_recent_important("", min_importance, limit);
    if (!person_id.empty()) {
        bundle.personal = get_recent_important(person_id, min_importance, limit);
    }
    if (zone_id >= 0) {
        bundle.zone = get_zone_facts(zone_id, limit);
    }
    return bundle;
}

int MemoryRepository::count() {
    std::lock_guard<std::mutex> lock(store.mutex());

    Statement stmt(store, "SELECT COUNT(*) FROM memories");
    return stmt.step() ? stmt.column_int(0) : 0;
}

// ==================== CONTEXT TEXT ====================

std::string format_memory_context(const MemoryContextBundle& bundle,
                                  const std::string& zone_name,
                                  const std::string& person_name)
{
    std::ostringstream out;

    if (!person_name.empty()) {
        out << "Estás hablando con " << person_name << ".\n";
    }
    if (!zone_name.empty()) {
        out << "Ubicación actual: " << zone_name << ".\n";
    }

    auto section = [&out](const char* title, const std::vector<MemoryRecord>& records) {
        if (records.empty()) return;
        out << title << ":\n";
        for (const auto& m : records) {
            out << "- " << m.content << "\n";
        }
    };

    section("Recuerdos generales", bundle.general);
    section("Lo que sabes de esta persona", bundle.personal);
    section("Datos de esta zona", bundle.zone);

    return out.str();
}
