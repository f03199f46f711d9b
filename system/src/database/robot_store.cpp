// ============= src/database/robot_store.cpp =============
#include "database/robot_store.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>

// ==================== CONSTRUCTOR/DESTRUCTOR ====================

RobotStore::RobotStore(const std::string& db_path)
    : db(nullptr), db_path(db_path)
{
    spdlog::info("🗄  Inicializando Robot Store");
    spdlog::info("   Path: {}", db_path);

    if (db_path != ":memory:") {
        std::filesystem::path p(db_path);
        if (p.has_parent_path()) {
            std::filesystem::create_directories(p.parent_path());
        }
    }

    init_database();
    spdlog::info("✓ Store ready");
}

RobotStore::~RobotStore() {
    if (db) {
        sqlite3_close(db);
    }
}

// ==================== INITIALIZATION ====================

void RobotStore::init_database() {
    int rc = sqlite3_open(db_path.c_str(), &db);
    if (rc != SQLITE_OK) {
        std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
        spdlog::error("Cannot open database: {}", msg);
        if (db) {
            sqlite3_close(db);
            db = nullptr;
        }
        throw StoreError("No se pudo abrir la base de datos: " + msg);
    }

    sqlite3_busy_timeout(db, 5000);
    exec("PRAGMA foreign_keys=ON;");
    if (db_path != ":memory:") {
        exec("PRAGMA journal_mode=WAL;");
        exec("PRAGMA synchronous=NORMAL;");
    }

    create_tables();
}

void RobotStore::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS people (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            person_id TEXT NOT NULL UNIQUE,
            name TEXT NOT NULL,
            first_seen INTEGER NOT NULL,
            last_seen INTEGER NOT NULL,
            interaction_count INTEGER NOT NULL DEFAULT 0,
            notes TEXT NOT NULL DEFAULT ''
        );

        CREATE TABLE IF NOT EXISTS face_embeddings (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            person_id TEXT NOT NULL,
            embedding BLOB NOT NULL,
            captured_at INTEGER NOT NULL,
            source_lighting TEXT,
            FOREIGN KEY (person_id) REFERENCES people(person_id) ON DELETE CASCADE
        );

        CREATE TABLE IF NOT EXISTS zones (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            name TEXT NOT NULL UNIQUE,
            category TEXT NOT NULL DEFAULT 'unknown',
            description TEXT NOT NULL DEFAULT '',
            known_since INTEGER NOT NULL,
            accessible INTEGER NOT NULL DEFAULT 1,
            is_current INTEGER NOT NULL DEFAULT 0
        );

        CREATE TABLE IF NOT EXISTS zone_paths (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            from_zone_id INTEGER NOT NULL,
            to_zone_id INTEGER NOT NULL,
            direction_hint TEXT NOT NULL DEFAULT '',
            distance_cm INTEGER,
            FOREIGN KEY (from_zone_id) REFERENCES zones(id) ON DELETE CASCADE,
            FOREIGN KEY (to_zone_id) REFERENCES zones(id) ON DELETE CASCADE
        );

        CREATE TABLE IF NOT EXISTS memories (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            person_id TEXT,
            zone_id INTEGER,
            memory_type TEXT NOT NULL,
            content TEXT NOT NULL,
            importance INTEGER NOT NULL DEFAULT 5,
            created_at INTEGER NOT NULL,
            expires_at INTEGER
        );

        CREATE TABLE IF NOT EXISTS conversation_history (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            session_id TEXT NOT NULL,
            role TEXT NOT NULL,
            content TEXT NOT NULL,
            message_index INTEGER NOT NULL,
            is_compacted INTEGER NOT NULL DEFAULT 0,
            timestamp INTEGER NOT NULL,
            person_id TEXT
        );

        CREATE INDEX IF NOT EXISTS idx_embeddings_person ON face_embeddings(person_id);
        CREATE UNIQUE INDEX IF NOT EXISTS idx_zone_current ON zones(is_current) WHERE is_current = 1;
        CREATE INDEX IF NOT EXISTS idx_paths_from ON zone_paths(from_zone_id);
        CREATE INDEX IF NOT EXISTS idx_memories_person_importance ON memories(person_id, importance);
        CREATE INDEX IF NOT EXISTS idx_conv_session_idx ON conversation_history(session_id, message_index);
    )";

    exec(sql);
}

void RobotStore::exec(const char* sql) {
    char* err_msg = nullptr;
    int rc = sqlite3_exec(db, sql, nullptr, nullptr, &err_msg);

    if (rc != SQLITE_OK) {
        std::string msg = err_msg ? err_msg : sqlite3_errmsg(db);
        sqlite3_free(err_msg);
        spdlog::error("SQL error: {}", msg);
        throw StoreError(msg);
    }
}

std::string RobotStore::last_error() const {
    return db ? sqlite3_errmsg(db) : "database closed";
}

// ==================== TRANSACTION ====================

Transaction::Transaction(RobotStore& store) : store(store) {
    store.exec("BEGIN IMMEDIATE;");
}

Transaction::~Transaction() {
    if (!committed) {
        char* err = nullptr;
        if (sqlite3_exec(store.handle(), "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
            spdlog::error("Rollback failed: {}", err ? err : "unknown");
        }
        sqlite3_free(err);
    }
}

void Transaction::commit() {
    store.exec("COMMIT;");
    committed = true;
}

// ==================== STATEMENT ====================

Statement::Statement(RobotStore& store, const char* sql) : store(store), stmt(nullptr) {
    int rc = sqlite3_prepare_v2(store.handle(), sql, -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        throw StoreError("Failed to prepare statement: " + store.last_error());
    }
}

Statement::~Statement() {
    sqlite3_finalize(stmt);
}

Statement& Statement::bind(int index, const std::string& value) {
    sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
    return *this;
}

Statement& Statement::bind(int index, int64_t value) {
    sqlite3_bind_int64(stmt, index, value);
    return *this;
}

Statement& Statement::bind(int index, int value) {
    sqlite3_bind_int(stmt, index, value);
    return *this;
}

Statement& Statement::bind(int index, double value) {
    sqlite3_bind_double(stmt, index, value);
    return *this;
}

Statement& Statement::bind_null(int index) {
    sqlite3_bind_null(stmt, index);
    return *this;
}

Statement& Statement::bind_blob(int index, const std::vector<unsigned char>& blob) {
    sqlite3_bind_blob(stmt, index, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);
    return *this;
}

bool Statement::step() {
    int rc = sqlite3_step(stmt);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw StoreError("Step failed: " + store.last_error());
}

void Statement::reset() {
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
}

int64_t Statement::column_int64(int col) const {
    return sqlite3_column_int64(stmt, col);
}

int Statement::column_int(int col) const {
    return sqlite3_column_int(stmt, col);
}

double Statement::column_double(int col) const {
    return sqlite3_column_double(stmt, col);
}

std::string Statement::column_text(int col) const {
    const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, col));
    return text ? text : "";
}

std::vector<unsigned char> Statement::column_blob(int col) const {
    const unsigned char* blob = static_cast<const unsigned char*>(sqlite3_column_blob(stmt, col));
    int size = sqlite3_column_bytes(stmt, col);
    if (!blob || size <= 0) return {};
    return std::vector<unsigned char>(blob, blob + size);
}

bool Statement::column_is_null(int col) const {
    return sqlite3_column_type(stmt, col) == SQLITE_NULL;
}
