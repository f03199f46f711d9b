// ============= include/database/robot_store.hpp =============
/*
 * Robot Store - SQLite Backend
 *
 * Una conexión compartida por todos los repositorios:
 * - db_mutex serializa el acceso (un escritor por fila vía transacción)
 * - WAL + synchronous=NORMAL, foreign keys activas
 * - Transaction: BEGIN IMMEDIATE / COMMIT, ROLLBACK si no se llega a commit()
 * - Statement: prepared statement con finalize automático
 *
 * Los errores SQLite se lanzan como StoreError.
 */

#pragma once
#include <cstdint>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>
#include <sqlite3.h>

class StoreError : public std::runtime_error {
public:
    explicit StoreError(const std::string& what) : std::runtime_error(what) {}
};

class RobotStore {
public:
    // ":memory:" opens a private in-memory database
    explicit RobotStore(const std::string& db_path);
    ~RobotStore();

    RobotStore(const RobotStore&) = delete;
    RobotStore& operator=(const RobotStore&) = delete;

    sqlite3* handle() { return db; }
    std::mutex& mutex() { return db_mutex; }
    const std::string& path() const { return db_path; }

    // Runs one or more statements without results; throws StoreError
    void exec(const char* sql);

    std::string last_error() const;

private:
    sqlite3* db;
    std::string db_path;
    std::mutex db_mutex;

    void init_database();
    void create_tables();
};

// Caller must already hold store.mutex()
class Transaction {
public:
    explicit Transaction(RobotStore& store);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();

private:
    RobotStore& store;
    bool committed = false;
};

class Statement {
public:
    Statement(RobotStore& store, const char* sql);
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement& bind(int index, const std::string& value);
    Statement& bind(int index, int64_t value);
    Statement& bind(int index, int value);
    Statement& bind(int index, double value);
    Statement& bind_null(int index);
    Statement& bind_blob(int index, const std::vector<unsigned char>& blob);

    // true = row available, false = done; throws on error
    bool step();
    void reset();

    int64_t column_int64(int col) const;
    int column_int(int col) const;
    double column_double(int col) const;
    std::string column_text(int col) const;
    std::vector<unsigned char> column_blob(int col) const;
    bool column_is_null(int col) const;

private:
    RobotStore& store;
    sqlite3_stmt* stmt;
};
