#pragma once

#include "journal/Config.hpp"
#include "journal/Errors.hpp"

#include <sqlite3.h>

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace journal::sqlite {

// A statement failed because of a UNIQUE / PRIMARY KEY / CHECK constraint.
class ConstraintViolation : public StorageError {
public:
    explicit ConstraintViolation(const std::string& message) : StorageError(message) {}
};

// Prepared statement, finalized on destruction.
class Statement {
public:
    Statement(sqlite3* db, const std::string& sql);
    ~Statement();

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind(int index, const std::string& value);
    void bind(int index, std::int64_t value);
    void bindOptional(int index, const std::optional<std::string>& value);
    void bindNull(int index);

    // True while rows are produced, false once done. Throws StorageError.
    bool step();

    std::string columnText(int column) const;
    std::int64_t columnInt64(int column) const;
    bool columnIsNull(int column) const;

private:
    sqlite3* m_db;
    sqlite3_stmt* m_stmt = nullptr;
    std::string m_sql;
};

/**
 * One SQLite connection plus the mutex that serializes its use.
 *
 * A connection has a single transaction context, so every transaction and every
 * read runs under the mutex; statements from two threads never interleave inside
 * one BEGIN ... COMMIT. Other processes are excluded by BEGIN IMMEDIATE and the
 * busy timeout.
 */
class Database {
public:
    explicit Database(SqliteOptions options);
    ~Database();

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    const SqliteOptions& options() const { return m_options; }

    // Runs body(sqlite3*) inside BEGIN IMMEDIATE ... COMMIT. Any exception rolls
    // the transaction back and propagates.
    template <typename Body>
    auto transaction(Body&& body) -> decltype(body(static_cast<sqlite3*>(nullptr)));

    // Runs body(sqlite3*) with exclusive use of the connection, no transaction.
    template <typename Body>
    auto withConnection(Body&& body) const -> decltype(body(static_cast<sqlite3*>(nullptr)));

private:
    SqliteOptions m_options;
    sqlite3* m_db = nullptr;
    mutable std::mutex m_mutex;
};

// BEGIN IMMEDIATE on construction, ROLLBACK on destruction unless commit() ran.
// The caller must hold the database mutex.
class Transaction {
public:
    explicit Transaction(sqlite3* db);
    ~Transaction();

    Transaction(const Transaction&) = delete;
    Transaction& operator=(const Transaction&) = delete;

    void commit();

private:
    sqlite3* m_db;
    bool m_done = false;
};

void exec_sql(sqlite3* db, const std::string& sql);

// Rows changed by the most recent INSERT / UPDATE / DELETE on db.
int changes(sqlite3* db);

template <typename Body>
auto Database::transaction(Body&& body) -> decltype(body(static_cast<sqlite3*>(nullptr))) {
    std::lock_guard<std::mutex> lock(m_mutex);
    Transaction txn(m_db);
    if constexpr (std::is_void_v<decltype(body(m_db))>) {
        body(m_db);
        txn.commit();
    } else {
        auto result = body(m_db);
        txn.commit();
        return result;
    }
}

template <typename Body>
auto Database::withConnection(Body&& body) const -> decltype(body(static_cast<sqlite3*>(nullptr))) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return body(m_db);
}

// Produces ready-to-use databases with the journal schema applied.
class DatabaseFactory {
public:
    virtual ~DatabaseFactory() = default;
    virtual std::shared_ptr<Database> createDatabase() = 0;
};

class FileDatabaseFactory : public DatabaseFactory {
public:
    explicit FileDatabaseFactory(SqliteOptions options);
    std::shared_ptr<Database> createDatabase() override;

private:
    SqliteOptions m_options;
};

// Each createDatabase() call returns a fresh private in-memory database.
class MemoryDatabaseFactory : public DatabaseFactory {
public:
    std::shared_ptr<Database> createDatabase() override;
};

}  // namespace journal::sqlite
