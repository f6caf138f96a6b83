#include "journal/sqlite/Database.hpp"

#include "journal/Logging.hpp"
#include "journal/sqlite/Schema.hpp"

#include <utility>

namespace journal::sqlite {

namespace {

[[noreturn]] void throwStepError(sqlite3* db, int rc, const std::string& sql) {
    const std::string message = std::string(sqlite3_errmsg(db)) + " [" + sql + "]";
    if ((rc & 0xff) == SQLITE_CONSTRAINT) {
        throw ConstraintViolation("SQLite constraint failed: " + message);
    }
    qCCritical(journalSqlite, "SQLite step failed: %s", message.c_str());
    throw StorageError("SQLite step failed: " + message);
}

}  // namespace

Statement::Statement(sqlite3* db, const std::string& sql) : m_db(db), m_sql(sql) {
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &m_stmt, nullptr) != SQLITE_OK) {
        const std::string message = sqlite3_errmsg(db);
        sqlite3_finalize(m_stmt);
        m_stmt = nullptr;
        throw StorageError("SQLite prepare failed: " + message + " [" + sql + "]");
    }
}

Statement::~Statement() {
    sqlite3_finalize(m_stmt);
}

void Statement::bind(int index, const std::string& value) {
    sqlite3_bind_text(m_stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

void Statement::bind(int index, std::int64_t value) {
    sqlite3_bind_int64(m_stmt, index, static_cast<sqlite3_int64>(value));
}

void Statement::bindOptional(int index, const std::optional<std::string>& value) {
    if (value) {
        bind(index, *value);
    } else {
        bindNull(index);
    }
}

void Statement::bindNull(int index) {
    sqlite3_bind_null(m_stmt, index);
}

bool Statement::step() {
    const int rc = sqlite3_step(m_stmt);
    if (rc == SQLITE_ROW) {
        return true;
    }
    if (rc == SQLITE_DONE) {
        return false;
    }
    throwStepError(m_db, rc, m_sql);
}

std::string Statement::columnText(int column) const {
    const unsigned char* text = sqlite3_column_text(m_stmt, column);
    if (text == nullptr) {
        return {};
    }
    return std::string(reinterpret_cast<const char*>(text), static_cast<std::size_t>(sqlite3_column_bytes(m_stmt, column)));
}

std::int64_t Statement::columnInt64(int column) const {
    return static_cast<std::int64_t>(sqlite3_column_int64(m_stmt, column));
}

bool Statement::columnIsNull(int column) const {
    return sqlite3_column_type(m_stmt, column) == SQLITE_NULL;
}

Database::Database(SqliteOptions options) : m_options(std::move(options)) {
    const int flags = m_options.readOnly ? SQLITE_OPEN_READONLY | SQLITE_OPEN_FULLMUTEX
                                         : SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(m_options.path.c_str(), &m_db, flags, nullptr) != SQLITE_OK) {
        const std::string message = m_db ? sqlite3_errmsg(m_db) : "out of memory";
        sqlite3_close(m_db);
        m_db = nullptr;
        qCCritical(journalSqlite, "Failed to open SQLite database at %s: %s", m_options.path.c_str(), message.c_str());
        throw StorageError("Failed to open SQLite database at " + m_options.path + ": " + message);
    }

    try {
        sqlite3_busy_timeout(m_db, m_options.busyTimeoutMs);
        if (!m_options.readOnly) {
            exec_sql(m_db, "PRAGMA journal_mode=" + m_options.journalMode + ";");
            exec_sql(m_db, "PRAGMA synchronous=" + m_options.synchronous + ";");
        }
        exec_sql(m_db, "PRAGMA foreign_keys=ON;");
    } catch (const StorageError&) {
        sqlite3_close(m_db);
        m_db = nullptr;
        throw;
    }
    qCInfo(journalSqlite, "Opened SQLite database: %s%s", m_options.path.c_str(),
           m_options.readOnly ? " (read-only)" : "");
}

Database::~Database() {
    if (m_db != nullptr && sqlite3_close(m_db) != SQLITE_OK) {
        qCWarning(journalSqlite, "Closing %s left unfinalized statements: %s", m_options.path.c_str(),
                  sqlite3_errmsg(m_db));
    }
}

Transaction::Transaction(sqlite3* db) : m_db(db) {
    exec_sql(m_db, "BEGIN IMMEDIATE;");
}

Transaction::~Transaction() {
    if (m_done) {
        return;
    }
    char* errmsg = nullptr;
    if (sqlite3_exec(m_db, "ROLLBACK;", nullptr, nullptr, &errmsg) != SQLITE_OK) {
        qCCritical(journalSqlite, "ROLLBACK failed: %s", errmsg ? errmsg : "unknown error");
    } else {
        qCDebug(journalSqlite, "Transaction rolled back");
    }
    sqlite3_free(errmsg);
}

void Transaction::commit() {
    exec_sql(m_db, "COMMIT;");
    m_done = true;
}

void exec_sql(sqlite3* db, const std::string& sql) {
    char* errmsg = nullptr;
    if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &errmsg) != SQLITE_OK) {
        std::string message = errmsg ? errmsg : "unknown error";
        sqlite3_free(errmsg);
        throw StorageError("SQLite exec failed: " + message);
    }
}

int changes(sqlite3* db) {
    return sqlite3_changes(db);
}

FileDatabaseFactory::FileDatabaseFactory(SqliteOptions options) : m_options(std::move(options)) {}

std::shared_ptr<Database> FileDatabaseFactory::createDatabase() {
    auto database = std::make_shared<Database>(m_options);
    if (m_options.readOnly) {
        requireSchema(*database);
    } else {
        applySchema(*database);
    }
    return database;
}

std::shared_ptr<Database> MemoryDatabaseFactory::createDatabase() {
    SqliteOptions options;
    options.path = schema::IN_MEMORY_PATH;
    auto database = std::make_shared<Database>(options);
    applySchema(*database);
    return database;
}

}  // namespace journal::sqlite
