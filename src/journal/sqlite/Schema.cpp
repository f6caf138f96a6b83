#include "journal/sqlite/Schema.hpp"

#include "journal/Logging.hpp"

#include <string>

namespace journal::sqlite {

namespace {

const char* const kSchemaSql = R"SQL(
CREATE TABLE IF NOT EXISTS refs (
    aggregate_id TEXT PRIMARY KEY NOT NULL,
    version      TEXT NOT NULL CHECK (length(version) = 64)
);

CREATE TABLE IF NOT EXISTS events (
    seq          INTEGER PRIMARY KEY AUTOINCREMENT,
    id           TEXT NOT NULL UNIQUE,
    aggregate_id TEXT NOT NULL,
    timestamp    INTEGER NOT NULL,
    parent       TEXT NULL,
    type         TEXT NOT NULL,
    data         TEXT NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_events_aggregate_ts ON events(aggregate_id, timestamp, seq);
CREATE INDEX IF NOT EXISTS idx_events_ts ON events(timestamp, seq);

CREATE TABLE IF NOT EXISTS schema_version (
    version INTEGER NOT NULL
);
)SQL";

int readVersion(sqlite3* db) {
    Statement query(db, "SELECT MAX(version) FROM schema_version;");
    if (!query.step() || query.columnIsNull(0)) {
        return 0;
    }
    return static_cast<int>(query.columnInt64(0));
}

}  // namespace

const char* schemaSql() {
    return kSchemaSql;
}

void applySchema(Database& database) {
    database.transaction([](sqlite3* db) {
        exec_sql(db, kSchemaSql);
        const int existing = readVersion(db);
        if (existing > schema::CURRENT_SCHEMA_VERSION) {
            throw StorageError("Journal schema version " + std::to_string(existing) +
                               " is newer than supported version " +
                               std::to_string(schema::CURRENT_SCHEMA_VERSION));
        }
        if (existing < schema::CURRENT_SCHEMA_VERSION) {
            Statement insert(db, "INSERT INTO schema_version(version) VALUES(?);");
            insert.bind(1, static_cast<std::int64_t>(schema::CURRENT_SCHEMA_VERSION));
            insert.step();
            qCInfo(journalSqlite, "Applied journal schema version %d", schema::CURRENT_SCHEMA_VERSION);
        }
    });
}

int schemaVersion(const Database& database) {
    return database.withConnection([](sqlite3* db) { return readVersion(db); });
}

void requireSchema(const Database& database) {
    const int tables = database.withConnection([](sqlite3* db) {
        Statement query(db,
                        "SELECT COUNT(*) FROM sqlite_master WHERE type = 'table'"
                        " AND name IN ('refs', 'events', 'schema_version');");
        return query.step() ? static_cast<int>(query.columnInt64(0)) : 0;
    });
    if (tables != 3) {
        throw StorageError("Not a journal database: " + database.options().path);
    }
    const int version = schemaVersion(database);
    if (version < 1 || version > schema::CURRENT_SCHEMA_VERSION) {
        throw StorageError("Unsupported journal schema version " + std::to_string(version) + " in " +
                           database.options().path);
    }
}

}  // namespace journal::sqlite
