#pragma once

#include "journal/sqlite/Database.hpp"

namespace journal::sqlite {

// CREATE statements for refs, events and schema_version.
const char* schemaSql();

// Creates missing tables and records CURRENT_SCHEMA_VERSION. Idempotent. Throws
// StorageError if the file carries a newer schema version than this build knows.
void applySchema(Database& database);

int schemaVersion(const Database& database);

// Checks without writing that the file holds a journal schema this build can
// read. Throws StorageError otherwise.
void requireSchema(const Database& database);

}  // namespace journal::sqlite
