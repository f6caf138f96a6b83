#pragma once

#include <cstddef>
#include <string>

namespace journal {

namespace schema {

static const int CURRENT_SCHEMA_VERSION = 1;

static const char* const REFS_TABLE = "refs";
static const char* const EVENTS_TABLE = "events";
static const char* const SCHEMA_VERSION_TABLE = "schema_version";

static const char* const WAL_JOURNAL_MODE = "WAL";
static const char* const NORMAL_SYNCHRONOUS = "NORMAL";

static const char* const IN_MEMORY_PATH = ":memory:";

}  // namespace schema

namespace sqlite {

struct SqliteOptions {
    std::string path = schema::IN_MEMORY_PATH;
    int busyTimeoutMs = 5000;
    std::string journalMode = schema::WAL_JOURNAL_MODE;
    std::string synchronous = schema::NORMAL_SYNCHRONOUS;
    // Rows fetched per round trip by getAllEvents() streams.
    std::size_t streamPageSize = 256;
    // Open with SQLITE_OPEN_READONLY; the file must already hold a journal.
    bool readOnly = false;

    // Defaults overridden by JOURNAL_DB_PATH, JOURNAL_BUSY_TIMEOUT_MS and
    // JOURNAL_STREAM_PAGE_SIZE when set.
    static SqliteOptions fromEnvironment();
};

}  // namespace sqlite

}  // namespace journal
