#include "journal/sqlite/SqliteStore.hpp"

#include "journal/Errors.hpp"
#include "journal/Logging.hpp"

#include <algorithm>
#include <cstdint>
#include <deque>
#include <utility>

namespace journal::sqlite {

namespace {

struct Row {
    std::string id;
    std::string aggregateId;
    std::string type;
    std::string data;
};

std::string describe(const std::optional<Hash>& ref) {
    return ref ? ref->toString() : std::string("(none)");
}

// Rows that fail to decode, or whose document disagrees with the indexed
// columns, are logged and skipped so one bad record never fails a whole query.
std::optional<Event> decodeRow(const EventCodec& codec, const Row& row) {
    try {
        Event event = codec.decode(row.data);
        if (event.id != row.id || event.aggregateId != row.aggregateId || event.type != row.type) {
            qCWarning(journalSqlite, "Skipping event row %s (%s, %s): document carries %s (%s, %s)",
                      row.id.c_str(), row.aggregateId.c_str(), row.type.c_str(), event.id.c_str(),
                      event.aggregateId.c_str(), event.type.c_str());
            return std::nullopt;
        }
        return event;
    } catch (const DecodeError& e) {
        qCWarning(journalSqlite, "Error deserializing event %s: %s", row.id.c_str(), e.what());
        return std::nullopt;
    }
}

Row readRow(const Statement& query, int firstColumn) {
    return Row{query.columnText(firstColumn), query.columnText(firstColumn + 1), query.columnText(firstColumn + 2),
               query.columnText(firstColumn + 3)};
}

// Streams the events table in (timestamp, seq) pages. Rows committed after the
// first next() are excluded; no statement stays open between calls.
class PagedEventCursor : public EventCursor {
public:
    PagedEventCursor(std::shared_ptr<Database> database, std::shared_ptr<const EventCodec> codec)
        : m_database(std::move(database)),
          m_codec(std::move(codec)),
          m_pageSize(std::max<std::int64_t>(1, static_cast<std::int64_t>(m_database->options().streamPageSize))) {}

    std::optional<Event> next() override {
        while (true) {
            if (m_buffer.empty()) {
                if (m_exhausted) {
                    return std::nullopt;
                }
                fetchPage();
                continue;
            }
            Row row = std::move(m_buffer.front());
            m_buffer.pop_front();
            if (std::optional<Event> event = decodeRow(*m_codec, row)) {
                return event;
            }
        }
    }

private:
    void fetchPage() {
        m_database->withConnection([this](sqlite3* db) {
            if (!m_highWater) {
                Statement top(db, "SELECT COALESCE(MAX(seq), 0) FROM events;");
                top.step();
                m_highWater = top.columnInt64(0);
            }

            Statement page(db,
                           "SELECT seq, timestamp, id, aggregate_id, type, data FROM events"
                           " WHERE seq <= ?1 AND (?2 = 0 OR timestamp > ?3 OR (timestamp = ?3 AND seq > ?4))"
                           " ORDER BY timestamp ASC, seq ASC LIMIT ?5;");
            page.bind(1, *m_highWater);
            page.bind(2, static_cast<std::int64_t>(m_started ? 1 : 0));
            page.bind(3, m_lastTimestamp);
            page.bind(4, m_lastSeq);
            page.bind(5, m_pageSize);

            std::int64_t fetched = 0;
            while (page.step()) {
                m_lastSeq = page.columnInt64(0);
                m_lastTimestamp = page.columnInt64(1);
                m_buffer.push_back(readRow(page, 2));
                ++fetched;
            }
            m_started = true;
            if (fetched < m_pageSize) {
                m_exhausted = true;
            }
        });
    }

    std::shared_ptr<Database> m_database;
    std::shared_ptr<const EventCodec> m_codec;
    std::int64_t m_pageSize;
    std::optional<std::int64_t> m_highWater;
    bool m_started = false;
    bool m_exhausted = false;
    std::int64_t m_lastTimestamp = 0;
    std::int64_t m_lastSeq = 0;
    std::deque<Row> m_buffer;
};

}  // namespace

SqliteStore::SqliteStore(std::shared_ptr<Database> database, std::shared_ptr<const EventCodec> codec)
    : m_database(std::move(database)), m_codec(std::move(codec)) {
    if (!m_database) {
        throw InvalidArgument("SqliteStore requires a database");
    }
    if (!m_codec) {
        throw InvalidArgument("SqliteStore requires an event codec");
    }
}

Hash SqliteStore::commit(const std::string& aggregateId, const Event& event, const Hash& expectedVersion,
                         const CancellationToken& token) {
    validateCommitArguments(aggregateId, event);
    token.throwIfCancelled("commit " + event.id);

    const std::optional<Hash> current = read(aggregateId);
    verifyExpectedVersion(aggregateId, event, expectedVersion, current);

    const Hash newVersion = event.hash();
    const std::string data = m_codec->encode(event);
    std::optional<std::string> parent;
    if (event.currentVersion && !event.currentVersion->isZero()) {
        parent = event.currentVersion->toString();
    }
    token.throwIfCancelled("commit " + event.id);

    try {
        m_database->transaction([&](sqlite3* db) {
            Statement insert(db,
                             "INSERT INTO events(id, aggregate_id, timestamp, parent, type, data)"
                             " VALUES(?, ?, ?, ?, ?, ?);");
            insert.bind(1, event.id);
            insert.bind(2, event.aggregateId);
            insert.bind(3, event.timestamp);
            insert.bindOptional(4, parent);
            insert.bind(5, event.type);
            insert.bind(6, data);
            try {
                insert.step();
            } catch (const ConstraintViolation& e) {
                throw JournalError(ErrorCode::DuplicateEvent,
                                   "Event " + event.id + " was already committed: " + e.what());
            }

            swapInternal(db, aggregateId, newVersion, current);
        });
    } catch (const ConcurrencyConflict& conflict) {
        qCWarning(journalSqlite, "Lost commit race for %s on %s: %s", event.id.c_str(), aggregateId.c_str(),
                  conflict.what());
        throw;
    }

    qCDebug(journalSqlite, "Committed %s to %s at %s", event.id.c_str(), aggregateId.c_str(),
            newVersion.toString().c_str());
    return newVersion;
}

std::vector<Event> SqliteStore::events(const EventFilter& filter) const {
    std::string sql = "SELECT id, aggregate_id, type, data FROM events WHERE aggregate_id = ?";
    if (filter.type) {
        sql += " AND type = ?";
    }
    if (filter.start) {
        sql += " AND timestamp >= ?";
    }
    if (filter.end) {
        sql += " AND timestamp <= ?";
    }
    sql += " ORDER BY timestamp ASC, seq ASC;";

    const std::vector<Row> rows = m_database->withConnection([&](sqlite3* db) {
        Statement query(db, sql);
        int index = 1;
        query.bind(index++, filter.aggregateId);
        if (filter.type) {
            query.bind(index++, *filter.type);
        }
        if (filter.start) {
            query.bind(index++, *filter.start);
        }
        if (filter.end) {
            query.bind(index++, *filter.end);
        }
        std::vector<Row> result;
        while (query.step()) {
            result.push_back(readRow(query, 0));
        }
        return result;
    });

    std::vector<Event> result;
    result.reserve(rows.size());
    for (const Row& row : rows) {
        if (std::optional<Event> event = decodeRow(*m_codec, row)) {
            result.push_back(std::move(*event));
        }
    }
    return result;
}

EventStream SqliteStore::getAllEvents() const {
    return EventStream(std::make_unique<PagedEventCursor>(m_database, m_codec));
}

std::vector<Event> SqliteStore::chain(const std::string& aggregateId) const {
    const std::vector<Row> rows = m_database->withConnection([&](sqlite3* db) {
        Statement query(db, "SELECT id, aggregate_id, type, data FROM events WHERE aggregate_id = ? ORDER BY seq ASC;");
        query.bind(1, aggregateId);
        std::vector<Row> result;
        while (query.step()) {
            result.push_back(readRow(query, 0));
        }
        return result;
    });

    std::vector<Event> result;
    result.reserve(rows.size());
    for (const Row& row : rows) {
        if (std::optional<Event> event = decodeRow(*m_codec, row)) {
            result.push_back(std::move(*event));
        }
    }
    return result;
}

std::optional<Hash> SqliteStore::head(const std::string& aggregateId) const {
    return read(aggregateId);
}

void SqliteStore::swap(const std::string& aggregateId, const Hash& newRef, const std::optional<Hash>& oldRef,
                       const CancellationToken& token) {
    if (aggregateId.empty()) {
        throw InvalidArgument("Aggregate ID cannot be empty");
    }
    token.throwIfCancelled("swap " + aggregateId);

    if (oldRef && *oldRef == newRef) {
        return;
    }

    m_database->transaction([&](sqlite3* db) {
        token.throwIfCancelled("swap " + aggregateId);
        swapInternal(db, aggregateId, newRef, oldRef);
    });
}

std::optional<Hash> SqliteStore::read(const std::string& aggregateId) const {
    if (aggregateId.empty()) {
        return std::nullopt;
    }
    const std::optional<std::string> version = m_database->withConnection([&](sqlite3* db) {
        Statement query(db, "SELECT version FROM refs WHERE aggregate_id = ?;");
        query.bind(1, aggregateId);
        std::optional<std::string> result;
        if (query.step()) {
            result = query.columnText(0);
        }
        return result;
    });

    if (!version) {
        return std::nullopt;
    }
    if (!Hash::isValid(*version)) {
        qCCritical(journalSqlite, "Corrupt ref for %s: %s", aggregateId.c_str(), version->c_str());
        throw StorageError("Corrupt ref stored for aggregate " + aggregateId);
    }
    return Hash(*version);
}

void SqliteStore::swapInternal(sqlite3* db, const std::string& aggregateId, const Hash& newRef,
                               const std::optional<Hash>& oldRef) {
    if (!oldRef) {
        Statement insert(db, "INSERT OR IGNORE INTO refs(aggregate_id, version) VALUES(?, ?);");
        insert.bind(1, aggregateId);
        insert.bind(2, newRef.toString());
        insert.step();
        if (changes(db) == 0) {
            throw ConcurrencyConflict("Concurrency conflict on " + aggregateId +
                                      ": expected no existing reference, but one exists");
        }
        return;
    }

    Statement update(db, "UPDATE refs SET version = ? WHERE aggregate_id = ? AND version = ?;");
    update.bind(1, newRef.toString());
    update.bind(2, aggregateId);
    update.bind(3, oldRef->toString());
    update.step();
    if (changes(db) == 0) {
        throw ConcurrencyConflict("Concurrency conflict on " + aggregateId + ": expected version " +
                                  describe(oldRef) + ", but current version is different");
    }
}

}  // namespace journal::sqlite
