#pragma once

#include "journal/EventCodec.hpp"
#include "journal/EventStore.hpp"
#include "journal/RefStore.hpp"
#include "journal/sqlite/Database.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace journal::sqlite {

/**
 * EventStore and RefStore over one SQLite database.
 *
 * commit() inserts the event row and advances the refs row inside a single
 * BEGIN IMMEDIATE transaction. The ref update is an UPDATE ... WHERE version = ?
 * (or INSERT OR IGNORE for a new aggregate) whose affected row count decides the
 * race; a count of zero throws inside the transaction, which rolls the insert back.
 *
 * Event rows store the codec's JSON document; rows the codec cannot decode are
 * logged and skipped by every read.
 */
class SqliteStore : public EventStore, public RefStore {
public:
    SqliteStore(std::shared_ptr<Database> database, std::shared_ptr<const EventCodec> codec);

    // EventStore
    Hash commit(const std::string& aggregateId, const Event& event, const Hash& expectedVersion,
                const CancellationToken& token = CancellationToken()) override;
    std::vector<Event> events(const EventFilter& filter) const override;
    EventStream getAllEvents() const override;
    std::vector<Event> chain(const std::string& aggregateId) const override;
    std::optional<Hash> head(const std::string& aggregateId) const override;

    // RefStore
    void swap(const std::string& aggregateId, const Hash& newRef, const std::optional<Hash>& oldRef,
              const CancellationToken& token = CancellationToken()) override;
    std::optional<Hash> read(const std::string& aggregateId) const override;

    const std::shared_ptr<Database>& database() const { return m_database; }

private:
    // Compare-and-swap on the refs row. Caller holds an open transaction.
    static void swapInternal(sqlite3* db, const std::string& aggregateId, const Hash& newRef,
                             const std::optional<Hash>& oldRef);

    std::shared_ptr<Database> m_database;
    std::shared_ptr<const EventCodec> m_codec;
};

}  // namespace journal::sqlite
