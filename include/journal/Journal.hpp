#pragma once

#include "journal/EventCodec.hpp"
#include "journal/EventStore.hpp"
#include "journal/RefStore.hpp"
#include "journal/sqlite/Database.hpp"

#include <memory>

namespace journal {

/**
 * Entry point wiring a RefStore and an EventStore over one backend.
 *
 * The database factory and the codec are supplied by the caller; the journal
 * never picks a file location or a type registry on its own.
 */
class Journal {
public:
    // Atomic in-process cells. Suitable for tests and single-process use.
    static Journal createInMemory();

    static Journal createPersistent(sqlite::DatabaseFactory& databaseFactory,
                                    std::shared_ptr<const EventCodec> codec);

    static Journal createWithDatabase(std::shared_ptr<sqlite::Database> database,
                                      std::shared_ptr<const EventCodec> codec);

    EventStore& eventStore() const { return *m_eventStore; }
    RefStore& refStore() const { return *m_refStore; }

    std::shared_ptr<EventStore> sharedEventStore() const { return m_eventStore; }
    std::shared_ptr<RefStore> sharedRefStore() const { return m_refStore; }

private:
    Journal(std::shared_ptr<EventStore> eventStore, std::shared_ptr<RefStore> refStore);

    std::shared_ptr<EventStore> m_eventStore;
    std::shared_ptr<RefStore> m_refStore;
};

}  // namespace journal
