#include "journal/Journal.hpp"

#include "journal/memory/InMemoryEventStore.hpp"
#include "journal/memory/InMemoryRefStore.hpp"
#include "journal/sqlite/Schema.hpp"
#include "journal/sqlite/SqliteStore.hpp"

#include <utility>

namespace journal {

Journal::Journal(std::shared_ptr<EventStore> eventStore, std::shared_ptr<RefStore> refStore)
    : m_eventStore(std::move(eventStore)), m_refStore(std::move(refStore)) {}

Journal Journal::createInMemory() {
    auto refs = std::make_shared<memory::InMemoryRefStore>();
    auto events = std::make_shared<memory::InMemoryEventStore>(refs);
    return Journal(events, refs);
}

Journal Journal::createPersistent(sqlite::DatabaseFactory& databaseFactory, std::shared_ptr<const EventCodec> codec) {
    return createWithDatabase(databaseFactory.createDatabase(), std::move(codec));
}

Journal Journal::createWithDatabase(std::shared_ptr<sqlite::Database> database,
                                    std::shared_ptr<const EventCodec> codec) {
    if (database && database->options().readOnly) {
        sqlite::requireSchema(*database);
    } else if (database) {
        sqlite::applySchema(*database);
    }
    auto store = std::make_shared<sqlite::SqliteStore>(std::move(database), std::move(codec));
    return Journal(store, store);
}

}  // namespace journal
