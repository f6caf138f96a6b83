#pragma once

#include "journal/EventStore.hpp"
#include "journal/RefStore.hpp"
#include "journal/memory/InMemoryEventLog.hpp"

#include <memory>

namespace journal::memory {

// Composes a RefStore with an InMemoryEventLog. The ref swap runs as the log's
// commit point, so an event is visible exactly when its ref update succeeded.
class InMemoryEventStore : public EventStore {
public:
    explicit InMemoryEventStore(std::shared_ptr<RefStore> refs);

    Hash commit(const std::string& aggregateId, const Event& event, const Hash& expectedVersion,
                const CancellationToken& token = CancellationToken()) override;

    std::vector<Event> events(const EventFilter& filter) const override;
    EventStream getAllEvents() const override;
    std::vector<Event> chain(const std::string& aggregateId) const override;
    std::optional<Hash> head(const std::string& aggregateId) const override;

    const std::shared_ptr<RefStore>& refStore() const { return m_refs; }

private:
    std::shared_ptr<RefStore> m_refs;
    InMemoryEventLog m_log;
};

}  // namespace journal::memory
