#include "journal/memory/InMemoryEventStore.hpp"

#include "journal/Errors.hpp"
#include "journal/Logging.hpp"

#include <utility>

namespace journal::memory {

namespace {

// Snapshots the log on the first next() so a stream reflects commits made
// between getAllEvents() and the start of iteration.
class SnapshotCursor : public EventCursor {
public:
    explicit SnapshotCursor(const InMemoryEventLog& log) : m_log(log) {}

    std::optional<Event> next() override {
        if (!m_loaded) {
            m_events = m_log.snapshot();
            m_loaded = true;
        }
        if (m_position >= m_events.size()) {
            return std::nullopt;
        }
        return std::move(m_events[m_position++]);
    }

private:
    const InMemoryEventLog& m_log;
    std::vector<Event> m_events;
    std::size_t m_position = 0;
    bool m_loaded = false;
};

}  // namespace

InMemoryEventStore::InMemoryEventStore(std::shared_ptr<RefStore> refs) : m_refs(std::move(refs)) {
    if (!m_refs) {
        throw InvalidArgument("InMemoryEventStore requires a RefStore");
    }
}

Hash InMemoryEventStore::commit(const std::string& aggregateId, const Event& event, const Hash& expectedVersion,
                                const CancellationToken& token) {
    validateCommitArguments(aggregateId, event);
    token.throwIfCancelled("commit " + event.id);

    const std::optional<Hash> current = m_refs->read(aggregateId);
    verifyExpectedVersion(aggregateId, event, expectedVersion, current);

    const Hash newVersion = event.hash();
    token.throwIfCancelled("commit " + event.id);

    try {
        m_log.append(event, [&]() { m_refs->swap(aggregateId, newVersion, current); });
    } catch (const ConcurrencyConflict& conflict) {
        qCWarning(journalMemory, "Lost commit race for %s on %s: %s", event.id.c_str(), aggregateId.c_str(),
                  conflict.what());
        throw;
    }

    qCDebug(journalMemory, "Committed %s to %s at %s", event.id.c_str(), aggregateId.c_str(),
            newVersion.toString().c_str());
    return newVersion;
}

std::vector<Event> InMemoryEventStore::events(const EventFilter& filter) const {
    return m_log.query(filter);
}

EventStream InMemoryEventStore::getAllEvents() const {
    return EventStream(std::make_unique<SnapshotCursor>(m_log));
}

std::vector<Event> InMemoryEventStore::chain(const std::string& aggregateId) const {
    return m_log.inAppendOrder(aggregateId);
}

std::optional<Hash> InMemoryEventStore::head(const std::string& aggregateId) const {
    return m_refs->read(aggregateId);
}

}  // namespace journal::memory
