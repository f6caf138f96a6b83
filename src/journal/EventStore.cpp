#include "journal/EventStore.hpp"

#include "journal/Errors.hpp"

namespace journal {

void EventStream::Iterator::advance() {
    if (m_stream == nullptr) {
        return;
    }
    m_current = m_stream->next();
    if (!m_current) {
        m_stream = nullptr;
    }
}

std::optional<Event> EventStream::next() {
    if (!m_cursor) {
        return std::nullopt;
    }
    std::optional<Event> event = m_cursor->next();
    if (!event) {
        m_cursor.reset();
    }
    return event;
}

std::vector<Event> EventStream::collect() {
    std::vector<Event> result;
    while (std::optional<Event> event = next()) {
        result.push_back(std::move(*event));
    }
    return result;
}

std::vector<Event> EventStore::eventsForAggregate(const std::string& aggregateId) const {
    EventFilter filter;
    filter.aggregateId = aggregateId;
    return events(filter);
}

void EventStore::validateCommitArguments(const std::string& aggregateId, const Event& event) {
    if (aggregateId.empty()) {
        throw InvalidArgument("Aggregate ID cannot be empty");
    }
    if (event.aggregateId != aggregateId) {
        throw InvalidArgument("Event " + event.id + " belongs to aggregate '" + event.aggregateId +
                              "', not '" + aggregateId + "'");
    }
    if (event.id.empty()) {
        throw InvalidArgument("Event ID cannot be empty");
    }
    validateEncodable(event);
}

void EventStore::verifyExpectedVersion(const std::string& aggregateId, const Event& event,
                                       const Hash& expectedVersion, const std::optional<Hash>& current) {
    if (current) {
        if (*current != expectedVersion) {
            throw ConcurrencyConflict("Concurrency conflict on " + aggregateId + ": expected version " +
                                      expectedVersion.toString() + ", but current version is " +
                                      current->toString());
        }
    } else if (!expectedVersion.isZero()) {
        throw ConcurrencyConflict("Concurrency conflict on " + aggregateId +
                                  ": expected initial version to be the zero hash, but got " +
                                  expectedVersion.toString());
    }

    if (event.parentOrZero() != expectedVersion) {
        throw InvalidArgument("Broken chain link: event " + event.id + " follows " +
                              event.parentOrZero().toString() + " but was committed at " +
                              expectedVersion.toString());
    }
}

}  // namespace journal
