#pragma once

#include "journal/Cancellation.hpp"
#include "journal/Event.hpp"
#include "journal/Hash.hpp"

#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace journal {

// Backend side of an EventStream. next() returns empty once exhausted.
class EventCursor {
public:
    virtual ~EventCursor() = default;
    virtual std::optional<Event> next() = 0;
};

// Lazy, finite, one-shot sequence of events.
class EventStream {
public:
    class Iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Event;
        using difference_type = std::ptrdiff_t;
        using pointer = const Event*;
        using reference = const Event&;

        Iterator() = default;
        explicit Iterator(EventStream* stream) : m_stream(stream) { advance(); }

        reference operator*() const { return *m_current; }
        pointer operator->() const { return &*m_current; }
        Iterator& operator++() {
            advance();
            return *this;
        }
        bool operator==(const Iterator& other) const { return m_stream == other.m_stream; }
        bool operator!=(const Iterator& other) const { return !(*this == other); }

    private:
        void advance();

        EventStream* m_stream = nullptr;
        std::optional<Event> m_current;
    };

    explicit EventStream(std::unique_ptr<EventCursor> cursor) : m_cursor(std::move(cursor)) {}

    std::optional<Event> next();

    // Drains whatever is left of the stream.
    std::vector<Event> collect();

    Iterator begin() { return Iterator(this); }
    Iterator end() { return Iterator(); }

private:
    std::unique_ptr<EventCursor> m_cursor;
};

/**
 * Append-only event storage with optimistic concurrency.
 *
 * commit() protocol:
 * 1. read the aggregate's ref
 * 2. a present ref must equal expectedVersion, an absent one requires the zero hash
 * 3. event.currentVersion must equal expectedVersion (the chain link)
 * 4. append the event and swap the ref to event.hash() in one atomic step
 * A lost race in step 4 leaves neither the event nor the ref behind and throws
 * ConcurrencyConflict. No lock is held between step 1 and step 4.
 */
class EventStore {
public:
    virtual ~EventStore() = default;

    virtual Hash commit(const std::string& aggregateId, const Event& event, const Hash& expectedVersion,
                        const CancellationToken& token = CancellationToken()) = 0;

    // Matching events ordered by timestamp, equal timestamps in commit order.
    // Undecodable records are skipped.
    virtual std::vector<Event> events(const EventFilter& filter) const = 0;

    // Every committed event ordered by timestamp, then commit order.
    virtual EventStream getAllEvents() const = 0;

    // An aggregate's events in commit order, i.e. following the hash chain.
    virtual std::vector<Event> chain(const std::string& aggregateId) const = 0;

    // Current version of the aggregate, empty if nothing was committed.
    virtual std::optional<Hash> head(const std::string& aggregateId) const = 0;

    std::vector<Event> eventsForAggregate(const std::string& aggregateId) const;

protected:
    // Argument checks shared by every backend. Throws InvalidArgument.
    static void validateCommitArguments(const std::string& aggregateId, const Event& event);

    // Version checks against the ref read at the start of commit. Throws
    // ConcurrencyConflict for version mismatches and InvalidArgument for a broken
    // chain link.
    static void verifyExpectedVersion(const std::string& aggregateId, const Event& event,
                                      const Hash& expectedVersion, const std::optional<Hash>& current);
};

}  // namespace journal
