#pragma once

#include "journal/Event.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace journal::memory {

// Append-only per-aggregate event lists, independent of ref state.
class InMemoryEventLog {
public:
    // Appends event to its aggregate's list. commitPoint runs while the aggregate's
    // list is locked; if it throws, nothing is appended and the exception propagates.
    // Throws JournalError(DuplicateEvent) if the id was already appended.
    void append(const Event& event, const std::function<void()>& commitPoint);

    std::vector<Event> query(const EventFilter& filter) const;

    // Aggregate's events in append order.
    std::vector<Event> inAppendOrder(const std::string& aggregateId) const;

    // Every event across aggregates ordered by timestamp, then append order.
    std::vector<Event> snapshot() const;

private:
    struct Entry {
        std::uint64_t sequence;
        Event event;
    };

    struct Stream {
        mutable std::mutex mutex;
        std::vector<Entry> entries;
    };

    std::shared_ptr<Stream> findStream(const std::string& aggregateId) const;
    std::shared_ptr<Stream> findOrCreateStream(const std::string& aggregateId);
    bool reserveId(const std::string& eventId);
    void releaseId(const std::string& eventId);

    std::atomic<std::uint64_t> m_nextSequence{1};

    mutable std::shared_mutex m_streamsMutex;
    std::unordered_map<std::string, std::shared_ptr<Stream>> m_streams;

    std::mutex m_idsMutex;
    std::unordered_set<std::string> m_ids;
};

}  // namespace journal::memory
