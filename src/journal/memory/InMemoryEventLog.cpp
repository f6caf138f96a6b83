#include "journal/memory/InMemoryEventLog.hpp"

#include "journal/Errors.hpp"
#include "journal/Logging.hpp"

#include <algorithm>
#include <exception>
#include <tuple>
#include <utility>

namespace journal::memory {

namespace {

template <typename EntryT>
bool byTimestampThenSequence(const EntryT& a, const EntryT& b) {
    return std::tie(a.event.timestamp, a.sequence) < std::tie(b.event.timestamp, b.sequence);
}

}  // namespace

void InMemoryEventLog::append(const Event& event, const std::function<void()>& commitPoint) {
    std::shared_ptr<Stream> stream = findOrCreateStream(event.aggregateId);
    std::lock_guard<std::mutex> lock(stream->mutex);

    if (!reserveId(event.id)) {
        throw JournalError(ErrorCode::DuplicateEvent, "Event " + event.id + " was already committed");
    }

    try {
        commitPoint();
    } catch (const std::exception&) {
        releaseId(event.id);
        throw;
    }

    stream->entries.push_back(Entry{m_nextSequence.fetch_add(1), event});
    qCDebug(journalMemory, "Appended %s to %s (%zu events)", event.id.c_str(), event.aggregateId.c_str(),
            stream->entries.size());
}

std::vector<Event> InMemoryEventLog::query(const EventFilter& filter) const {
    std::shared_ptr<Stream> stream = findStream(filter.aggregateId);
    if (!stream) {
        return {};
    }

    std::vector<Entry> matching;
    {
        std::lock_guard<std::mutex> lock(stream->mutex);
        for (const Entry& entry : stream->entries) {
            if (filter.matches(entry.event)) {
                matching.push_back(entry);
            }
        }
    }
    std::stable_sort(matching.begin(), matching.end(), byTimestampThenSequence<Entry>);

    std::vector<Event> result;
    result.reserve(matching.size());
    for (Entry& entry : matching) {
        result.push_back(std::move(entry.event));
    }
    return result;
}

std::vector<Event> InMemoryEventLog::inAppendOrder(const std::string& aggregateId) const {
    std::shared_ptr<Stream> stream = findStream(aggregateId);
    if (!stream) {
        return {};
    }
    std::lock_guard<std::mutex> lock(stream->mutex);
    std::vector<Event> result;
    result.reserve(stream->entries.size());
    for (const Entry& entry : stream->entries) {
        result.push_back(entry.event);
    }
    return result;
}

std::vector<Event> InMemoryEventLog::snapshot() const {
    std::vector<std::shared_ptr<Stream>> streams;
    {
        std::shared_lock<std::shared_mutex> lock(m_streamsMutex);
        streams.reserve(m_streams.size());
        for (const auto& entry : m_streams) {
            streams.push_back(entry.second);
        }
    }

    std::vector<Entry> all;
    for (const auto& stream : streams) {
        std::lock_guard<std::mutex> lock(stream->mutex);
        all.insert(all.end(), stream->entries.begin(), stream->entries.end());
    }
    std::sort(all.begin(), all.end(), byTimestampThenSequence<Entry>);

    std::vector<Event> result;
    result.reserve(all.size());
    for (Entry& entry : all) {
        result.push_back(std::move(entry.event));
    }
    return result;
}

std::shared_ptr<InMemoryEventLog::Stream> InMemoryEventLog::findStream(const std::string& aggregateId) const {
    std::shared_lock<std::shared_mutex> lock(m_streamsMutex);
    auto it = m_streams.find(aggregateId);
    return it == m_streams.end() ? nullptr : it->second;
}

std::shared_ptr<InMemoryEventLog::Stream> InMemoryEventLog::findOrCreateStream(const std::string& aggregateId) {
    if (std::shared_ptr<Stream> existing = findStream(aggregateId)) {
        return existing;
    }
    std::unique_lock<std::shared_mutex> lock(m_streamsMutex);
    std::shared_ptr<Stream>& slot = m_streams[aggregateId];
    if (!slot) {
        slot = std::make_shared<Stream>();
    }
    return slot;
}

bool InMemoryEventLog::reserveId(const std::string& eventId) {
    std::lock_guard<std::mutex> lock(m_idsMutex);
    return m_ids.insert(eventId).second;
}

void InMemoryEventLog::releaseId(const std::string& eventId) {
    std::lock_guard<std::mutex> lock(m_idsMutex);
    m_ids.erase(eventId);
}

}  // namespace journal::memory
