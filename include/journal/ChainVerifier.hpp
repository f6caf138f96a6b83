#pragma once

#include "journal/EventStore.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace journal {

struct ChainReport {
    std::string aggregateId;
    std::size_t eventCount = 0;
    std::optional<Hash> head;
    std::optional<Hash> lastEventHash;
    std::vector<std::string> problems;

    bool ok() const { return problems.empty(); }
};

// Re-derives every link of an aggregate's hash chain from stored content:
// the first event has no predecessor, each later event points at the hash of the
// one before it, and the ref equals the hash of the last event.
ChainReport verifyChain(const EventStore& store, const std::string& aggregateId);

}  // namespace journal
