#include "journal/memory/InMemoryRefStore.hpp"

#include "journal/Errors.hpp"
#include "journal/Logging.hpp"

namespace journal::memory {

namespace {

std::string describe(const std::optional<Hash>& ref) {
    return ref ? ref->toString() : std::string("(none)");
}

}  // namespace

void InMemoryRefStore::swap(const std::string& aggregateId, const Hash& newRef, const std::optional<Hash>& oldRef,
                            const CancellationToken& token) {
    if (aggregateId.empty()) {
        throw InvalidArgument("Aggregate ID cannot be empty");
    }
    token.throwIfCancelled("swap " + aggregateId);

    if (oldRef && *oldRef == newRef) {
        return;
    }

    std::shared_ptr<Cell> cell = oldRef ? findCell(aggregateId) : findOrCreateCell(aggregateId);
    if (!cell) {
        throw ConcurrencyConflict("Concurrency conflict on " + aggregateId + ": expected version " +
                                  oldRef->toString() + ", but no ref exists");
    }

    std::lock_guard<std::mutex> lock(cell->mutex);
    token.throwIfCancelled("swap " + aggregateId);

    if (cell->ref != oldRef) {
        throw ConcurrencyConflict("Concurrency conflict on " + aggregateId + ": expected version " +
                                  describe(oldRef) + ", but current version is " + describe(cell->ref));
    }
    cell->ref = newRef;
    qCDebug(journalMemory, "Ref %s -> %s", aggregateId.c_str(), newRef.toString().c_str());
}

std::optional<Hash> InMemoryRefStore::read(const std::string& aggregateId) const {
    std::shared_ptr<Cell> cell = findCell(aggregateId);
    if (!cell) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(cell->mutex);
    return cell->ref;
}

std::shared_ptr<InMemoryRefStore::Cell> InMemoryRefStore::findCell(const std::string& aggregateId) const {
    std::shared_lock<std::shared_mutex> lock(m_cellsMutex);
    auto it = m_cells.find(aggregateId);
    return it == m_cells.end() ? nullptr : it->second;
}

std::shared_ptr<InMemoryRefStore::Cell> InMemoryRefStore::findOrCreateCell(const std::string& aggregateId) {
    if (std::shared_ptr<Cell> existing = findCell(aggregateId)) {
        return existing;
    }
    std::unique_lock<std::shared_mutex> lock(m_cellsMutex);
    std::shared_ptr<Cell>& slot = m_cells[aggregateId];
    if (!slot) {
        slot = std::make_shared<Cell>();
    }
    return slot;
}

}  // namespace journal::memory
