#pragma once

#include "journal/RefStore.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace journal::memory {

// Refs held in per-aggregate cells. The cell map lock is only taken exclusively to
// insert a new aggregate; each compare-and-swap locks just its own cell.
class InMemoryRefStore : public RefStore {
public:
    void swap(const std::string& aggregateId, const Hash& newRef, const std::optional<Hash>& oldRef,
              const CancellationToken& token = CancellationToken()) override;

    std::optional<Hash> read(const std::string& aggregateId) const override;

private:
    struct Cell {
        mutable std::mutex mutex;
        std::optional<Hash> ref;
    };

    std::shared_ptr<Cell> findCell(const std::string& aggregateId) const;
    std::shared_ptr<Cell> findOrCreateCell(const std::string& aggregateId);

    mutable std::shared_mutex m_cellsMutex;
    std::unordered_map<std::string, std::shared_ptr<Cell>> m_cells;
};

}  // namespace journal::memory
