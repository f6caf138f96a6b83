#pragma once

#include "journal/Cancellation.hpp"
#include "journal/Hash.hpp"

#include <optional>
#include <string>

namespace journal {

/**
 * Maps an aggregate id to the hash of its latest committed event.
 *
 * swap() is a compare-and-swap:
 * - oldRef == newRef succeeds without touching the store
 * - oldRef empty creates the ref and fails if one already exists
 * - oldRef present replaces the ref only if it currently equals oldRef
 * Every failed comparison throws ConcurrencyConflict. Of N concurrent swaps on the
 * same (aggregateId, oldRef) exactly one succeeds.
 *
 * Implementations must be safe to call from any thread.
 */
class RefStore {
public:
    virtual ~RefStore() = default;

    // Throws InvalidArgument for an empty aggregateId, ConcurrencyConflict on mismatch,
    // Cancelled if the token fires before the check-and-set.
    virtual void swap(const std::string& aggregateId, const Hash& newRef, const std::optional<Hash>& oldRef,
                      const CancellationToken& token = CancellationToken()) = 0;

    // Empty for unknown or empty ids.
    virtual std::optional<Hash> read(const std::string& aggregateId) const = 0;
};

}  // namespace journal
