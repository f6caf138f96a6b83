#include "journal/Cancellation.hpp"

#include "journal/Errors.hpp"

namespace journal {

void CancellationToken::throwIfCancelled(const std::string& operation) const {
    if (isCancelled()) {
        throw Cancelled(operation + " cancelled");
    }
}

}  // namespace journal
