#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <utility>

namespace journal {

// Observer side of a cancellation flag. A default constructed token never cancels.
class CancellationToken {
public:
    CancellationToken() = default;

    bool isCancelled() const { return m_flag && m_flag->load(std::memory_order_acquire); }

    // Throws Cancelled if cancellation was requested. `operation` names the call site.
    void throwIfCancelled(const std::string& operation) const;

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<std::atomic<bool>> flag) : m_flag(std::move(flag)) {}

    std::shared_ptr<std::atomic<bool>> m_flag;
};

class CancellationSource {
public:
    CancellationSource() : m_flag(std::make_shared<std::atomic<bool>>(false)) {}

    CancellationToken token() const { return CancellationToken(m_flag); }
    void cancel() { m_flag->store(true, std::memory_order_release); }
    bool isCancelled() const { return m_flag->load(std::memory_order_acquire); }

private:
    std::shared_ptr<std::atomic<bool>> m_flag;
};

}  // namespace journal
