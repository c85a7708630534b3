/**
 * @file Cancellation.hpp
 * @brief Cooperative cancellation signal passed through to action handlers.
 */

#pragma once

#include <atomic>
#include <memory>
#include <stdexcept>

namespace waypoint::domain::workflow {

/**
 * @class OperationCancelled
 * @brief Thrown by handlers that abort because cancellation was requested.
 */
class OperationCancelled : public std::runtime_error {
public:
    OperationCancelled() : std::runtime_error("Operation cancelled") {}
};

/**
 * @class CancellationToken
 * @brief Read side of a cancellation flag. A default-constructed token is never cancelled.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    bool isCancellationRequested() const {
        return m_flag && m_flag->load();
    }

    /** @throws OperationCancelled when cancellation was requested. */
    void throwIfCancellationRequested() const {
        if (isCancellationRequested()) throw OperationCancelled();
    }

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<std::atomic<bool>> flag) : m_flag(std::move(flag)) {}

    std::shared_ptr<std::atomic<bool>> m_flag;
};

/**
 * @class CancellationSource
 * @brief Owner side: hands out tokens and flips the shared flag.
 */
class CancellationSource {
public:
    CancellationSource() : m_flag(std::make_shared<std::atomic<bool>>(false)) {}

    CancellationToken token() const { return CancellationToken(m_flag); }
    void cancel() { m_flag->store(true); }
    bool isCancellationRequested() const { return m_flag->load(); }

private:
    std::shared_ptr<std::atomic<bool>> m_flag;
};

} // namespace waypoint::domain::workflow
