#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include "Error.hpp"


namespace nzbseek
{
/**
 * Cheap to copy handle to a shared cancellation flag with an optional deadline.
 * Copies observe the same flag, so cancelling one cancels all of them.
 */
class CancellationToken
{
public:
    using Clock = std::chrono::steady_clock;

public:
    CancellationToken() :
        m_cancelled( std::make_shared<std::atomic<bool> >( false ) )
    {}

    [[nodiscard]] static CancellationToken
    withTimeout( std::chrono::milliseconds timeout )
    {
        CancellationToken token;
        token.m_deadline = Clock::now() + timeout;
        return token;
    }

    /**
     * @return A token that is cancelled when either this one is cancelled or the timeout expires.
     */
    [[nodiscard]] CancellationToken
    withDeadline( std::chrono::milliseconds timeout ) const
    {
        auto token = *this;
        const auto deadline = Clock::now() + timeout;
        token.m_deadline = m_deadline ? std::min( *m_deadline, deadline ) : deadline;
        return token;
    }

    void
    cancel() const noexcept
    {
        m_cancelled->store( true );
    }

    [[nodiscard]] bool
    cancelled() const noexcept
    {
        return m_cancelled->load() || ( m_deadline && ( Clock::now() >= *m_deadline ) );
    }

    /**
     * @throws CancelledError if cancelled or the deadline has passed.
     */
    void
    throwIfCancelled( const std::string& context = {} ) const
    {
        if ( m_cancelled->load() ) {
            throw CancelledError( context.empty() ? "Operation was cancelled!" : context + " was cancelled!" );
        }
        if ( m_deadline && ( Clock::now() >= *m_deadline ) ) {
            throw CancelledError( context.empty() ? "Operation timed out!" : context + " timed out!" );
        }
    }

private:
    std::shared_ptr<std::atomic<bool> > m_cancelled;
    std::optional<Clock::time_point> m_deadline;
};
}  // namespace nzbseek
