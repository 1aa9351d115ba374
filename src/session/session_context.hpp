#pragma once

#include <atomic>
#include <mutex>
#include <string>
#include <utility>

#include <QString>

#include "common/models.hpp"
#include "session/capture_buffer.hpp"
#include "session/ports.hpp"

namespace scrollkeep {

// Flags polled by the driving loop and flipped by commands or capture
// callbacks from other threads.
struct SessionFlags {
    std::atomic<bool> exporting{false};
    std::atomic<bool> abortRequested{false};
    std::atomic<bool> skipCooldown{false};
    std::atomic<bool> pendingConfirmation{false};
    std::atomic<bool> rateLimited{false};
};

// Everything one export session mutates. Lifecycle and rate limit state
// share a mutex; readers get copies.
class SessionContext {
public:
    explicit SessionContext(Scheduler &scheduler);

    SessionContext(const SessionContext &) = delete;
    SessionContext &operator=(const SessionContext &) = delete;

    Scheduler &scheduler() const;
    CaptureBuffer &captures();
    const CaptureBuffer &captures() const;
    SessionFlags &flags();
    const SessionFlags &flags() const;

    // Applies the action stamped with scheduler time and logs transitions.
    LifecycleSnapshot dispatch(LifecycleActionType type);
    LifecycleSnapshot lifecycle() const;
    void markActivity();

    RateLimitState rateLimit() const;

    template<typename Fn>
    auto updateRateLimit(Fn &&fn) -> decltype(fn(std::declval<RateLimitState &>()))
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        return fn(m_rateLimit);
    }

    // Fresh run: counters reset, captures dropped, flags cleared and the
    // lifecycle back to idle.
    void resetForRun();

    void setTarget(std::string username, std::string userId);
    std::string username() const;
    std::string userId() const;

    void setCorrelationId(const QString &corrId);
    QString correlationId() const;

private:
    Scheduler &m_scheduler;
    CaptureBuffer m_captures;
    SessionFlags m_flags;

    mutable std::mutex m_mutex;
    LifecycleSnapshot m_lifecycle;
    RateLimitState m_rateLimit;
    std::string m_username;
    std::string m_userId = "unknown";
    QString m_correlationId;
};

} // namespace scrollkeep
