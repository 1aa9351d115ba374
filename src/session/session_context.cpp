#include "session/session_context.hpp"

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "engine/lifecycle.hpp"
#include "engine/rate_limit_controller.hpp"

namespace scrollkeep {

SessionContext::SessionContext(Scheduler &scheduler)
    : m_scheduler(scheduler)
    , m_lifecycle(createInitialLifecycle(scheduler.now()))
    , m_rateLimit(createRateLimitState())
{
}

Scheduler &SessionContext::scheduler() const
{
    return m_scheduler;
}

CaptureBuffer &SessionContext::captures()
{
    return m_captures;
}

const CaptureBuffer &SessionContext::captures() const
{
    return m_captures;
}

SessionFlags &SessionContext::flags()
{
    return m_flags;
}

const SessionFlags &SessionContext::flags() const
{
    return m_flags;
}

LifecycleSnapshot SessionContext::dispatch(LifecycleActionType type)
{
    const int64_t at = m_scheduler.now();
    LifecycleSnapshot before;
    LifecycleSnapshot after;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        before = m_lifecycle;
        m_lifecycle = reduceLifecycle(m_lifecycle, makeAction(type, at));
        after = m_lifecycle;
    }

    if (before.status != after.status) {
        SKLOG_DEBUG(QStringLiteral("SessionContext"),
                    QStringLiteral("dispatch"),
                    QStringLiteral("lifecycle_transition"),
                    QString::fromStdString(toActionString(type)),
                    QStringLiteral("reduceLifecycle"),
                    QString::fromStdString(username()),
                    correlationId(),
                    (nlohmann::json{{"from", before.status}, {"to", after.status}}));
    }
    return after;
}

LifecycleSnapshot SessionContext::lifecycle() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_lifecycle;
}

void SessionContext::markActivity()
{
    dispatch(LifecycleActionType::Activity);
}

RateLimitState SessionContext::rateLimit() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_rateLimit;
}

void SessionContext::resetForRun()
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        resetRateLimitStateForRun(m_rateLimit);
        m_lifecycle = createInitialLifecycle(m_scheduler.now());
    }
    m_captures.clear();
    m_flags.abortRequested = false;
    m_flags.skipCooldown = false;
    m_flags.pendingConfirmation = false;
    m_flags.rateLimited = false;
}

void SessionContext::setTarget(std::string username, std::string userId)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_username = std::move(username);
    m_userId = userId.empty() ? std::string("unknown") : std::move(userId);
}

std::string SessionContext::username() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_username;
}

std::string SessionContext::userId() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_userId;
}

void SessionContext::setCorrelationId(const QString &corrId)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_correlationId = corrId;
}

QString SessionContext::correlationId() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_correlationId;
}

} // namespace scrollkeep
