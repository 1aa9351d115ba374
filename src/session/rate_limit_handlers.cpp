#include "session/rate_limit_handlers.hpp"

#include "common/logging.hpp"
#include "engine/rate_limit_controller.hpp"

namespace scrollkeep {

namespace {

const QString kComponent = QStringLiteral("RateLimitHandlers");

} // namespace

RateLimitHandlers::RateLimitHandlers(SessionContext &context, PresentationHooks &presentation)
    : m_context(context)
    , m_presentation(presentation)
{
}

void RateLimitHandlers::applyRateLimitUpdate(const nlohmann::json &info)
{
    const int64_t now = m_context.scheduler().now();
    RateLimitState state;
    const RateLimitUpdateResult result = m_context.updateRateLimit([&](RateLimitState &rate) {
        RateLimitUpdateResult update = applyRateLimitInfo(rate, info, now);
        if (update.triggeredBatchCooldown || update.triggeredLowRemainingCooldown) {
            rate.mode = RateLimitMode::Cooldown;
        }
        state = rate;
        return update;
    });

    if (info.is_null()) {
        return;
    }

    SKLOG_DEBUG(kComponent,
                "applyRateLimitUpdate",
                "rate_limit_update",
                "quota_headers",
                "applyRateLimitInfo",
                "",
                m_context.correlationId(),
                (nlohmann::json{{"remaining", state.remaining},
                                {"limit", state.limit},
                                {"dynamicDelay", state.dynamicDelay}}));

    if (result.triggeredBatchCooldown) {
        m_context.dispatch(LifecycleActionType::EnterCooldown);
        SKLOG_INFO(kComponent,
                   "applyRateLimitUpdate",
                   "cooldown_entered",
                   "batch_pacing",
                   "enter_cooldown",
                   "",
                   m_context.correlationId(),
                   (nlohmann::json{{"requestCount", state.requestCount}}));
    }
    if (result.triggeredLowRemainingCooldown) {
        m_context.dispatch(LifecycleActionType::EnterCooldown);
        SKLOG_WARN(kComponent,
                   "applyRateLimitUpdate",
                   "cooldown_entered",
                   "low_remaining",
                   "enter_cooldown",
                   "",
                   m_context.correlationId(),
                   (nlohmann::json{{"remaining", state.remaining}}));
    }
}

void RateLimitHandlers::handleInterceptedResponse(CaptureEvent event)
{
    const nlohmann::json info = event.rateLimitInfo;
    const size_t count = m_context.captures().append(std::move(event));
    m_context.markActivity();

    applyRateLimitUpdate(info);

    const RateLimitState state = m_context.updateRateLimit([&](RateLimitState &rate) {
        if (m_context.flags().rateLimited && rate.mode != RateLimitMode::Paused) {
            m_context.flags().rateLimited = false;
            rate.retryCount = 0;
        }
        return rate;
    });

    SKLOG_INFO(kComponent,
               "handleInterceptedResponse",
               "response_captured",
               "timeline_page",
               "capture",
               "",
               m_context.correlationId(),
               (nlohmann::json{{"count", count},
                               {"remaining", state.remaining},
                               {"delayMs", state.dynamicDelay}}));
}

void RateLimitHandlers::handleRateLimitHit(const nlohmann::json &info)
{
    if (!m_context.flags().exporting) {
        return;
    }
    bool expected = false;
    if (!m_context.flags().rateLimited.compare_exchange_strong(expected, true)) {
        return;
    }

    const int retryCount = m_context.updateRateLimit([](RateLimitState &rate) {
        rate.mode = RateLimitMode::Paused;
        rate.retryCount += 1;
        return rate.retryCount;
    });
    m_context.dispatch(LifecycleActionType::PauseRateLimit);

    applyRateLimitUpdate(info);

    SKLOG_WARN(kComponent,
               "handleRateLimitHit",
               "rate_limit_hit",
               "http_429",
               "pause_rate_limit",
               "",
               m_context.correlationId(),
               (nlohmann::json{{"retryCount", retryCount}}));
    notifyRateLimited();
}

void RateLimitHandlers::handleAuthError()
{
    SKLOG_ERROR(kComponent,
                "handleAuthError",
                "auth_error",
                "session_expired",
                "pause_rate_limit",
                "",
                m_context.correlationId(),
                nlohmann::json::object());
    m_context.flags().rateLimited = true;
    m_context.updateRateLimit([](RateLimitState &rate) {
        rate.mode = RateLimitMode::Paused;
    });
    m_context.dispatch(LifecycleActionType::PauseRateLimit);
    notifyRateLimited();
}

void RateLimitHandlers::resumeManual()
{
    m_context.flags().rateLimited = false;
    m_context.updateRateLimit([](RateLimitState &rate) {
        rate.mode = RateLimitMode::Normal;
    });
    m_context.dispatch(LifecycleActionType::ResumeManual);
    SKLOG_INFO(kComponent,
               "resumeManual",
               "rate_limit_resumed",
               "user_request",
               "resume_manual",
               "",
               m_context.correlationId(),
               nlohmann::json::object());
}

void RateLimitHandlers::notifyRateLimited()
{
    m_presentation.rateLimited(m_context.rateLimit(),
                               static_cast<int>(m_context.captures().size()));
}

} // namespace scrollkeep
