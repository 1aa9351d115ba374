#include "session/scroll_orchestrator.hpp"

#include <algorithm>

#include "common/logging.hpp"
#include "engine/lifecycle.hpp"
#include "engine/rate_limit_controller.hpp"

namespace scrollkeep {

namespace {

const QString kComponent = QStringLiteral("ScrollOrchestrator");

} // namespace

ScrollOrchestrator::ScrollOrchestrator(SessionContext &context,
                                       PageDriver &driver,
                                       PresentationHooks &presentation,
                                       const ExportConfig &config)
    : m_context(context)
    , m_driver(driver)
    , m_presentation(presentation)
    , m_config(config)
{
}

int ScrollOrchestrator::scrollCount() const
{
    return m_scrollCount;
}

int ScrollOrchestrator::noChangeCount() const
{
    return m_noChangeCount;
}

int ScrollOrchestrator::responsesCaptured() const
{
    return static_cast<int>(m_context.captures().size());
}

bool ScrollOrchestrator::limitReached() const
{
    return m_scrollCount >= m_config.maxScrolls
        || m_noChangeCount >= m_config.maxNoChangeSteps;
}

StepOutcome ScrollOrchestrator::step()
{
    SessionFlags &flags = m_context.flags();
    Scheduler &scheduler = m_context.scheduler();

    if (flags.abortRequested) {
        return StepOutcome::Finished;
    }

    if (flags.pendingConfirmation) {
        scheduler.sleep(m_config.pollIntervalMs);
        return StepOutcome::Continue;
    }

    if (m_driver.detectRouteChange()) {
        const std::string route = m_driver.currentRoute();
        SKLOG_WARN(kComponent,
                   "step",
                   "route_changed",
                   "navigation_detected",
                   "pause_for_confirmation",
                   "",
                   m_context.correlationId(),
                   (nlohmann::json{{"route", route}, {"responses", responsesCaptured()}}));
        flags.pendingConfirmation = true;
        m_presentation.routeChanged(route, responsesCaptured());
        scheduler.sleep(m_config.pollIntervalMs);
        return StepOutcome::Continue;
    }

    const RateLimitMode mode = m_context.rateLimit().mode;
    if (flags.rateLimited || mode == RateLimitMode::Paused) {
        scheduler.sleep(m_config.pollIntervalMs);
        return StepOutcome::Continue;
    }

    if (mode == RateLimitMode::Cooldown) {
        runCooldownCycle();
        return StepOutcome::Continue;
    }

    return captureStep();
}

void ScrollOrchestrator::runCooldownCycle()
{
    SessionFlags &flags = m_context.flags();
    Scheduler &scheduler = m_context.scheduler();

    m_context.dispatch(LifecycleActionType::EnterCooldown);
    const CooldownDetails details = getCooldownDetails(m_context.rateLimit(), scheduler.now());
    SKLOG_INFO(kComponent,
               "runCooldownCycle",
               "cooldown_started",
               QString::fromStdString(details.reason),
               "poll_until_elapsed",
               "",
               m_context.correlationId(),
               (nlohmann::json{{"durationMs", details.durationMs}}));

    m_presentation.showCooldown(details.durationMs, details.reason);
    const int64_t endTime = scheduler.now() + details.durationMs;
    while (scheduler.now() < endTime && flags.exporting && !flags.abortRequested
           && !flags.skipCooldown) {
        m_presentation.updateCooldown(std::max<int64_t>(0, endTime - scheduler.now()));
        scheduler.sleep(m_config.pollIntervalMs);
    }

    if (flags.skipCooldown.exchange(false)) {
        SKLOG_INFO(kComponent,
                   "runCooldownCycle",
                   "cooldown_skipped",
                   "user_request",
                   "skip_flag",
                   "",
                   m_context.correlationId(),
                   nlohmann::json::object());
    }

    m_presentation.hideCooldown();
    m_context.dispatch(LifecycleActionType::ExitCooldown);
    m_context.updateRateLimit([](RateLimitState &rate) {
        rate.mode = RateLimitMode::Normal;
    });
    m_noChangeCount = 0;
    m_context.markActivity();
    m_presentation.updateStatus("Resuming...");
    scheduler.sleep(m_config.pollIntervalMs);
}

StepOutcome ScrollOrchestrator::captureStep()
{
    SessionFlags &flags = m_context.flags();
    Scheduler &scheduler = m_context.scheduler();

    if (limitReached()) {
        return StepOutcome::Finished;
    }

    m_driver.triggerScrollStep();
    ++m_scrollCount;

    const int64_t delay = std::max(m_context.rateLimit().dynamicDelay, m_config.minStepDelayMs);
    scheduler.sleep(delay);

    if (m_driver.detectErrorState()) {
        SKLOG_WARN(kComponent,
                   "captureStep",
                   "page_error_state",
                   "provider_error",
                   "retry",
                   "",
                   m_context.correlationId(),
                   (nlohmann::json{{"scrollCount", m_scrollCount}}));
        m_presentation.updateStatus("Page error - retrying...");
        m_driver.retry();
        scheduler.sleep(m_config.errorRecoveryWaitMs);
        m_context.markActivity();
        m_noChangeCount = 0;
        return StepOutcome::Continue;
    }

    const int64_t extent = m_driver.currentExtent();
    const int responses = responsesCaptured();

    LooksDoneParams params;
    params.now = scheduler.now();
    params.idleThresholdMs = m_config.idleThresholdMs;
    params.scrollCount = m_scrollCount;
    params.responsesCaptured = responses;
    params.heightStable = extent == m_lastExtent;

    if (shouldPromptLooksDone(m_context.lifecycle(), params)) {
        if (!flags.pendingConfirmation.exchange(true)) {
            m_context.dispatch(LifecycleActionType::MarkPendingDone);
            SKLOG_INFO(kComponent,
                       "captureStep",
                       "looks_done",
                       "idle_and_stable",
                       "await_confirmation",
                       "",
                       m_context.correlationId(),
                       (nlohmann::json{{"responses", responses}, {"scrollCount", m_scrollCount}}));
            m_presentation.looksDone(responses);
        }
        scheduler.sleep(m_config.pollIntervalMs);
        return StepOutcome::Continue;
    }

    if (extent == m_lastExtent) {
        ++m_noChangeCount;
        if (m_noChangeCount > 3) {
            SKLOG_DEBUG(kComponent,
                        "captureStep",
                        "extent_unchanged",
                        "no_new_rows",
                        "count_stable_steps",
                        "",
                        m_context.correlationId(),
                        (nlohmann::json{{"attempt", m_noChangeCount},
                                        {"max", m_config.maxNoChangeSteps}}));
        }
    } else {
        m_noChangeCount = 0;
        m_lastExtent = extent;
    }

    m_presentation.updateProgress(m_scrollCount, responses);
    return limitReached() ? StepOutcome::Finished : StepOutcome::Continue;
}

int ScrollOrchestrator::run()
{
    SKLOG_INFO(kComponent,
               "run",
               "scroll_started",
               "export_requested",
               "step_loop",
               "",
               m_context.correlationId(),
               (nlohmann::json{{"maxScrolls", m_config.maxScrolls}}));

    while (step() == StepOutcome::Continue) {
    }

    const int responses = responsesCaptured();
    SKLOG_INFO(kComponent,
               "run",
               "scroll_finished",
               m_context.flags().abortRequested ? "aborted" : "limit_reached",
               "step_loop",
               "",
               m_context.correlationId(),
               (nlohmann::json{{"scrollCount", m_scrollCount},
                               {"noChangeCount", m_noChangeCount},
                               {"responses", responses}}));
    return responses;
}

} // namespace scrollkeep
