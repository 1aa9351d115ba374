#include <QtTest/QtTest>

#include <QTemporaryDir>

#include <nlohmann/json.hpp>

#include "fake_page.hpp"
#include "session/rate_limit_handlers.hpp"
#include "session/scheduler.hpp"
#include "session/session_context.hpp"
#include "test_fixtures.hpp"

using scrollkeep::LifecycleStatus;
using scrollkeep::RateLimitMode;
namespace fixtures = scrollkeep::testing;

class RateLimitHandlersTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void cleanupTestCase();
    void testInterceptedResponseCounts();
    void testBatchCooldownSwitchesMode();
    void testLowRemainingSwitchesMode();
    void testRateLimitHitPausesOnce();
    void testRateLimitHitIgnoredWhenIdle();
    void testCaptureClearsSoftLimit();
    void testAuthErrorPauses();
    void testResumeManual();

private:
    QTemporaryDir m_tempDir;
    QByteArray m_prevHome;
};

void RateLimitHandlersTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    m_prevHome = qgetenv("HOME");
    qputenv("HOME", m_tempDir.path().toUtf8());
}

void RateLimitHandlersTests::cleanupTestCase()
{
    if (m_prevHome.isEmpty()) {
        qunsetenv("HOME");
    } else {
        qputenv("HOME", m_prevHome);
    }
}

void RateLimitHandlersTests::testInterceptedResponseCounts()
{
    scrollkeep::VirtualScheduler scheduler(1000);
    scrollkeep::SessionContext context(scheduler);
    scrollkeep::testing::RecordingPresentation presentation;
    scrollkeep::RateLimitHandlers handlers(context, presentation);
    context.dispatch(scrollkeep::LifecycleActionType::Start);

    scheduler.advance(500);
    handlers.handleInterceptedResponse(
        fixtures::captureOf(nlohmann::json::object(), nlohmann::json{{"remaining", "120"}}));
    QCOMPARE(context.captures().size(), size_t(1));
    QCOMPARE(context.rateLimit().requestCount, 1);
    QCOMPARE(context.rateLimit().remaining, int64_t(120));
    QCOMPARE(context.lifecycle().lastActivityAt, int64_t(1500));

    // No quota info: captured, but not counted as a request.
    handlers.handleInterceptedResponse(fixtures::captureOf(nlohmann::json::object()));
    QCOMPARE(context.captures().size(), size_t(2));
    QCOMPARE(context.rateLimit().requestCount, 1);
}

void RateLimitHandlersTests::testBatchCooldownSwitchesMode()
{
    scrollkeep::VirtualScheduler scheduler;
    scrollkeep::SessionContext context(scheduler);
    scrollkeep::testing::RecordingPresentation presentation;
    scrollkeep::RateLimitHandlers handlers(context, presentation);
    context.dispatch(scrollkeep::LifecycleActionType::Start);

    const nlohmann::json info{{"remaining", 100}};
    for (int i = 0; i < 19; ++i) {
        handlers.applyRateLimitUpdate(info);
    }
    QVERIFY(context.rateLimit().mode == RateLimitMode::Normal);
    handlers.applyRateLimitUpdate(info);
    QVERIFY(context.rateLimit().mode == RateLimitMode::Cooldown);
    QVERIFY(context.lifecycle().status == LifecycleStatus::Cooldown);
}

void RateLimitHandlersTests::testLowRemainingSwitchesMode()
{
    scrollkeep::VirtualScheduler scheduler;
    scrollkeep::SessionContext context(scheduler);
    scrollkeep::testing::RecordingPresentation presentation;
    scrollkeep::RateLimitHandlers handlers(context, presentation);

    handlers.applyRateLimitUpdate(nlohmann::json{{"remaining", "4"}, {"reset", "1700000000"}});
    QVERIFY(context.rateLimit().mode == RateLimitMode::Cooldown);
    QCOMPARE(context.rateLimit().dynamicDelay, int64_t(8000));
}

void RateLimitHandlersTests::testRateLimitHitPausesOnce()
{
    scrollkeep::VirtualScheduler scheduler;
    scrollkeep::SessionContext context(scheduler);
    scrollkeep::testing::RecordingPresentation presentation;
    scrollkeep::RateLimitHandlers handlers(context, presentation);
    context.flags().exporting = true;
    context.dispatch(scrollkeep::LifecycleActionType::Start);

    handlers.handleRateLimitHit(nlohmann::json());
    handlers.handleRateLimitHit(nlohmann::json());

    QVERIFY(context.flags().rateLimited);
    QVERIFY(context.rateLimit().mode == RateLimitMode::Paused);
    QCOMPARE(context.rateLimit().retryCount, 1);
    QVERIFY(context.lifecycle().status == LifecycleStatus::PausedRateLimit);
    QCOMPARE(presentation.rateLimitedCalls, 1);
}

void RateLimitHandlersTests::testRateLimitHitIgnoredWhenIdle()
{
    scrollkeep::VirtualScheduler scheduler;
    scrollkeep::SessionContext context(scheduler);
    scrollkeep::testing::RecordingPresentation presentation;
    scrollkeep::RateLimitHandlers handlers(context, presentation);

    handlers.handleRateLimitHit(nlohmann::json());
    QVERIFY(!context.flags().rateLimited);
    QVERIFY(context.rateLimit().mode == RateLimitMode::Normal);
    QCOMPARE(presentation.rateLimitedCalls, 0);
}

void RateLimitHandlersTests::testCaptureClearsSoftLimit()
{
    scrollkeep::VirtualScheduler scheduler;
    scrollkeep::SessionContext context(scheduler);
    scrollkeep::testing::RecordingPresentation presentation;
    scrollkeep::RateLimitHandlers handlers(context, presentation);

    // Flag set while the mode already moved on: the next capture clears it.
    context.flags().rateLimited = true;
    context.updateRateLimit([](scrollkeep::RateLimitState &rate) {
        rate.mode = RateLimitMode::Normal;
        rate.retryCount = 3;
    });
    handlers.handleInterceptedResponse(fixtures::captureOf(nlohmann::json::object()));
    QVERIFY(!context.flags().rateLimited);
    QCOMPARE(context.rateLimit().retryCount, 0);

    // A hard pause stays in place.
    context.flags().rateLimited = true;
    context.updateRateLimit([](scrollkeep::RateLimitState &rate) {
        rate.mode = RateLimitMode::Paused;
    });
    handlers.handleInterceptedResponse(fixtures::captureOf(nlohmann::json::object()));
    QVERIFY(context.flags().rateLimited);
}

void RateLimitHandlersTests::testAuthErrorPauses()
{
    scrollkeep::VirtualScheduler scheduler;
    scrollkeep::SessionContext context(scheduler);
    scrollkeep::testing::RecordingPresentation presentation;
    scrollkeep::RateLimitHandlers handlers(context, presentation);

    handlers.handleAuthError();
    QVERIFY(context.flags().rateLimited);
    QVERIFY(context.rateLimit().mode == RateLimitMode::Paused);
    QVERIFY(context.lifecycle().status == LifecycleStatus::PausedRateLimit);
    QCOMPARE(presentation.rateLimitedCalls, 1);
}

void RateLimitHandlersTests::testResumeManual()
{
    scrollkeep::VirtualScheduler scheduler(100);
    scrollkeep::SessionContext context(scheduler);
    scrollkeep::testing::RecordingPresentation presentation;
    scrollkeep::RateLimitHandlers handlers(context, presentation);
    context.flags().exporting = true;

    handlers.handleRateLimitHit(nlohmann::json());
    scheduler.advance(900);
    handlers.resumeManual();
    QVERIFY(!context.flags().rateLimited);
    QVERIFY(context.rateLimit().mode == RateLimitMode::Normal);
    QVERIFY(context.lifecycle().status == LifecycleStatus::Running);
    QCOMPARE(context.lifecycle().lastActivityAt, int64_t(1000));
}

QTEST_MAIN(RateLimitHandlersTests)
#include "test_rate_limit_handlers.moc"
