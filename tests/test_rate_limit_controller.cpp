#include <QtTest/QtTest>

#include <nlohmann/json.hpp>

#include "engine/rate_limit_controller.hpp"

using scrollkeep::RateLimitMode;
using scrollkeep::RateLimitState;

class RateLimitControllerTests : public QObject
{
    Q_OBJECT
private slots:
    void testInitialState();
    void testParseQuotaValue();
    void testDelayTiers();
    void testNullInfoChangesNothing();
    void testJunkInfoStillCounts();
    void testBatchCooldownEveryTwentyRequests();
    void testLowRemainingTriggers();
    void testDefaultCooldownDetails();
    void testLowRemainingCooldownDetails();
    void testResetPassedUsesDefault();
    void testResetForRun();
};

void RateLimitControllerTests::testInitialState()
{
    const RateLimitState state = scrollkeep::createRateLimitState();
    QVERIFY(state.mode == RateLimitMode::Normal);
    QCOMPARE(state.requestCount, 0);
    QCOMPARE(state.limit, int64_t(150));
    QCOMPARE(state.remaining, int64_t(150));
    QCOMPARE(state.resetTime, int64_t(0));
    QCOMPARE(state.retryCount, 0);
    QCOMPARE(state.dynamicDelay, int64_t(2500));
}

void RateLimitControllerTests::testParseQuotaValue()
{
    using scrollkeep::ratelimit::parseQuotaValue;
    QCOMPARE(parseQuotaValue(nlohmann::json("42")).value_or(-1), int64_t(42));
    QCOMPARE(parseQuotaValue(nlohmann::json(42)).value_or(-1), int64_t(42));
    QCOMPARE(parseQuotaValue(nlohmann::json("17abc")).value_or(-1), int64_t(17));
    QCOMPARE(parseQuotaValue(nlohmann::json(9.9)).value_or(-1), int64_t(9));
    QVERIFY(!parseQuotaValue(nlohmann::json()).has_value());
    QVERIFY(!parseQuotaValue(nlohmann::json("abc")).has_value());
    QVERIFY(!parseQuotaValue(nlohmann::json::object()).has_value());
    QVERIFY(!parseQuotaValue(nlohmann::json(true)).has_value());
}

void RateLimitControllerTests::testDelayTiers()
{
    using scrollkeep::ratelimit::dynamicDelayFor;
    QCOMPARE(dynamicDelayFor(0), int64_t(8000));
    QCOMPARE(dynamicDelayFor(9), int64_t(8000));
    QCOMPARE(dynamicDelayFor(10), int64_t(5000));
    QCOMPARE(dynamicDelayFor(19), int64_t(5000));
    QCOMPARE(dynamicDelayFor(20), int64_t(3000));
    QCOMPARE(dynamicDelayFor(150), int64_t(3000));
}

void RateLimitControllerTests::testNullInfoChangesNothing()
{
    RateLimitState state = scrollkeep::createRateLimitState();
    const auto result = scrollkeep::applyRateLimitInfo(state, nlohmann::json(), 1000);
    QVERIFY(!result.triggeredBatchCooldown);
    QVERIFY(!result.triggeredLowRemainingCooldown);
    QCOMPARE(state.requestCount, 0);
    QCOMPARE(state.lastRequestTime, int64_t(0));
    QCOMPARE(state.dynamicDelay, int64_t(2500));
}

void RateLimitControllerTests::testJunkInfoStillCounts()
{
    RateLimitState state = scrollkeep::createRateLimitState();
    scrollkeep::applyRateLimitInfo(
        state, nlohmann::json{{"limit", "x"}, {"remaining", nullptr}, {"reset", "soon"}}, 5000);
    QCOMPARE(state.requestCount, 1);
    QCOMPARE(state.limit, int64_t(150));
    QCOMPARE(state.remaining, int64_t(150));
    QCOMPARE(state.resetTime, int64_t(0));
    QCOMPARE(state.lastRequestTime, int64_t(5000));
    QCOMPARE(state.dynamicDelay, int64_t(3000));
}

void RateLimitControllerTests::testBatchCooldownEveryTwentyRequests()
{
    RateLimitState state = scrollkeep::createRateLimitState();
    const nlohmann::json info{{"limit", "150"}, {"remaining", "100"}, {"reset", "1700000000"}};

    for (int i = 1; i < 20; ++i) {
        const auto result = scrollkeep::applyRateLimitInfo(state, info, i * 1000);
        QVERIFY(!result.triggeredBatchCooldown);
    }
    const auto twentieth = scrollkeep::applyRateLimitInfo(state, info, 20000);
    QVERIFY(twentieth.triggeredBatchCooldown);
    QVERIFY(!twentieth.triggeredLowRemainingCooldown);
    QCOMPARE(state.requestCount, 20);
    QCOMPARE(state.remaining, int64_t(100));
    QCOMPARE(state.resetTime, int64_t(1700000000));

    const auto next = scrollkeep::applyRateLimitInfo(state, info, 21000);
    QVERIFY(!next.triggeredBatchCooldown);
}

void RateLimitControllerTests::testLowRemainingTriggers()
{
    RateLimitState state = scrollkeep::createRateLimitState();
    auto result = scrollkeep::applyRateLimitInfo(state, nlohmann::json{{"remaining", 10}}, 1);
    QVERIFY(!result.triggeredLowRemainingCooldown);
    QCOMPARE(state.dynamicDelay, int64_t(5000));

    result = scrollkeep::applyRateLimitInfo(state, nlohmann::json{{"remaining", "9"}}, 2);
    QVERIFY(result.triggeredLowRemainingCooldown);
    QCOMPARE(state.dynamicDelay, int64_t(8000));
}

void RateLimitControllerTests::testDefaultCooldownDetails()
{
    RateLimitState state = scrollkeep::createRateLimitState();
    state.requestCount = 40;
    const auto details = scrollkeep::getCooldownDetails(state, 1000);
    QCOMPARE(details.durationMs, int64_t(180000));
    QCOMPARE(QString::fromStdString(details.reason), QStringLiteral("batch pacing (40 requests)"));
}

void RateLimitControllerTests::testLowRemainingCooldownDetails()
{
    RateLimitState state = scrollkeep::createRateLimitState();
    state.remaining = 3;
    state.resetTime = 1000;
    const auto details = scrollkeep::getCooldownDetails(state, 940000);
    QCOMPARE(details.durationMs, int64_t(60000 + 10000));
    const QString reason = QString::fromStdString(details.reason);
    QVERIFY(reason.startsWith(QStringLiteral("API limit low (3 left), reset at ")));
}

void RateLimitControllerTests::testResetPassedUsesDefault()
{
    RateLimitState state = scrollkeep::createRateLimitState();
    state.remaining = 3;
    state.resetTime = 1000;
    const auto details = scrollkeep::getCooldownDetails(state, 2000000);
    QCOMPARE(details.durationMs, int64_t(180000));
    QVERIFY(QString::fromStdString(details.reason).startsWith(QStringLiteral("batch pacing")));
}

void RateLimitControllerTests::testResetForRun()
{
    RateLimitState state = scrollkeep::createRateLimitState();
    state.mode = RateLimitMode::Paused;
    state.requestCount = 33;
    state.retryCount = 2;
    state.remaining = 4;
    state.limit = 500;
    state.resetTime = 1234;
    state.lastRequestTime = 99;
    state.dynamicDelay = 8000;

    scrollkeep::resetRateLimitStateForRun(state);
    QVERIFY(state.mode == RateLimitMode::Normal);
    QCOMPARE(state.requestCount, 0);
    QCOMPARE(state.retryCount, 0);
    QCOMPARE(state.remaining, int64_t(150));
    QCOMPARE(state.dynamicDelay, int64_t(3000));
    QCOMPARE(state.limit, int64_t(500));
    QCOMPARE(state.resetTime, int64_t(1234));
    QCOMPARE(state.lastRequestTime, int64_t(99));
}

QTEST_MAIN(RateLimitControllerTests)
#include "test_rate_limit_controller.moc"
