#include <QtTest/QtTest>

#include <nlohmann/json.hpp>

#include "engine/export_meta.hpp"

using scrollkeep::BuildMetaInput;

class ExportMetaTests : public QObject
{
    Q_OBJECT
private slots:
    void testFreshRun();
    void testMergedRunFoldsPreviousMeta();
    void testLegacyPreviousKeys();
    void testNonPositiveReportedCountsIgnored();
    void testPayloadShape();
    void testFilename();
};

void ExportMetaTests::testFreshRun()
{
    BuildMetaInput input;
    input.username = "alice";
    input.userId = "42";
    input.name = "Alice";
    input.startedAt = "2024-05-01T10:00:00.000Z";
    input.completedAt = "2024-05-01T10:30:00.000Z";
    input.newCollectedCount = 12;
    input.reportedCountCurrent = 100;
    input.collectionMethod = "scroll-interception";
    input.scrollResponsesCapturedCurrent = 7;

    const auto meta = scrollkeep::buildConsolidatedMeta(input);
    QCOMPARE(QString::fromStdString(meta["username"].get<std::string>()), QStringLiteral("alice"));
    QCOMPARE(QString::fromStdString(meta["user_id"].get<std::string>()), QStringLiteral("42"));
    QCOMPARE(QString::fromStdString(meta["name"].get<std::string>()), QStringLiteral("Alice"));
    QCOMPARE(meta["collected_count"].get<int>(), 12);
    QCOMPARE(meta["new_collected_count"].get<int>(), 12);
    QCOMPARE(meta["previous_collected_count"].get<int>(), 0);
    QCOMPARE(meta["reported_count"].get<int>(), 100);
    QCOMPARE(meta["scroll_responses_captured"].get<int>(), 7);
    QCOMPARE(QString::fromStdString(meta["export_started_at"].get<std::string>()),
             QStringLiteral("2024-05-01T10:00:00.000Z"));
    QVERIFY(!meta.contains("merge_info"));
    QVERIFY(!meta.contains("previous_export_started_at"));
}

void ExportMetaTests::testMergedRunFoldsPreviousMeta()
{
    BuildMetaInput input;
    input.username = "alice";
    input.startedAt = "2024-05-02T10:00:00.000Z";
    input.completedAt = "2024-05-02T10:30:00.000Z";
    input.newCollectedCount = 5;
    input.previousCollectedCount = 20;
    input.reportedCountCurrent = 90;
    input.previousMeta = {
        {"export_started_at", "2024-05-01T09:00:00.000Z"},
        {"export_completed_at", "2024-05-01T09:45:00.000Z"},
        {"reported_count", 120},
        {"scroll_responses_captured", 30}
    };
    input.collectionMethod = "scroll-interception-resumed";
    input.scrollResponsesCapturedCurrent = 4;
    scrollkeep::MergeInfo info;
    info.previousCount = 20;
    info.newCount = 5;
    info.duplicatesRemoved = 2;
    info.finalCount = 23;
    input.mergeInfo = info;

    const auto meta = scrollkeep::buildConsolidatedMeta(input);
    QCOMPARE(meta["collected_count"].get<int>(), 23);
    QCOMPARE(meta["reported_count"].get<int>(), 120);
    QCOMPARE(meta["scroll_responses_captured"].get<int>(), 34);
    QCOMPARE(QString::fromStdString(meta["export_started_at"].get<std::string>()),
             QStringLiteral("2024-05-01T09:00:00.000Z"));
    QCOMPARE(QString::fromStdString(meta["previous_export_completed_at"].get<std::string>()),
             QStringLiteral("2024-05-01T09:45:00.000Z"));
    QCOMPARE(meta["merge_info"]["duplicates_removed"].get<int>(), 2);
    QCOMPARE(meta["merge_info"]["final_count"].get<int>(), 23);
}

void ExportMetaTests::testLegacyPreviousKeys()
{
    BuildMetaInput input;
    input.username = "alice";
    input.startedAt = "2024-05-02T10:00:00.000Z";
    input.previousMeta = {
        {"started_at", "2024-04-01T09:00:00.000Z"},
        {"finished_at", "2024-04-01T09:30:00.000Z"},
        {"total_tweets_reported", 55}
    };

    const auto meta = scrollkeep::buildConsolidatedMeta(input);
    QCOMPARE(meta["reported_count"].get<int>(), 55);
    QCOMPARE(QString::fromStdString(meta["previous_export_started_at"].get<std::string>()),
             QStringLiteral("2024-04-01T09:00:00.000Z"));
    QCOMPARE(QString::fromStdString(meta["export_started_at"].get<std::string>()),
             QStringLiteral("2024-04-01T09:00:00.000Z"));
}

void ExportMetaTests::testNonPositiveReportedCountsIgnored()
{
    BuildMetaInput input;
    input.username = "alice";
    input.startedAt = "2024-05-02T10:00:00.000Z";
    input.reportedCountCurrent = 0;
    input.previousMeta = {{"reported_count", -3}};

    const auto meta = scrollkeep::buildConsolidatedMeta(input);
    QVERIFY(meta["reported_count"].is_null());
}

void ExportMetaTests::testPayloadShape()
{
    const nlohmann::json meta = {{"username", "alice"}};
    const scrollkeep::TweetList rows = {nlohmann::json{{"id", "1"}}};
    const auto payload = scrollkeep::createExportPayload(meta, rows);
    QVERIFY(payload.is_object());
    QCOMPARE(payload.size(), size_t(2));
    QCOMPARE(payload["items"].size(), size_t(1));
    QCOMPARE(QString::fromStdString(payload["meta"]["username"].get<std::string>()),
             QStringLiteral("alice"));
}

void ExportMetaTests::testFilename()
{
    // 2024-05-01T12:00:00Z
    const int64_t now = 1714564800000;
    QCOMPARE(QString::fromStdString(scrollkeep::exportFilename("alice", false, now)),
             QStringLiteral("alice_tweets_scroll_2024-05-01.json"));
    QCOMPARE(QString::fromStdString(scrollkeep::exportFilename("alice", true, now)),
             QStringLiteral("alice_tweets_scroll_merged_2024-05-01.json"));
}

QTEST_MAIN(ExportMetaTests)
#include "test_export_meta.moc"
