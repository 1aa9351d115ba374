#include <QtTest/QtTest>

#include <nlohmann/json.hpp>

#include "engine/resume_link.hpp"
#include "test_fixtures.hpp"

namespace fixtures = scrollkeep::testing;

class ResumeLinkTests : public QObject
{
    Q_OBJECT
private slots:
    void testExtractTweetsFromExportData();
    void testParseResumeInput();
    void testUntilDateIsDayAfterOldest();
    void testUntilDateUnparsable();
    void testBuildQuery();
    void testBuildUrl();
    void testUsernameFromRoute();
};

void ResumeLinkTests::testExtractTweetsFromExportData()
{
    const nlohmann::json rows = nlohmann::json::array({fixtures::makeRow("1", "2024-01-01 10:00:00")});
    QCOMPARE(scrollkeep::extractTweetsFromExportData(rows).size(), size_t(1));
    QCOMPARE(scrollkeep::extractTweetsFromExportData(nlohmann::json{{"items", rows}}).size(), size_t(1));
    QCOMPARE(scrollkeep::extractTweetsFromExportData(nlohmann::json{{"tweets", rows}}).size(), size_t(1));
    QVERIFY(scrollkeep::extractTweetsFromExportData(nlohmann::json{{"items", "nope"}}).empty());
    QVERIFY(scrollkeep::extractTweetsFromExportData(nlohmann::json(5)).empty());
}

void ResumeLinkTests::testParseResumeInput()
{
    nlohmann::json data;
    data["items"] = nlohmann::json::array({fixtures::makeRow("1", "2024-01-01 10:00:00")});
    data["meta"]["username"] = " @Alice ";

    auto input = scrollkeep::parseResumeInput(data);
    QCOMPARE(input.tweets.size(), size_t(1));
    QVERIFY(input.username.has_value());
    QCOMPARE(QString::fromStdString(*input.username), QStringLiteral("alice"));

    nlohmann::json legacy;
    legacy["tweets"] = data["items"];
    legacy["metadata"]["username"] = "bob";
    input = scrollkeep::parseResumeInput(legacy);
    QCOMPARE(QString::fromStdString(input.username.value_or("")), QStringLiteral("bob"));

    input = scrollkeep::parseResumeInput(data["items"]);
    QVERIFY(!input.username.has_value());
    QVERIFY(input.meta.is_null());
}

void ResumeLinkTests::testUntilDateIsDayAfterOldest()
{
    const scrollkeep::TweetList rows = {
        fixtures::makeRow("1", "2024-02-29 23:10:00"),
        fixtures::makeRow("2", "2024-03-05 08:00:00"),
        fixtures::makeRow("3", "2024-03-01 12:00:00"),
    };
    QCOMPARE(QString::fromStdString(scrollkeep::resumeUntilDate(rows).value_or("")),
             QStringLiteral("2024-03-01"));

    const scrollkeep::TweetList yearEnd = {fixtures::makeRow("9", "2023-12-31 18:00:00")};
    QCOMPARE(QString::fromStdString(scrollkeep::resumeUntilDate(yearEnd).value_or("")),
             QStringLiteral("2024-01-01"));
}

void ResumeLinkTests::testUntilDateUnparsable()
{
    QVERIFY(!scrollkeep::resumeUntilDate({}).has_value());

    scrollkeep::TweetItem row = fixtures::makeRow("1", "whenever");
    QVERIFY(!scrollkeep::resumeUntilDate({row}).has_value());

    row.erase("created_at");
    QVERIFY(!scrollkeep::resumeUntilDate({row}).has_value());
}

void ResumeLinkTests::testBuildQuery()
{
    QCOMPARE(QString::fromStdString(scrollkeep::buildResumeQuery("", "alice", "2024-03-01")),
             QStringLiteral("from:alice until:2024-03-01"));
    QCOMPARE(QString::fromStdString(
                 scrollkeep::buildResumeQuery("from:alice -filter:replies", "alice", "2024-03-01")),
             QStringLiteral("from:alice -filter:replies until:2024-03-01"));
    QCOMPARE(QString::fromStdString(
                 scrollkeep::buildResumeQuery("from:alice until:2024-06-01 lang:en", "alice", "2024-03-01")),
             QStringLiteral("from:alice until:2024-03-01 lang:en"));
}

void ResumeLinkTests::testBuildUrl()
{
    const QString url = QString::fromStdString(
        scrollkeep::buildResumeUrl("from:alice until:2024-03-01"));
    QCOMPARE(url, QStringLiteral("https://x.com/search?q=from%3Aalice%20until%3A2024-03-01"
                                 "&src=typed_query&f=live&scrollkeep_resume=1"));
}

void ResumeLinkTests::testUsernameFromRoute()
{
    QCOMPARE(QString::fromStdString(scrollkeep::usernameFromRoute("/Alice").value_or("")),
             QStringLiteral("alice"));
    QCOMPARE(QString::fromStdString(scrollkeep::usernameFromRoute("/alice/with_replies").value_or("")),
             QStringLiteral("alice"));
    QCOMPARE(QString::fromStdString(
                 scrollkeep::usernameFromRoute("/search?q=from%3Abob%20until%3A2024-01-01&f=live")
                     .value_or("")),
             QStringLiteral("bob"));
    QVERIFY(!scrollkeep::usernameFromRoute("/home").has_value());
    QVERIFY(!scrollkeep::usernameFromRoute("/explore/tabs").has_value());
    QVERIFY(!scrollkeep::usernameFromRoute("/search?q=cats").has_value());
    QVERIFY(!scrollkeep::usernameFromRoute("/").has_value());
}

QTEST_MAIN(ResumeLinkTests)
#include "test_resume_link.moc"
