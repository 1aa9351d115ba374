#include <QtTest/QtTest>

#include <nlohmann/json.hpp>

#include "engine/merge_engine.hpp"
#include "test_fixtures.hpp"

using scrollkeep::TweetItem;
using scrollkeep::TweetList;
namespace fixtures = scrollkeep::testing;

namespace {

QString idAt(const TweetList &tweets, size_t index)
{
    return QString::fromStdString(tweets.at(index)["id"].get<std::string>());
}

} // namespace

class MergeEngineTests : public QObject
{
    Q_OBJECT
private slots:
    void testSortNewestFirst();
    void testSortIsStable();
    void testMergeKeys();
    void testEmptyPreviousSkipsMerge();
    void testDisjointMerge();
    void testOverlapCountsDuplicates();
    void testRicherCopyWins();
    void testTieKeepsNewCopy();
    void testIdlessRowsNeverCollide();
};

void MergeEngineTests::testSortNewestFirst()
{
    const TweetList sorted = scrollkeep::sortTweetsByDateDesc({
        fixtures::makeRow("a", "2024-01-01 10:00:00"),
        fixtures::makeRow("b", "2024-03-01 10:00:00"),
        fixtures::makeRow("c", "not a date"),
        fixtures::makeRow("d", "2024-02-01 10:00:00"),
    });
    QCOMPARE(idAt(sorted, 0), QStringLiteral("b"));
    QCOMPARE(idAt(sorted, 1), QStringLiteral("d"));
    QCOMPARE(idAt(sorted, 2), QStringLiteral("a"));
    QCOMPARE(idAt(sorted, 3), QStringLiteral("c"));
}

void MergeEngineTests::testSortIsStable()
{
    const TweetList sorted = scrollkeep::sortTweetsByDateDesc({
        fixtures::makeRow("first", "2024-01-01 10:00:00"),
        fixtures::makeRow("second", "2024-01-01 10:00:00"),
        fixtures::makeRow("third", "2024-01-01 10:00:00"),
    });
    QCOMPARE(idAt(sorted, 0), QStringLiteral("first"));
    QCOMPARE(idAt(sorted, 1), QStringLiteral("second"));
    QCOMPARE(idAt(sorted, 2), QStringLiteral("third"));
}

void MergeEngineTests::testMergeKeys()
{
    const TweetItem withId = fixtures::makeRow("77", "2024-01-01 10:00:00");
    QCOMPARE(QString::fromStdString(scrollkeep::tweetMergeKey(withId, "new", 3)),
             QStringLiteral("id:77"));

    TweetItem withoutId = withId;
    withoutId.erase("id");
    QCOMPARE(QString::fromStdString(scrollkeep::tweetMergeKey(withoutId, "previous", 4)),
             QStringLiteral("previous:4:2024-01-01 10:00:00:row"));
}

void MergeEngineTests::testEmptyPreviousSkipsMerge()
{
    const auto result = scrollkeep::mergeTweets({
        fixtures::makeRow("1", "2024-01-01 10:00:00"),
        fixtures::makeRow("2", "2024-01-02 10:00:00"),
    }, {});
    QVERIFY(!result.mergeInfo.has_value());
    QCOMPARE(result.tweets.size(), size_t(2));
    QCOMPARE(idAt(result.tweets, 0), QStringLiteral("2"));
}

void MergeEngineTests::testDisjointMerge()
{
    const auto result = scrollkeep::mergeTweets(
        {fixtures::makeRow("3", "2024-01-03 10:00:00")},
        {fixtures::makeRow("1", "2024-01-01 10:00:00"), fixtures::makeRow("2", "2024-01-02 10:00:00")});

    QVERIFY(result.mergeInfo.has_value());
    QCOMPARE(result.mergeInfo->previousCount, 2);
    QCOMPARE(result.mergeInfo->newCount, 1);
    QCOMPARE(result.mergeInfo->duplicatesRemoved, 0);
    QCOMPARE(result.mergeInfo->finalCount, 3);
    QCOMPARE(idAt(result.tweets, 0), QStringLiteral("3"));
    QCOMPARE(idAt(result.tweets, 2), QStringLiteral("1"));
}

void MergeEngineTests::testOverlapCountsDuplicates()
{
    const auto result = scrollkeep::mergeTweets(
        {fixtures::makeRow("1", "2024-01-01 10:00:00"), fixtures::makeRow("2", "2024-01-02 10:00:00")},
        {fixtures::makeRow("2", "2024-01-02 10:00:00"), fixtures::makeRow("3", "2024-01-03 10:00:00")});

    QVERIFY(result.mergeInfo.has_value());
    QCOMPARE(result.mergeInfo->duplicatesRemoved, 1);
    QCOMPARE(result.mergeInfo->finalCount, 3);
    QCOMPARE(result.mergeInfo->finalCount,
             result.mergeInfo->newCount + result.mergeInfo->previousCount
                 - result.mergeInfo->duplicatesRemoved);
}

void MergeEngineTests::testRicherCopyWins()
{
    TweetItem richer = fixtures::makeRow("5", "2024-01-05 10:00:00", "old text");
    richer["view_count"] = "1000";
    richer["media"] = nlohmann::json::array({nlohmann::json{{"type", "photo"}}});

    const auto result = scrollkeep::mergeTweets(
        {fixtures::makeRow("5", "2024-01-05 10:00:00", "new text")}, {richer});
    QCOMPARE(result.tweets.size(), size_t(1));
    QCOMPARE(QString::fromStdString(result.tweets[0]["text"].get<std::string>()),
             QStringLiteral("old text"));
    QVERIFY(result.tweets[0].contains("media"));
}

void MergeEngineTests::testTieKeepsNewCopy()
{
    const auto result = scrollkeep::mergeTweets(
        {fixtures::makeRow("6", "2024-01-06 10:00:00", "new text")},
        {fixtures::makeRow("6", "2024-01-06 10:00:00", "old text")});
    QCOMPARE(result.tweets.size(), size_t(1));
    QCOMPARE(QString::fromStdString(result.tweets[0]["text"].get<std::string>()),
             QStringLiteral("new text"));
}

void MergeEngineTests::testIdlessRowsNeverCollide()
{
    TweetItem a = fixtures::makeRow("x", "2024-01-01 10:00:00", "same");
    a.erase("id");
    TweetItem b = a;

    const auto result = scrollkeep::mergeTweets({a}, {b});
    QCOMPARE(result.tweets.size(), size_t(2));
    QCOMPARE(result.mergeInfo->duplicatesRemoved, 0);
}

QTEST_MAIN(MergeEngineTests)
#include "test_merge_engine.moc"
