#include <QtTest/QtTest>

#include <memory>
#include <string>

#include <nlohmann/json.hpp>

#include "fake_stores.hpp"
#include "store/chunk_codec.hpp"

using scrollkeep::chunking::ChunkLayout;
using scrollkeep::chunking::ReadStatus;
using scrollkeep::testing::FakeKeyValueStore;
using scrollkeep::testing::FakeStorage;

namespace {

const ChunkLayout kLayout{"doc:manifest", "doc:chunk:", "doc"};

} // namespace

class ChunkCodecTests : public QObject
{
    Q_OBJECT
private slots:
    void testSplitSizes();
    void testSplitKeepsUtf8Sequences();
    void testParseManifest();
    void testWriteAndReadBack();
    void testShrinkingWriteDropsStaleChunks();
    void testMissingChunkIsCorrupt();
    void testNoManifest();
    void testClearRemovesEverything();
};

void ChunkCodecTests::testSplitSizes()
{
    QCOMPARE(scrollkeep::chunking::splitIntoChunks("", 4).size(), size_t(1));
    QCOMPARE(scrollkeep::chunking::splitIntoChunks("abcd", 4).size(), size_t(1));

    const auto chunks = scrollkeep::chunking::splitIntoChunks("abcdefghij", 4);
    QCOMPARE(chunks.size(), size_t(3));
    QCOMPARE(QString::fromStdString(chunks[2]), QStringLiteral("ij"));
}

void ChunkCodecTests::testSplitKeepsUtf8Sequences()
{
    // "aé€" is 1 + 2 + 3 bytes.
    const std::string text = "a\xC3\xA9\xE2\x82\xAC";
    const auto chunks = scrollkeep::chunking::splitIntoChunks(text, 4);
    QCOMPARE(chunks.size(), size_t(2));

    std::string joined;
    for (const auto &chunk : chunks) {
        QVERIFY(QString::fromUtf8(chunk.data(), static_cast<int>(chunk.size())).toUtf8()
                == QByteArray(chunk.data(), static_cast<int>(chunk.size())));
        joined += chunk;
    }
    QCOMPARE(QString::fromStdString(joined), QString::fromStdString(text));
}

void ChunkCodecTests::testParseManifest()
{
    using scrollkeep::chunking::parseManifest;
    QCOMPARE(parseManifest(nlohmann::json{{"version", 2}, {"chunkCount", 3}})->chunkCount, 3);
    QVERIFY(!parseManifest(nlohmann::json{{"version", 1}, {"chunkCount", 3}}).has_value());
    QVERIFY(!parseManifest(nlohmann::json{{"version", 2}, {"chunkCount", 0}}).has_value());
    QVERIFY(!parseManifest(nlohmann::json{{"version", 2}, {"chunkCount", 1.5}}).has_value());
    QVERIFY(!parseManifest(nlohmann::json{{"version", 2}, {"chunkCount", "3"}}).has_value());
    QVERIFY(!parseManifest(nlohmann::json{{"version", 2}, {"chunkCount", 2000000}}).has_value());
    QVERIFY(!parseManifest(nlohmann::json::array()).has_value());
}

void ChunkCodecTests::testWriteAndReadBack()
{
    auto storage = std::make_shared<FakeStorage>();
    FakeKeyValueStore store(storage);
    scrollkeep::KeyValueStore &base = store;

    const std::string payload(25, 'x');
    const int written = scrollkeep::chunking::writeChunked(base, kLayout, payload, 10, 0);
    QCOMPARE(written, 3);
    QVERIFY(storage->values.count("doc:chunk:2") == 1);
    QCOMPARE(storage->values["doc:manifest"]["chunkCount"].get<int>(), 3);

    const auto result = scrollkeep::chunking::readChunked(base, kLayout);
    QVERIFY(result.status == ReadStatus::Ok);
    QCOMPARE(QString::fromStdString(result.serialized), QString::fromStdString(payload));
}

void ChunkCodecTests::testShrinkingWriteDropsStaleChunks()
{
    auto storage = std::make_shared<FakeStorage>();
    FakeKeyValueStore store(storage);
    scrollkeep::KeyValueStore &base = store;

    scrollkeep::chunking::writeChunked(base, kLayout, std::string(40, 'a'), 10, 0);
    QVERIFY(storage->values.count("doc:chunk:3") == 1);

    scrollkeep::chunking::writeChunked(base, kLayout, std::string(5, 'b'), 10, 4);
    QVERIFY(storage->values.count("doc:chunk:0") == 1);
    QVERIFY(storage->values.count("doc:chunk:1") == 0);
    QVERIFY(storage->values.count("doc:chunk:3") == 0);

    const auto result = scrollkeep::chunking::readChunked(base, kLayout);
    QCOMPARE(QString::fromStdString(result.serialized), QStringLiteral("bbbbb"));
}

void ChunkCodecTests::testMissingChunkIsCorrupt()
{
    auto storage = std::make_shared<FakeStorage>();
    FakeKeyValueStore store(storage);
    scrollkeep::KeyValueStore &base = store;

    scrollkeep::chunking::writeChunked(base, kLayout, std::string(30, 'z'), 10, 0);
    storage->values.erase("doc:chunk:1");
    QVERIFY(scrollkeep::chunking::readChunked(base, kLayout).status == ReadStatus::Corrupt);

    storage->values["doc:chunk:1"] = 17;
    QVERIFY(scrollkeep::chunking::readChunked(base, kLayout).status == ReadStatus::Corrupt);
}

void ChunkCodecTests::testNoManifest()
{
    auto storage = std::make_shared<FakeStorage>();
    FakeKeyValueStore store(storage);
    scrollkeep::KeyValueStore &base = store;

    QVERIFY(scrollkeep::chunking::readChunked(base, kLayout).status == ReadStatus::NoManifest);

    storage->values["doc:manifest"] = nlohmann::json{{"version", 9}, {"chunkCount", 1}};
    QVERIFY(scrollkeep::chunking::readChunked(base, kLayout).status == ReadStatus::NoManifest);
}

void ChunkCodecTests::testClearRemovesEverything()
{
    auto storage = std::make_shared<FakeStorage>();
    FakeKeyValueStore store(storage);
    scrollkeep::KeyValueStore &base = store;

    scrollkeep::chunking::writeChunked(base, kLayout, std::string(30, 'q'), 10, 0);
    storage->values["unrelated"] = "keep";
    scrollkeep::chunking::clearChunked(base, kLayout);
    QCOMPARE(storage->values.size(), size_t(1));
    QVERIFY(storage->values.count("unrelated") == 1);
}

QTEST_MAIN(ChunkCodecTests)
#include "test_chunk_codec.moc"
