#include <QtTest/QtTest>
#include "core/retrieval/hybrid_retriever.h"

#include "fakes.h"

using namespace lc;
using namespace lc::test;

class TestHybridRetriever : public QObject {
    Q_OBJECT

private slots:
    void testBothSourcesAgreeOnTopRecord();
    void testKeywordThrowsVectorStillAnswers();
    void testKeywordUnavailableIsAbsorbed();
    void testEmbeddingFailureDegradesToKeyword();
    void testVectorBackendErrorDegradesToKeyword();
    void testBothSourcesEmptyReturnsEmpty();
    void testEmbeddingDimensionMismatchIsFatal();
    void testIndexDimensionMismatchIsFatal();
    void testResultsCappedAtK();
    void testNonPositiveKReturnsEmpty();
    void testMissingRecordsAreDropped();
    void testHydrationFailureIsInternalError();
    void testFusedOrderPreserved();
    void testReportJson();
};

void TestHybridRetriever::testBothSourcesAgreeOnTopRecord()
{
    FakeKeywordSource keyword;
    FakeVectorSource vectors(64);
    FakeEmbeddingProvider embedder(64);
    FakeRecordSource records;
    records.add(1, 1, 1, 10, QStringLiteral("Tax rates for group III assets are set annually."));
    keyword.hits = hitsFor({1});
    vectors.hits = hitsFor({1});

    HybridRetriever retriever(keyword, vectors, embedder, records);
    const RetrievalReport report = retriever.retrieveDetailed(QStringLiteral("group III"), 5);
    QVERIFY(report.ok());
    QCOMPARE(report.fused.size(), size_t(1));
    QVERIFY(qFuzzyCompare(report.fused[0].fusedScore, 2.0 / 61.0));

    const auto result = retriever.retrieve(QStringLiteral("group III"), 5);
    QVERIFY(result.has_value());
    QCOMPARE(result->size(), size_t(1));
    QCOMPARE(result->front().id, int64_t(1));
    QVERIFY(result->front().location == (ParagraphLocation{1, 1, 10}));
    QCOMPARE(keyword.lastQuery, QStringLiteral("group III"));
}

void TestHybridRetriever::testKeywordThrowsVectorStillAnswers()
{
    FakeKeywordSource keyword;
    keyword.throwOnSearch = true;
    FakeVectorSource vectors(64);
    vectors.hits = hitsFor({7});
    FakeEmbeddingProvider embedder(64);
    FakeRecordSource records;
    records.add(7, 2, 3, 4, QStringLiteral("Paragraph seven"));

    HybridRetriever retriever(keyword, vectors, embedder, records);
    const RetrievalReport report = retriever.retrieveDetailed(QStringLiteral("anything"), 5);
    QVERIFY(report.ok());
    QVERIFY(!report.keywordAvailable);
    QVERIFY(report.vectorAvailable);
    QCOMPARE(report.records.size(), size_t(1));
    QCOMPARE(report.records[0].id, int64_t(7));
}

void TestHybridRetriever::testKeywordUnavailableIsAbsorbed()
{
    FakeKeywordSource keyword;
    keyword.fail = true;
    FakeVectorSource vectors(64);
    vectors.hits = hitsFor({3});
    FakeEmbeddingProvider embedder(64);
    FakeRecordSource records;
    records.add(3, 1, 1, 1, QStringLiteral("three"));

    HybridRetriever retriever(keyword, vectors, embedder, records);
    const auto result = retriever.retrieve(QStringLiteral("q"), 5);
    QVERIFY(result.has_value());
    QCOMPARE(result->size(), size_t(1));
    QCOMPARE(result->front().id, int64_t(3));
}

void TestHybridRetriever::testEmbeddingFailureDegradesToKeyword()
{
    FakeKeywordSource keyword;
    keyword.hits = hitsFor({4, 5});
    FakeVectorSource vectors(64);
    vectors.hits = hitsFor({9});
    FakeEmbeddingProvider embedder(64);
    embedder.fail = true;
    FakeRecordSource records;
    records.add(4, 1, 1, 4, QStringLiteral("four"));
    records.add(5, 1, 1, 5, QStringLiteral("five"));
    records.add(9, 1, 1, 9, QStringLiteral("nine"));

    HybridRetriever retriever(keyword, vectors, embedder, records);
    const RetrievalReport report = retriever.retrieveDetailed(QStringLiteral("q"), 5);
    QVERIFY(report.ok());
    QVERIFY(!report.vectorAvailable);
    QCOMPARE(vectors.calls.load(), 0);
    QCOMPARE(report.records.size(), size_t(2));
    QCOMPARE(report.records[0].id, int64_t(4));
    QCOMPARE(report.records[1].id, int64_t(5));
}

void TestHybridRetriever::testVectorBackendErrorDegradesToKeyword()
{
    FakeKeywordSource keyword;
    keyword.hits = hitsFor({4});
    FakeVectorSource vectors(64);
    vectors.status = VectorSearchStatus::BackendError;
    FakeEmbeddingProvider embedder(64);
    FakeRecordSource records;
    records.add(4, 1, 1, 4, QStringLiteral("four"));

    HybridRetriever retriever(keyword, vectors, embedder, records);
    const RetrievalReport report = retriever.retrieveDetailed(QStringLiteral("q"), 5);
    QVERIFY(report.ok());
    QVERIFY(!report.vectorAvailable);
    QCOMPARE(report.records.size(), size_t(1));
}

void TestHybridRetriever::testBothSourcesEmptyReturnsEmpty()
{
    FakeKeywordSource keyword;
    FakeVectorSource vectors(64);
    FakeEmbeddingProvider embedder(64);
    FakeRecordSource records;

    HybridRetriever retriever(keyword, vectors, embedder, records);
    const auto result = retriever.retrieve(QStringLiteral("nothing matches"), 5);
    QVERIFY(result.has_value());
    QVERIFY(result->empty());

    // Both sources failing is still an empty answer, not an error.
    keyword.fail = true;
    embedder.fail = true;
    const auto degraded = retriever.retrieve(QStringLiteral("nothing matches"), 5);
    QVERIFY(degraded.has_value());
    QVERIFY(degraded->empty());
}

void TestHybridRetriever::testEmbeddingDimensionMismatchIsFatal()
{
    FakeKeywordSource keyword;
    keyword.hits = hitsFor({1});
    FakeVectorSource vectors(64);
    FakeEmbeddingProvider embedder(64);
    embedder.outputDims = 32;
    FakeRecordSource records;
    records.add(1, 1, 1, 1, QStringLiteral("one"));

    HybridRetriever retriever(keyword, vectors, embedder, records);
    const RetrievalReport report = retriever.retrieveDetailed(QStringLiteral("q"), 5);
    QCOMPARE(report.error, ErrorCode::DimensionMismatch);
    QVERIFY(report.records.empty());
    QVERIFY(!retriever.retrieve(QStringLiteral("q"), 5).has_value());
}

void TestHybridRetriever::testIndexDimensionMismatchIsFatal()
{
    FakeKeywordSource keyword;
    FakeVectorSource vectors(64);
    vectors.status = VectorSearchStatus::DimensionMismatch;
    FakeEmbeddingProvider embedder(64);
    FakeRecordSource records;

    HybridRetriever retriever(keyword, vectors, embedder, records);
    const RetrievalReport report = retriever.retrieveDetailed(QStringLiteral("q"), 5);
    QCOMPARE(report.error, ErrorCode::DimensionMismatch);
}

void TestHybridRetriever::testResultsCappedAtK()
{
    FakeKeywordSource keyword;
    keyword.hits = hitsFor({1, 2, 3, 4});
    FakeVectorSource vectors(64);
    vectors.hits = hitsFor({5, 6, 7, 8});
    FakeEmbeddingProvider embedder(64);
    FakeRecordSource records;
    for (int64_t id = 1; id <= 8; ++id) {
        records.add(id, 1, 1, id, QStringLiteral("record %1").arg(id));
    }

    HybridRetriever retriever(keyword, vectors, embedder, records);
    const auto result = retriever.retrieve(QStringLiteral("q"), 3);
    QVERIFY(result.has_value());
    QCOMPARE(result->size(), size_t(3));
}

void TestHybridRetriever::testNonPositiveKReturnsEmpty()
{
    FakeKeywordSource keyword;
    keyword.hits = hitsFor({1});
    FakeVectorSource vectors(64);
    FakeEmbeddingProvider embedder(64);
    FakeRecordSource records;
    records.add(1, 1, 1, 1, QStringLiteral("one"));

    HybridRetriever retriever(keyword, vectors, embedder, records);
    const auto result = retriever.retrieve(QStringLiteral("q"), 0);
    QVERIFY(result.has_value());
    QVERIFY(result->empty());
    QCOMPARE(keyword.calls.load(), 0);
}

void TestHybridRetriever::testMissingRecordsAreDropped()
{
    FakeKeywordSource keyword;
    keyword.hits = hitsFor({1, 2, 3});
    FakeVectorSource vectors(64);
    FakeEmbeddingProvider embedder(64);
    FakeRecordSource records;
    records.add(1, 1, 1, 1, QStringLiteral("one"));
    records.add(3, 1, 1, 3, QStringLiteral("three"));

    HybridRetriever retriever(keyword, vectors, embedder, records);
    const RetrievalReport report = retriever.retrieveDetailed(QStringLiteral("q"), 5);
    QVERIFY(report.ok());
    QCOMPARE(report.records.size(), size_t(2));
    QCOMPARE(report.droppedIds, std::vector<int64_t>{2});
}

void TestHybridRetriever::testHydrationFailureIsInternalError()
{
    FakeKeywordSource keyword;
    keyword.hits = hitsFor({1});
    FakeVectorSource vectors(64);
    FakeEmbeddingProvider embedder(64);
    FakeRecordSource records;
    records.throwOnGet = true;

    HybridRetriever retriever(keyword, vectors, embedder, records);
    const RetrievalReport report = retriever.retrieveDetailed(QStringLiteral("q"), 5);
    QCOMPARE(report.error, ErrorCode::InternalError);
}

void TestHybridRetriever::testFusedOrderPreserved()
{
    FakeKeywordSource keyword;
    keyword.hits = hitsFor({30, 10, 20});
    FakeVectorSource vectors(64);
    vectors.hits = hitsFor({20, 40});
    FakeEmbeddingProvider embedder(64);
    FakeRecordSource records;
    for (int64_t id : {10, 20, 30, 40}) {
        records.add(id, 1, 1, id, QStringLiteral("record %1").arg(id));
    }

    HybridRetriever retriever(keyword, vectors, embedder, records);
    const RetrievalReport report = retriever.retrieveDetailed(QStringLiteral("q"), 5);
    QVERIFY(report.ok());
    // 20: 1/63 + 1/61; 30: 1/61; 40 and 10 tie at 1/62.
    QCOMPARE(report.records.size(), size_t(4));
    QCOMPARE(report.records[0].id, int64_t(20));
    QCOMPARE(report.records[1].id, int64_t(30));
    QCOMPARE(report.records[2].id, int64_t(10));
    QCOMPARE(report.records[3].id, int64_t(40));
    for (size_t i = 0; i < report.records.size(); ++i) {
        QCOMPARE(report.records[i].id, report.fused[i].id);
    }
}

void TestHybridRetriever::testReportJson()
{
    FakeKeywordSource keyword;
    keyword.hits = hitsFor({1});
    FakeVectorSource vectors(64);
    FakeEmbeddingProvider embedder(64);
    embedder.fail = true;
    FakeRecordSource records;
    records.add(1, 5, 6, 7, QStringLiteral("text"));

    HybridRetriever retriever(keyword, vectors, embedder, records);
    const QJsonObject json = retriever.retrieveDetailed(QStringLiteral("q"), 5).toJson();
    const QJsonArray recordsJson = json.value(QStringLiteral("records")).toArray();
    QCOMPARE(recordsJson.size(), qsizetype(1));
    const QJsonObject first = recordsJson.at(0).toObject();
    QCOMPARE(first.value(QStringLiteral("doc_id")).toInteger(), qint64(5));
    QVERIFY(first.contains(QStringLiteral("fused_score")));
    const QJsonObject sources = json.value(QStringLiteral("sources")).toObject();
    QCOMPARE(sources.value(QStringLiteral("vector_available")).toBool(), false);
    QCOMPARE(sources.value(QStringLiteral("keyword_hits")).toInt(), 1);
}

QTEST_MAIN(TestHybridRetriever)
#include "test_hybrid_retriever.moc"
