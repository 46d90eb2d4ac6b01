#include <QtTest/QtTest>
#include <QTemporaryDir>
#include <QFile>

#include "core/ingest/ingestor.h"
#include "core/retrieval/retrieval_stack.h"
#include "test_stack.h"

using lc::IngestConfig;
using lc::IngestStats;
using lc::Ingestor;
using lc::ParagraphLocation;
using lc::test::FakeEmbeddingProvider;
using lc::test::openTestStack;
using lc::test::writeDocument;

namespace {

const QString kDepositText = QStringLiteral(
    "<p>The security <b>deposit</b> must be returned within thirty days after the lease ends.</p>");
const QString kPetsText = QStringLiteral(
    "<p>Pets are allowed only with the written consent of the landlord &amp; neighbours.</p>");
const QString kNoticeText = QStringLiteral(
    "<p>Either party may terminate the contract with three months notice in writing.</p>");

Ingestor makeIngestor(lc::RetrievalStack& stack)
{
    return Ingestor(stack.store(), stack.keyword(), stack.vectors(), stack.payloads(),
                    stack.embedder(), IngestConfig{});
}

} // namespace

class TestIngestPipeline : public QObject {
    Q_OBJECT

private slots:
    void testIngestDirectoryStoresAllThreeViews();
    void testFailedDocumentLeavesNoTrace();
    void testDimensionMismatchFailsDocument();
    void testReingestKeepsIds();
    void testVectorsSurviveReopen();
    void testRebuildFromScratch();
};

void TestIngestPipeline::testIngestDirectoryStoresAllThreeViews()
{
    QTemporaryDir raw;
    QTemporaryDir data;
    QVERIFY(raw.isValid() && data.isValid());

    QVERIFY(writeDocument(raw.path(), 1, {
        {1, 1, kDepositText},
        {1, 2, QStringLiteral("<p>Too short.</p>")},
        {2, 1, kPetsText},
    }));
    QVERIFY(writeDocument(raw.path(), 2, {{1, 1, kNoticeText}}));
    {
        QFile broken(raw.filePath(QStringLiteral("broken.json")));
        QVERIFY(broken.open(QIODevice::WriteOnly));
        broken.write("{ \"id\": ");
    }

    auto stack = openTestStack(data.path());
    QVERIFY(stack);
    Ingestor ingestor = makeIngestor(*stack);

    const IngestStats stats = ingestor.ingestDirectory(raw.path());
    QCOMPARE(stats.documents, 2);
    QCOMPARE(stats.documentsFailed, 1);
    QCOMPARE(stats.paragraphsStored, 3);
    QCOMPARE(stats.paragraphsRejected, 1);

    const QJsonObject json = stats.toJson();
    QCOMPARE(json.value(QStringLiteral("paragraphs_stored")).toInt(), 3);

    QCOMPARE(stack->store().count(), 3);
    QCOMPARE(stack->keyword().count(), 3);
    QCOMPARE(stack->vectors().activeElements(), 3);
    QCOMPARE(stack->payloads().countPoints(), 3);

    const auto report = stack->checkConsistency();
    QVERIFY(report.isConsistent());

    const auto deposit = stack->store().findByLocation(ParagraphLocation{1, 1, 1});
    QVERIFY(deposit.has_value());
    // Markup removed, entities decoded.
    QCOMPARE(deposit->text, QStringLiteral(
        "The security deposit must be returned within thirty days after the lease ends."));
    QVERIFY(stack->store().findByLocation(ParagraphLocation{1, 2, 1})->text.contains(
        QStringLiteral("landlord & neighbours")));
    QVERIFY(!stack->store().findByLocation(ParagraphLocation{1, 1, 2}).has_value());

    QCOMPARE(stack->store().getSetting(QStringLiteral("embedding_model")).value_or(QString()),
             QStringLiteral("fake-bow"));
    QCOMPARE(stack->store().getSetting(QStringLiteral("embedding_dimensions")).value_or(QString()),
             QStringLiteral("64"));
    QVERIFY(stack->store().getSetting(QStringLiteral("last_ingest_at")).value_or(QString()).toLongLong() > 0);

    const auto records = stack->retriever().retrieve(QStringLiteral("security deposit returned"), 1);
    QVERIFY(records.has_value());
    QCOMPARE(records->size(), size_t(1));
    QVERIFY(records->front().location == (ParagraphLocation{1, 1, 1}));
}

void TestIngestPipeline::testFailedDocumentLeavesNoTrace()
{
    QTemporaryDir raw;
    QTemporaryDir data;
    QVERIFY(writeDocument(raw.path(), 1, {{1, 1, kDepositText}}));
    QVERIFY(writeDocument(raw.path(), 2, {
        {1, 1, kPetsText},
        {1, 2, QStringLiteral("<p>POISON paragraph that the embedder refuses to handle.</p>")},
    }));

    FakeEmbeddingProvider* embedder = nullptr;
    auto stack = openTestStack(data.path(), &embedder);
    QVERIFY(stack);
    embedder->failBatchMarker = QStringLiteral("POISON");

    Ingestor ingestor = makeIngestor(*stack);
    const IngestStats stats = ingestor.ingestDirectory(raw.path());
    QCOMPARE(stats.documents, 1);
    QCOMPARE(stats.documentsFailed, 1);
    QCOMPARE(stats.paragraphsStored, 1);

    // Neither paragraph of document 2 is anywhere, not even the healthy one.
    QVERIFY(!stack->store().findByLocation(ParagraphLocation{2, 1, 1}).has_value());
    QCOMPARE(stack->store().count(), 1);
    QCOMPARE(stack->keyword().count(), 1);
    QCOMPARE(stack->vectors().activeElements(), 1);
    QCOMPARE(stack->payloads().countPoints(), 1);
    QVERIFY(stack->checkConsistency().isConsistent());
}

void TestIngestPipeline::testDimensionMismatchFailsDocument()
{
    QTemporaryDir data;
    FakeEmbeddingProvider* embedder = nullptr;
    auto stack = openTestStack(data.path(), &embedder);
    QVERIFY(stack);
    embedder->outputDims = 32;

    lc::SourceDocument document;
    document.id = 9;
    lc::SourceChapter chapter;
    chapter.id = 1;
    chapter.paragraphs.push_back({1, kNoticeText});
    document.chapters.push_back(chapter);

    Ingestor ingestor = makeIngestor(*stack);
    IngestStats stats;
    QVERIFY(!ingestor.ingestDocument(document, stats));
    QCOMPARE(stats.documentsFailed, 1);
    QCOMPARE(stack->store().count(), 0);
    QCOMPARE(stack->vectors().totalElements(), 0);
}

void TestIngestPipeline::testReingestKeepsIds()
{
    QTemporaryDir raw;
    QTemporaryDir data;
    QVERIFY(writeDocument(raw.path(), 1, {{1, 1, kDepositText}, {1, 2, kPetsText}}));

    auto stack = openTestStack(data.path());
    QVERIFY(stack);
    Ingestor ingestor = makeIngestor(*stack);

    ingestor.ingestDirectory(raw.path());
    const std::vector<int64_t> firstIds = stack->store().allIds();
    QCOMPARE(firstIds.size(), size_t(2));

    // Same locations, edited text.
    QVERIFY(writeDocument(raw.path(), 1, {
        {1, 1, kDepositText},
        {1, 2, QStringLiteral("<p>Pets are forbidden in every apartment of the building.</p>")},
    }));
    const IngestStats second = ingestor.ingestDirectory(raw.path());
    QCOMPARE(second.documentsFailed, 0);

    QCOMPARE(stack->store().allIds(), firstIds);
    QCOMPARE(stack->vectors().labels(), firstIds);
    QCOMPARE(stack->vectors().deletedElements(), 0);
    QVERIFY(stack->store().findByLocation(ParagraphLocation{1, 1, 2})->text.contains(
        QStringLiteral("forbidden")));

    const auto hits = stack->keyword().search(QStringLiteral("consent"), 10, 0);
    QVERIFY(hits.has_value());
    QVERIFY(hits->empty());
    QVERIFY(stack->checkConsistency().isConsistent());
}

void TestIngestPipeline::testVectorsSurviveReopen()
{
    QTemporaryDir raw;
    QTemporaryDir data;
    QVERIFY(writeDocument(raw.path(), 4, {{2, 3, kNoticeText}, {2, 4, kDepositText}}));

    std::vector<int64_t> ids;
    {
        auto stack = openTestStack(data.path());
        QVERIFY(stack);
        Ingestor ingestor = makeIngestor(*stack);
        ingestor.ingestDirectory(raw.path());
        QVERIFY(stack->saveVectors());
        ids = stack->store().allIds();
    }

    auto reopened = openTestStack(data.path());
    QVERIFY(reopened);
    QCOMPARE(reopened->vectors().labels(), ids);
    QVERIFY(reopened->checkConsistency().isConsistent());

    const auto records = reopened->retriever().retrieve(QStringLiteral("three months notice"), 2);
    QVERIFY(records.has_value());
    QVERIFY(!records->empty());
    QVERIFY(records->front().location == (ParagraphLocation{4, 2, 3}));
}

void TestIngestPipeline::testRebuildFromScratch()
{
    QTemporaryDir raw;
    QTemporaryDir data;
    QVERIFY(writeDocument(raw.path(), 1, {{1, 1, kDepositText}}));

    auto stack = openTestStack(data.path());
    QVERIFY(stack);
    {
        Ingestor ingestor = makeIngestor(*stack);
        ingestor.ingestDirectory(raw.path());
    }
    QCOMPARE(stack->store().count(), 1);

    QVERIFY(stack->store().deleteAll());
    QVERIFY(stack->resetVectors());
    QCOMPARE(stack->store().count(), 0);
    QCOMPARE(stack->keyword().count(), 0);
    QCOMPARE(stack->payloads().countPoints(), 0);
    QCOMPARE(stack->vectors().totalElements(), 0);

    Ingestor ingestor = makeIngestor(*stack);
    const IngestStats stats = ingestor.ingestDirectory(raw.path());
    QCOMPARE(stats.paragraphsStored, 1);
    QVERIFY(stack->checkConsistency().isConsistent());
}

QTEST_MAIN(TestIngestPipeline)
#include "test_ingest_pipeline.moc"
