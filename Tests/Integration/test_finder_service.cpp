#include <QtTest/QtTest>
#include <QTemporaryDir>
#include <QJsonArray>

#include "core/ingest/ingestor.h"
#include "core/ipc/message.h"
#include "finder_service.h"
#include "test_stack.h"

using lc::FinderService;
using lc::IpcMessage;
using lc::LoopConfig;
using lc::test::ScriptedReasoningEngine;
using lc::test::toolCall;

namespace {

const QString kDepositAnswer = QStringLiteral(
    "Thought: The first source answers it.\n"
    "Final Answer: {\"doc_id\": 1, \"chapter_id\": 1, \"paragraph_id\": 1}");

QJsonObject findParams()
{
    QJsonObject question;
    question[QStringLiteral("text")] = QStringLiteral("When must the deposit be returned?");
    QJsonObject params;
    params[QStringLiteral("question")] = question;
    params[QStringLiteral("answers")] = QJsonArray{QStringLiteral("30 days"), QStringLiteral("1 year")};
    params[QStringLiteral("correctAnswers")] = QJsonArray{QStringLiteral("30 days")};
    return params;
}

QString errorCodeString(const QJsonObject& response)
{
    return response.value(QStringLiteral("error")).toObject()
        .value(QStringLiteral("codeString")).toString();
}

} // namespace

class TestFinderService : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    void testFindParagraphReturnsLocation();
    void testModelGivingUpIsNotFound();
    void testIterationBudgetIsNotFound();
    void testMalformedAnswerIsInternalErrorWithRawText();
    void testInvalidFindParamsNeverReachTheEngine();
    void testEngineTimeoutIsTimeout();
    void testRetrieve();
    void testRetrieveRejectsBadParams();
    void testHealth();
    void testPingAndUnknownMethod();

private:
    QJsonObject call(FinderService& service, const QString& method,
                     const QJsonObject& params = {});

    std::unique_ptr<QTemporaryDir> m_dir;
    std::unique_ptr<lc::RetrievalStack> m_stack;
    ScriptedReasoningEngine m_engine;
    uint64_t m_nextId = 1;
};

void TestFinderService::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
    const QString raw = m_dir->filePath(QStringLiteral("raw"));
    QVERIFY(QDir().mkpath(raw));

    QVERIFY(lc::test::writeDocument(raw, 1, {
        {1, 1, QStringLiteral("<p>The security deposit must be returned within thirty days.</p>")},
        {1, 2, QStringLiteral("<p>Rent is due on the first working day of each month.</p>")},
    }));

    m_stack = lc::test::openTestStack(m_dir->filePath(QStringLiteral("data")));
    QVERIFY(m_stack);

    lc::Ingestor ingestor(m_stack->store(), m_stack->keyword(), m_stack->vectors(),
                          m_stack->payloads(), m_stack->embedder());
    const lc::IngestStats stats = ingestor.ingestDirectory(raw);
    QCOMPARE(stats.paragraphsStored, 2);

    m_engine.replies.clear();
    m_engine.fail = false;
    m_engine.timeOut = false;
    m_engine.calls = 0;
    m_engine.transcripts.clear();
}

void TestFinderService::cleanup()
{
    m_stack.reset();
    m_dir.reset();
}

QJsonObject TestFinderService::call(FinderService& service, const QString& method,
                                    const QJsonObject& params)
{
    const uint64_t id = m_nextId++;
    const QJsonObject response = service.handleRequest(IpcMessage::makeRequest(id, method, params));
    if (IpcMessage::requestId(response) != id) {
        qWarning("response id does not match request id %llu", static_cast<unsigned long long>(id));
    }
    return response;
}

void TestFinderService::testFindParagraphReturnsLocation()
{
    m_engine.replies = {toolCall(QStringLiteral("deposit returned")), kDepositAnswer};
    FinderService service(*m_stack, m_engine);

    const QJsonObject response = call(service, QStringLiteral("find_paragraph"), findParams());
    QCOMPARE(response.value(QStringLiteral("type")).toString(), QStringLiteral("response"));
    const QJsonObject result = response.value(QStringLiteral("result")).toObject();
    QCOMPARE(result.value(QStringLiteral("doc_id")).toInteger(), qint64(1));
    QCOMPARE(result.value(QStringLiteral("chapter_id")).toInteger(), qint64(1));
    QCOMPARE(result.value(QStringLiteral("paragraph_id")).toInteger(), qint64(1));

    // The second turn saw the stored paragraph as an observation.
    QCOMPARE(m_engine.calls, 2);
    const QString observation = m_engine.transcripts.at(1).back().content;
    QVERIFY(observation.startsWith(QStringLiteral("Observation: ")));
    QVERIFY(observation.contains(QStringLiteral("within thirty days")));
}

void TestFinderService::testModelGivingUpIsNotFound()
{
    m_engine.replies = {toolCall(QStringLiteral("deposit")),
                        QStringLiteral("Final Answer: {\"error\": \"no paragraph supports the answer\"}")};
    FinderService service(*m_stack, m_engine);

    const QJsonObject response = call(service, QStringLiteral("find_paragraph"), findParams());
    QCOMPARE(response.value(QStringLiteral("type")).toString(), QStringLiteral("error"));
    QCOMPARE(errorCodeString(response), QStringLiteral("NOT_FOUND"));
}

void TestFinderService::testIterationBudgetIsNotFound()
{
    m_engine.replies = {toolCall(QStringLiteral("deposit"))};
    LoopConfig config;
    config.maxIterations = 2;
    FinderService service(*m_stack, m_engine, config);

    const QJsonObject response = call(service, QStringLiteral("find_paragraph"), findParams());
    QCOMPARE(errorCodeString(response), QStringLiteral("NOT_FOUND"));
    QCOMPARE(m_engine.calls, 2);
}

void TestFinderService::testMalformedAnswerIsInternalErrorWithRawText()
{
    m_engine.replies = {QStringLiteral("Final Answer: {\"doc_id\": 1} {\"doc_id\": 2}")};
    FinderService service(*m_stack, m_engine);

    const QJsonObject response = call(service, QStringLiteral("find_paragraph"), findParams());
    QCOMPARE(errorCodeString(response), QStringLiteral("INTERNAL_ERROR"));
    const QString message = response.value(QStringLiteral("error")).toObject()
                                .value(QStringLiteral("message")).toString();
    QVERIFY(message.startsWith(QStringLiteral("malformed terminal payload")));
    QVERIFY(message.contains(QStringLiteral("{\"doc_id\": 2}")));
}

void TestFinderService::testInvalidFindParamsNeverReachTheEngine()
{
    FinderService service(*m_stack, m_engine);

    QJsonObject noQuestion = findParams();
    noQuestion.remove(QStringLiteral("question"));
    QCOMPARE(errorCodeString(call(service, QStringLiteral("find_paragraph"), noQuestion)),
             QStringLiteral("INVALID_PARAMS"));

    QJsonObject noCorrect = findParams();
    noCorrect[QStringLiteral("correctAnswers")] = QJsonArray();
    QCOMPARE(errorCodeString(call(service, QStringLiteral("find_paragraph"), noCorrect)),
             QStringLiteral("INVALID_PARAMS"));

    QCOMPARE(m_engine.calls, 0);
}

void TestFinderService::testEngineTimeoutIsTimeout()
{
    m_engine.timeOut = true;
    FinderService service(*m_stack, m_engine);

    const QJsonObject response = call(service, QStringLiteral("find_paragraph"), findParams());
    QCOMPARE(errorCodeString(response), QStringLiteral("TIMEOUT"));
}

void TestFinderService::testRetrieve()
{
    FinderService service(*m_stack, m_engine);

    QJsonObject params;
    params[QStringLiteral("query")] = QStringLiteral("security deposit");
    params[QStringLiteral("k")] = 1;
    const QJsonObject response = call(service, QStringLiteral("retrieve"), params);
    QCOMPARE(response.value(QStringLiteral("type")).toString(), QStringLiteral("response"));

    const QJsonObject result = response.value(QStringLiteral("result")).toObject();
    const QJsonArray records = result.value(QStringLiteral("records")).toArray();
    QCOMPARE(records.size(), qsizetype(1));
    const QJsonObject first = records.at(0).toObject();
    QCOMPARE(first.value(QStringLiteral("paragraph_id")).toInteger(), qint64(1));
    QVERIFY(first.value(QStringLiteral("text")).toString().contains(QStringLiteral("deposit")));
    QVERIFY(first.value(QStringLiteral("fused_score")).toDouble() > 0.0);

    // Retrieval never touches the reasoning engine.
    QCOMPARE(m_engine.calls, 0);

    QJsonObject zero;
    zero[QStringLiteral("query")] = QStringLiteral("deposit");
    zero[QStringLiteral("k")] = 0;
    const QJsonObject empty = call(service, QStringLiteral("retrieve"), zero)
                                  .value(QStringLiteral("result")).toObject();
    QVERIFY(empty.value(QStringLiteral("records")).toArray().isEmpty());
}

void TestFinderService::testRetrieveRejectsBadParams()
{
    FinderService service(*m_stack, m_engine);

    QCOMPARE(errorCodeString(call(service, QStringLiteral("retrieve"))),
             QStringLiteral("INVALID_PARAMS"));

    QJsonObject badK;
    badK[QStringLiteral("query")] = QStringLiteral("deposit");
    badK[QStringLiteral("k")] = 5000;
    QCOMPARE(errorCodeString(call(service, QStringLiteral("retrieve"), badK)),
             QStringLiteral("INVALID_PARAMS"));

    badK[QStringLiteral("k")] = QStringLiteral("many");
    QCOMPARE(errorCodeString(call(service, QStringLiteral("retrieve"), badK)),
             QStringLiteral("INVALID_PARAMS"));
}

void TestFinderService::testHealth()
{
    m_engine.replies = {kDepositAnswer};
    FinderService service(*m_stack, m_engine);
    call(service, QStringLiteral("find_paragraph"), findParams());

    const QJsonObject result = call(service, QStringLiteral("get_health"))
                                   .value(QStringLiteral("result")).toObject();
    QCOMPARE(result.value(QStringLiteral("records")).toInt(), 2);
    QCOMPARE(result.value(QStringLiteral("keyword_entries")).toInt(), 2);
    QCOMPARE(result.value(QStringLiteral("vector_labels")).toInt(), 2);
    QCOMPARE(result.value(QStringLiteral("payload_rows")).toInt(), 2);
    QCOMPARE(result.value(QStringLiteral("vector_dimensions")).toInt(), lc::test::kTestDimensions);
    QCOMPARE(result.value(QStringLiteral("requests_served")).toInteger(), qint64(1));
    QVERIFY(result.value(QStringLiteral("consistent")).toBool());
    QVERIFY(!result.value(QStringLiteral("vector_needs_rebuild")).toBool());

    // A record the indexes never saw makes the store inconsistent.
    lc::ParagraphRecord stray;
    stray.location = lc::ParagraphLocation{9, 9, 9};
    stray.text = QStringLiteral("stored behind the indexes' back");
    QVERIFY(m_stack->store().put(stray).has_value());

    const QJsonObject after = call(service, QStringLiteral("get_health"))
                                  .value(QStringLiteral("result")).toObject();
    QVERIFY(!after.value(QStringLiteral("consistent")).toBool());
    QCOMPARE(after.value(QStringLiteral("records")).toInt(), 3);
}

void TestFinderService::testPingAndUnknownMethod()
{
    FinderService service(*m_stack, m_engine);

    const QJsonObject pong = call(service, QStringLiteral("ping"))
                                 .value(QStringLiteral("result")).toObject();
    QVERIFY(pong.value(QStringLiteral("pong")).toBool());
    QCOMPARE(pong.value(QStringLiteral("service")).toString(), QStringLiteral("finder"));

    const QJsonObject unknown = call(service, QStringLiteral("summarize"));
    QCOMPARE(errorCodeString(unknown), QStringLiteral("NOT_FOUND"));
}

QTEST_MAIN(TestFinderService)
#include "test_finder_service.moc"
