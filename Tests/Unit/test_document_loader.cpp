#include <QtTest/QtTest>
#include "core/ingest/document_loader.h"

#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QTemporaryDir>

using lc::DocumentLoader;

namespace {

bool writeFile(const QString& path, const QByteArray& contents)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        return false;
    }
    return file.write(contents) == contents.size();
}

} // namespace

class TestDocumentLoader : public QObject {
    Q_OBJECT

private slots:
    void testParsesNestedStructure();
    void testStringIdsAccepted();
    void testMissingChaptersGivesEmptyDocument();
    void testMissingIdRejected();
    void testParagraphWithoutIdRejected();
    void testLoadFileRecordsSourcePath();
    void testLoadFileRejectsInvalidJson();
    void testListDocumentFilesSortedJsonOnly();
};

void TestDocumentLoader::testParsesNestedStructure()
{
    const QJsonDocument doc = QJsonDocument::fromJson(R"({
        "id": 3,
        "chapters": [
            {"id": 1, "paragraphs": [
                {"id": 10, "content": "<p>First</p>"},
                {"id": 11, "content": "<p>Second</p>"}
            ]},
            {"id": 2, "paragraphs": [{"id": 20, "content": "Third"}]}
        ]
    })");
    QString error;
    const auto document = DocumentLoader::fromJson(doc.object(), &error);
    QVERIFY2(document.has_value(), qPrintable(error));
    QCOMPARE(document->id, int64_t(3));
    QCOMPARE(document->chapters.size(), size_t(2));
    QCOMPARE(document->paragraphCount(), 3);
    QCOMPARE(document->chapters[0].paragraphs[1].id, int64_t(11));
    QCOMPARE(document->chapters[0].paragraphs[1].content, QStringLiteral("<p>Second</p>"));
    QCOMPARE(document->chapters[1].id, int64_t(2));
}

void TestDocumentLoader::testStringIdsAccepted()
{
    const QJsonDocument doc = QJsonDocument::fromJson(
        R"({"id": "7", "chapters": [{"id": "2", "paragraphs": [{"id": "5", "content": "x"}]}]})");
    const auto document = DocumentLoader::fromJson(doc.object(), nullptr);
    QVERIFY(document.has_value());
    QCOMPARE(document->id, int64_t(7));
    QCOMPARE(document->chapters[0].paragraphs[0].id, int64_t(5));
}

void TestDocumentLoader::testMissingChaptersGivesEmptyDocument()
{
    const auto document = DocumentLoader::fromJson(QJsonObject{{QStringLiteral("id"), 4}}, nullptr);
    QVERIFY(document.has_value());
    QCOMPARE(document->paragraphCount(), 0);
}

void TestDocumentLoader::testMissingIdRejected()
{
    QString error;
    QVERIFY(!DocumentLoader::fromJson(QJsonObject{{QStringLiteral("chapters"), QJsonArray{}}},
                                      &error).has_value());
    QVERIFY(!error.isEmpty());
}

void TestDocumentLoader::testParagraphWithoutIdRejected()
{
    const QJsonDocument doc = QJsonDocument::fromJson(
        R"({"id": 1, "chapters": [{"id": 1, "paragraphs": [{"content": "no id"}]}]})");
    QString error;
    QVERIFY(!DocumentLoader::fromJson(doc.object(), &error).has_value());
    QVERIFY(error.contains(QStringLiteral("paragraph")));
}

void TestDocumentLoader::testLoadFileRecordsSourcePath()
{
    QTemporaryDir dir;
    const QString path = dir.path() + QStringLiteral("/doc.json");
    QVERIFY(writeFile(path, R"({"id": 9, "chapters": []})"));

    QString error;
    const auto document = DocumentLoader::loadFile(path, &error);
    QVERIFY2(document.has_value(), qPrintable(error));
    QCOMPARE(document->id, int64_t(9));
    QCOMPARE(document->sourcePath, path);
}

void TestDocumentLoader::testLoadFileRejectsInvalidJson()
{
    QTemporaryDir dir;
    const QString path = dir.path() + QStringLiteral("/broken.json");
    QVERIFY(writeFile(path, "{\"id\": 1, "));

    QString error;
    QVERIFY(!DocumentLoader::loadFile(path, &error).has_value());
    QVERIFY(error.contains(QStringLiteral("broken.json")));

    QVERIFY(!DocumentLoader::loadFile(dir.path() + QStringLiteral("/absent.json"), &error).has_value());
}

void TestDocumentLoader::testListDocumentFilesSortedJsonOnly()
{
    QTemporaryDir dir;
    QVERIFY(writeFile(dir.path() + QStringLiteral("/b.json"), "{}"));
    QVERIFY(writeFile(dir.path() + QStringLiteral("/a.json"), "{}"));
    QVERIFY(writeFile(dir.path() + QStringLiteral("/notes.txt"), "x"));

    const QStringList files = DocumentLoader::listDocumentFiles(dir.path());
    QCOMPARE(files.size(), qsizetype(2));
    QVERIFY(files[0].endsWith(QStringLiteral("/a.json")));
    QVERIFY(files[1].endsWith(QStringLiteral("/b.json")));
    QVERIFY(QFileInfo(files[0]).isAbsolute());
}

QTEST_MAIN(TestDocumentLoader)
#include "test_document_loader.moc"
