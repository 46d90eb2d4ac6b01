#pragma once

#include "core/retrieval/retrieval_stack.h"
#include "fakes.h"

#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>

#include <memory>
#include <utility>
#include <vector>

namespace lc::test {

constexpr int kTestDimensions = 64;

inline Settings testSettings(const QString& dataDir)
{
    Settings settings;
    settings.dbPath = dataDir + QStringLiteral("/lexcite.db");
    settings.vectorIndexPath = dataDir + QStringLiteral("/vectors.hnsw");
    settings.vectorMetaPath = dataDir + QStringLiteral("/vectors.meta.json");
    settings.embeddingModel = QStringLiteral("fake-bow");
    settings.embeddingDimensions = kTestDimensions;
    return settings;
}

// Opens a stack on dataDir backed by a FakeEmbeddingProvider. *embedder
// receives a non-owning pointer to it.
inline std::unique_ptr<RetrievalStack> openTestStack(const QString& dataDir,
                                                     FakeEmbeddingProvider** embedder = nullptr)
{
    auto fake = std::make_unique<FakeEmbeddingProvider>(kTestDimensions);
    if (embedder) {
        *embedder = fake.get();
    }
    QString error;
    return RetrievalStack::open(testSettings(dataDir), std::move(fake), &error);
}

struct ParagraphSpec {
    int64_t chapterId;
    int64_t paragraphId;
    QString content;
};

inline bool writeDocument(const QString& dir, int64_t docId,
                          const std::vector<ParagraphSpec>& paragraphs)
{
    QJsonArray chapters;
    QJsonObject currentChapter;
    QJsonArray currentParagraphs;
    int64_t currentChapterId = -1;

    auto flush = [&]() {
        if (currentChapterId >= 0) {
            currentChapter[QStringLiteral("id")] = static_cast<qint64>(currentChapterId);
            currentChapter[QStringLiteral("paragraphs")] = currentParagraphs;
            chapters.append(currentChapter);
        }
        currentChapter = QJsonObject();
        currentParagraphs = QJsonArray();
    };

    for (const ParagraphSpec& paragraph : paragraphs) {
        if (paragraph.chapterId != currentChapterId) {
            flush();
            currentChapterId = paragraph.chapterId;
        }
        QJsonObject json;
        json[QStringLiteral("id")] = static_cast<qint64>(paragraph.paragraphId);
        json[QStringLiteral("content")] = paragraph.content;
        currentParagraphs.append(json);
    }
    flush();

    QJsonObject document;
    document[QStringLiteral("id")] = static_cast<qint64>(docId);
    document[QStringLiteral("chapters")] = chapters;

    QFile file(QDir(dir).filePath(QStringLiteral("doc_%1.json").arg(docId)));
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return false;
    }
    return file.write(QJsonDocument(document).toJson()) > 0;
}

} // namespace lc::test
