#include "core/ingest/document_loader.h"
#include "core/shared/types.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>

namespace lc {

int SourceDocument::paragraphCount() const
{
    int total = 0;
    for (const SourceChapter& chapter : chapters) {
        total += static_cast<int>(chapter.paragraphs.size());
    }
    return total;
}

std::optional<SourceDocument> DocumentLoader::loadFile(const QString& path, QString* error)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        if (error) {
            *error = QStringLiteral("cannot open %1: %2").arg(path, file.errorString());
        }
        return std::nullopt;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    file.close();
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        if (error) {
            *error = QStringLiteral("invalid JSON in %1: %2").arg(path, parseError.errorString());
        }
        return std::nullopt;
    }

    auto document = fromJson(doc.object(), error);
    if (document.has_value()) {
        document->sourcePath = path;
    }
    return document;
}

std::optional<SourceDocument> DocumentLoader::fromJson(const QJsonObject& json, QString* error)
{
    auto fail = [error](const QString& message) -> std::optional<SourceDocument> {
        if (error) {
            *error = message;
        }
        return std::nullopt;
    };

    const auto docId = integralJsonValue(json.value(QStringLiteral("id")));
    if (!docId) {
        return fail(QStringLiteral("document has no integer 'id'"));
    }

    SourceDocument document;
    document.id = *docId;

    const QJsonValue chaptersValue = json.value(QStringLiteral("chapters"));
    if (chaptersValue.isUndefined() || chaptersValue.isNull()) {
        return document;
    }
    if (!chaptersValue.isArray()) {
        return fail(QStringLiteral("'chapters' must be an array"));
    }

    for (const QJsonValue& chapterValue : chaptersValue.toArray()) {
        const QJsonObject chapterJson = chapterValue.toObject();
        const auto chapterId = integralJsonValue(chapterJson.value(QStringLiteral("id")));
        if (!chapterId) {
            return fail(QStringLiteral("chapter without integer 'id' in document %1").arg(*docId));
        }

        SourceChapter chapter;
        chapter.id = *chapterId;

        for (const QJsonValue& paragraphValue : chapterJson.value(QStringLiteral("paragraphs")).toArray()) {
            const QJsonObject paragraphJson = paragraphValue.toObject();
            const auto paragraphId = integralJsonValue(paragraphJson.value(QStringLiteral("id")));
            if (!paragraphId) {
                return fail(QStringLiteral("paragraph without integer 'id' in document %1 chapter %2")
                                .arg(*docId)
                                .arg(*chapterId));
            }
            SourceParagraph paragraph;
            paragraph.id = *paragraphId;
            paragraph.content = paragraphJson.value(QStringLiteral("content")).toString();
            chapter.paragraphs.push_back(std::move(paragraph));
        }

        document.chapters.push_back(std::move(chapter));
    }

    return document;
}

QStringList DocumentLoader::listDocumentFiles(const QString& dir)
{
    QDir directory(dir);
    const QStringList names = directory.entryList({QStringLiteral("*.json")},
                                                  QDir::Files | QDir::Readable, QDir::Name);
    QStringList paths;
    paths.reserve(names.size());
    for (const QString& name : names) {
        paths.push_back(QFileInfo(directory, name).absoluteFilePath());
    }
    return paths;
}

} // namespace lc
