#pragma once

#include <QJsonObject>
#include <QString>
#include <QStringList>

#include <cstdint>
#include <optional>
#include <vector>

namespace lc {

struct SourceParagraph {
    int64_t id = 0;
    QString content;    // raw HTML
};

struct SourceChapter {
    int64_t id = 0;
    std::vector<SourceParagraph> paragraphs;
};

struct SourceDocument {
    int64_t id = 0;
    QString sourcePath;
    std::vector<SourceChapter> chapters;

    int paragraphCount() const;
};

// Reads raw corpus files:
//   {"id": 3, "chapters": [{"id": 1, "paragraphs": [{"id": 10, "content": "<p>..</p>"}]}]}
class DocumentLoader {
public:
    static std::optional<SourceDocument> loadFile(const QString& path, QString* error);
    static std::optional<SourceDocument> fromJson(const QJsonObject& json, QString* error);

    // Absolute paths of the *.json files in dir, sorted by file name.
    static QStringList listDocumentFiles(const QString& dir);
};

} // namespace lc
