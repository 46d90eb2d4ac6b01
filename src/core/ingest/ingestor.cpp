#include "core/ingest/ingestor.h"
#include "core/embedding/embedding_provider.h"
#include "core/index/keyword_index.h"
#include "core/index/record_store.h"
#include "core/ingest/html_cleaner.h"
#include "core/shared/logging.h"
#include "core/vector/vector_index.h"
#include "core/vector/vector_store.h"

#include <QDateTime>
#include <QElapsedTimer>

#include <exception>

namespace lc {

QJsonObject IngestStats::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("documents")] = documents;
    json[QStringLiteral("documents_failed")] = documentsFailed;
    json[QStringLiteral("paragraphs_stored")] = paragraphsStored;
    json[QStringLiteral("paragraphs_rejected")] = paragraphsRejected;
    return json;
}

Ingestor::Ingestor(RecordStore& store, KeywordIndex& keyword, VectorIndex& vectors,
                   VectorStore& payloads, EmbeddingProvider& embedder, IngestConfig config)
    : m_store(store)
    , m_keyword(keyword)
    , m_vectors(vectors)
    , m_payloads(payloads)
    , m_embedder(embedder)
    , m_config(std::move(config))
{
    if (m_config.modelId.empty()) {
        m_config.modelId = m_embedder.modelId().toStdString();
    }
}

std::vector<PreparedParagraph> Ingestor::prepare(const SourceDocument& document,
                                                 int* rejected) const
{
    std::vector<PreparedParagraph> prepared;
    int dropped = 0;
    for (const SourceChapter& chapter : document.chapters) {
        for (const SourceParagraph& paragraph : chapter.paragraphs) {
            const QString text = HtmlCleaner::clean(paragraph.content);
            if (text.size() < m_config.minParagraphChars || text.isEmpty()) {
                ++dropped;
                continue;
            }
            PreparedParagraph entry;
            entry.location.docId = document.id;
            entry.location.chapterId = chapter.id;
            entry.location.paragraphId = paragraph.id;
            entry.text = text;
            prepared.push_back(std::move(entry));
        }
    }
    if (rejected) {
        *rejected = dropped;
    }
    return prepared;
}

bool Ingestor::ingestDocument(const SourceDocument& document, IngestStats& stats)
{
    QElapsedTimer timer;
    timer.start();

    int rejected = 0;
    const std::vector<PreparedParagraph> prepared = prepare(document, &rejected);
    stats.paragraphsRejected += rejected;

    if (prepared.empty()) {
        LOG_INFO(lcIngest, "Document %lld: no paragraphs after filtering (%d rejected)",
                 static_cast<long long>(document.id), rejected);
        ++stats.documents;
        return true;
    }

    std::vector<QString> texts;
    texts.reserve(prepared.size());
    for (const PreparedParagraph& paragraph : prepared) {
        texts.push_back(paragraph.text);
    }

    std::optional<std::vector<std::vector<float>>> embeddings;
    try {
        embeddings = m_embedder.embedBatch(texts, m_config.embedTimeoutMs);
    } catch (const std::exception& e) {
        LOG_ERROR(lcIngest, "Document %lld: embedding provider threw: %s",
                  static_cast<long long>(document.id), e.what());
    }
    if (!embeddings.has_value() || embeddings->size() != prepared.size()) {
        LOG_ERROR(lcIngest, "Document %lld: embedding failed, skipping document",
                  static_cast<long long>(document.id));
        ++stats.documentsFailed;
        return false;
    }
    for (const auto& embedding : *embeddings) {
        if (static_cast<int>(embedding.size()) != m_vectors.dimensions()) {
            LOG_ERROR(lcIngest, "Document %lld: embedding has %d dimensions, index expects %d",
                      static_cast<long long>(document.id), static_cast<int>(embedding.size()),
                      m_vectors.dimensions());
            ++stats.documentsFailed;
            return false;
        }
    }

    if (!m_store.beginTransaction()) {
        LOG_ERROR(lcIngest, "Document %lld: cannot begin transaction",
                  static_cast<long long>(document.id));
        ++stats.documentsFailed;
        return false;
    }

    std::vector<int64_t> addedVectorIds;
    bool ok = true;
    for (size_t i = 0; i < prepared.size() && ok; ++i) {
        const PreparedParagraph& paragraph = prepared[i];

        ParagraphRecord record;
        record.location = paragraph.location;
        record.text = paragraph.text;
        const auto id = m_store.put(record);
        if (!id.has_value()) {
            LOG_ERROR(lcIngest, "Document %lld: failed to store paragraph %lld",
                      static_cast<long long>(document.id),
                      static_cast<long long>(paragraph.location.paragraphId));
            ok = false;
            break;
        }

        if (!m_keyword.index(*id, paragraph.text)
            || !m_payloads.addPoint(*id, paragraph.location, m_config.modelId)) {
            ok = false;
            break;
        }

        const bool existed = m_vectors.contains(*id);
        const VectorIndex::Status status = m_vectors.upsert(*id, (*embeddings)[i]);
        if (status != VectorIndex::Status::Ok) {
            LOG_ERROR(lcIngest, "Document %lld: vector upsert failed for id=%lld",
                      static_cast<long long>(document.id), static_cast<long long>(*id));
            ok = false;
            break;
        }
        if (!existed) {
            addedVectorIds.push_back(*id);
        }
    }

    if (ok && !m_store.commitTransaction()) {
        LOG_ERROR(lcIngest, "Document %lld: commit failed", static_cast<long long>(document.id));
        ok = false;
    }

    if (!ok) {
        m_store.rollbackTransaction();
        rollbackDocument(addedVectorIds);
        ++stats.documentsFailed;
        return false;
    }

    ++stats.documents;
    stats.paragraphsStored += static_cast<int>(prepared.size());
    LOG_INFO(lcIngest, "Document %lld: stored %d paragraphs (%d rejected) in %lld ms",
             static_cast<long long>(document.id), static_cast<int>(prepared.size()), rejected,
             static_cast<long long>(timer.elapsed()));
    return true;
}

void Ingestor::rollbackDocument(const std::vector<int64_t>& addedVectorIds)
{
    for (int64_t id : addedVectorIds) {
        if (!m_vectors.remove(id)) {
            LOG_WARN(lcIngest, "Rollback could not remove vector id=%lld",
                     static_cast<long long>(id));
        }
    }
}

IngestStats Ingestor::ingestDirectory(const QString& dir)
{
    IngestStats stats;
    const QStringList files = DocumentLoader::listDocumentFiles(dir);
    LOG_INFO(lcIngest, "Ingesting %d document files from %s",
             static_cast<int>(files.size()), qUtf8Printable(dir));

    for (const QString& path : files) {
        QString error;
        const auto document = DocumentLoader::loadFile(path, &error);
        if (!document.has_value()) {
            LOG_WARN(lcIngest, "Skipping %s: %s", qUtf8Printable(path), qUtf8Printable(error));
            ++stats.documentsFailed;
            continue;
        }
        ingestDocument(*document, stats);
    }

    m_store.setSetting(QStringLiteral("embedding_model"), QString::fromStdString(m_config.modelId));
    m_store.setSetting(QStringLiteral("embedding_dimensions"),
                       QString::number(m_vectors.dimensions()));
    m_store.setSetting(QStringLiteral("last_ingest_at"),
                       QString::number(QDateTime::currentSecsSinceEpoch()));

    LOG_INFO(lcIngest, "Ingestion finished: %d documents, %d failed, %d paragraphs stored, %d rejected",
             stats.documents, stats.documentsFailed, stats.paragraphsStored,
             stats.paragraphsRejected);
    return stats;
}

} // namespace lc
