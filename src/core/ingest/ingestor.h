#pragma once

#include "core/ingest/document_loader.h"
#include "core/shared/types.h"

#include <QJsonObject>
#include <QString>

#include <string>
#include <vector>

namespace lc {

class EmbeddingProvider;
class KeywordIndex;
class RecordStore;
class VectorIndex;
class VectorStore;

struct IngestConfig {
    int minParagraphChars = 30;
    int embedTimeoutMs = 60000;
    std::string modelId;
};

struct IngestStats {
    int documents = 0;
    int documentsFailed = 0;
    int paragraphsStored = 0;
    int paragraphsRejected = 0;

    QJsonObject toJson() const;
};

struct PreparedParagraph {
    ParagraphLocation location;
    QString text;
};

// Ingestor: writes source documents into the record store and both
// indexes under one id per paragraph.
//
// Per document:
//   1. Clean HTML and drop paragraphs shorter than minParagraphChars
//   2. Embed all surviving paragraphs (no lock held, no transaction open)
//   3. In one SQLite transaction: record, FTS5 row, payload row, HNSW upsert
//   4. On any failure roll back and remove the vectors this document added
//
// A document is either fully present in all three stores or absent.
class Ingestor {
public:
    Ingestor(RecordStore& store, KeywordIndex& keyword, VectorIndex& vectors,
             VectorStore& payloads, EmbeddingProvider& embedder, IngestConfig config = {});

    Ingestor(const Ingestor&) = delete;
    Ingestor& operator=(const Ingestor&) = delete;

    // Prep stage: pure, does not touch any store.
    std::vector<PreparedParagraph> prepare(const SourceDocument& document, int* rejected) const;

    bool ingestDocument(const SourceDocument& document, IngestStats& stats);
    IngestStats ingestDirectory(const QString& dir);

private:
    void rollbackDocument(const std::vector<int64_t>& addedVectorIds);

    RecordStore& m_store;
    KeywordIndex& m_keyword;
    VectorIndex& m_vectors;
    VectorStore& m_payloads;
    EmbeddingProvider& m_embedder;
    IngestConfig m_config;
};

} // namespace lc
