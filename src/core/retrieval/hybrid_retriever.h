#pragma once

#include "core/shared/search_sources.h"
#include "core/shared/types.h"

#include <QJsonObject>
#include <QString>

#include <optional>
#include <vector>

namespace lc {

class EmbeddingProvider;
class VectorStore;

struct RetrieverConfig {
    int rrfK = 60;
    int defaultTopK = 5;
    // Per-source budget: keyword deadline and embedding request timeout.
    int timeoutMs = 15000;
    bool validatePayloads = true;
};

struct RetrievalReport {
    std::vector<ParagraphRecord> records;
    std::vector<FusedHit> fused;
    int keywordHits = 0;
    int vectorHits = 0;
    bool keywordAvailable = true;
    bool vectorAvailable = true;
    ErrorCode error = ErrorCode::None;
    QString errorMessage;
    // Fused ids with no stored record.
    std::vector<int64_t> droppedIds;
    // Ids whose vector payload disagrees with the stored location.
    std::vector<int64_t> driftIds;

    bool ok() const { return error == ErrorCode::None; }
    QJsonObject toJson() const;
};

// Keyword + vector search fused by Reciprocal Rank Fusion and hydrated
// from the record store. A failing source degrades to an empty list; only
// an embedding/index dimension mismatch fails the request.
class HybridRetriever {
public:
    HybridRetriever(KeywordSource& keyword, VectorSource& vectors,
                    EmbeddingProvider& embedder, RecordSource& records,
                    RetrieverConfig config = {});

    HybridRetriever(const HybridRetriever&) = delete;
    HybridRetriever& operator=(const HybridRetriever&) = delete;

    // Optional: cross-check hydrated records against the vector payload
    // table. Not owned.
    void setPayloadValidator(VectorStore* payloads) { m_payloads = payloads; }

    // At most k records in fused order. nullopt only on a fatal error
    // (DimensionMismatch); both sources empty yields an empty vector.
    std::optional<std::vector<ParagraphRecord>> retrieve(const QString& query, int k);

    // timeoutMs <= 0 uses the configured budget.
    RetrievalReport retrieveDetailed(const QString& query, int k, int timeoutMs = 0);

    const RetrieverConfig& config() const { return m_config; }

private:
    struct VectorBranchResult {
        std::vector<SearchHit> hits;
        bool available = true;
        bool dimensionMismatch = false;
        QString message;
    };

    std::optional<std::vector<SearchHit>> runKeyword(const QString& query, int k, int timeoutMs);
    VectorBranchResult runVector(const QString& query, int k, int timeoutMs);
    void checkPayloads(RetrievalReport& report);

    KeywordSource& m_keyword;
    VectorSource& m_vectors;
    EmbeddingProvider& m_embedder;
    RecordSource& m_records;
    VectorStore* m_payloads = nullptr;
    RetrieverConfig m_config;
};

} // namespace lc
