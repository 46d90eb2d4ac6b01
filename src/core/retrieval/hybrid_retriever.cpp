#include "core/retrieval/hybrid_retriever.h"
#include "core/embedding/embedding_provider.h"
#include "core/shared/logging.h"
#include "core/vector/search_merger.h"
#include "core/vector/vector_store.h"

#include <QJsonArray>

#include <exception>
#include <future>
#include <system_error>

namespace lc {

QJsonObject RetrievalReport::toJson() const
{
    QJsonArray recordsJson;
    for (size_t i = 0; i < records.size(); ++i) {
        QJsonObject entry = records[i].toJson();
        for (const FusedHit& hit : fused) {
            if (hit.id == records[i].id) {
                entry[QStringLiteral("fused_score")] = hit.fusedScore;
                break;
            }
        }
        recordsJson.append(entry);
    }

    QJsonObject sources;
    sources[QStringLiteral("keyword_hits")] = keywordHits;
    sources[QStringLiteral("vector_hits")] = vectorHits;
    sources[QStringLiteral("keyword_available")] = keywordAvailable;
    sources[QStringLiteral("vector_available")] = vectorAvailable;

    QJsonArray dropped;
    for (int64_t id : droppedIds) {
        dropped.append(static_cast<qint64>(id));
    }
    QJsonArray drift;
    for (int64_t id : driftIds) {
        drift.append(static_cast<qint64>(id));
    }

    QJsonObject json;
    json[QStringLiteral("records")] = recordsJson;
    json[QStringLiteral("sources")] = sources;
    json[QStringLiteral("dropped_ids")] = dropped;
    json[QStringLiteral("drift_ids")] = drift;
    return json;
}

HybridRetriever::HybridRetriever(KeywordSource& keyword, VectorSource& vectors,
                                 EmbeddingProvider& embedder, RecordSource& records,
                                 RetrieverConfig config)
    : m_keyword(keyword)
    , m_vectors(vectors)
    , m_embedder(embedder)
    , m_records(records)
    , m_config(config)
{
}

std::optional<std::vector<ParagraphRecord>> HybridRetriever::retrieve(const QString& query, int k)
{
    RetrievalReport report = retrieveDetailed(query, k);
    if (!report.ok()) {
        return std::nullopt;
    }
    return std::move(report.records);
}

RetrievalReport HybridRetriever::retrieveDetailed(const QString& query, int k, int timeoutMs)
{
    RetrievalReport report;
    if (k <= 0) {
        return report;
    }
    const int budgetMs = timeoutMs > 0 ? timeoutMs : m_config.timeoutMs;

    // The vector branch embeds over the network; run it beside the keyword
    // search instead of after it.
    std::future<VectorBranchResult> vectorFuture;
    bool vectorAsync = true;
    try {
        vectorFuture = std::async(std::launch::async, [this, query, k, budgetMs]() {
            return runVector(query, k, budgetMs);
        });
    } catch (const std::system_error& e) {
        LOG_WARN(lcRetrieval, "Vector branch thread unavailable (%s); running inline", e.what());
        vectorAsync = false;
    }

    const auto keywordHits = runKeyword(query, k, budgetMs);
    const VectorBranchResult vector = vectorAsync ? vectorFuture.get()
                                                  : runVector(query, k, budgetMs);

    report.keywordAvailable = keywordHits.has_value();
    report.keywordHits = keywordHits ? static_cast<int>(keywordHits->size()) : 0;
    report.vectorAvailable = vector.available;
    report.vectorHits = static_cast<int>(vector.hits.size());

    if (vector.dimensionMismatch) {
        report.error = ErrorCode::DimensionMismatch;
        report.errorMessage = vector.message;
        LOG_ERROR(lcRetrieval, "Retrieval failed: %s", qUtf8Printable(vector.message));
        return report;
    }

    std::vector<std::vector<SearchHit>> lists;
    lists.push_back(keywordHits.value_or(std::vector<SearchHit>{}));
    lists.push_back(vector.hits);

    FusionConfig fusion;
    fusion.rrfK = m_config.rrfK;
    fusion.maxResults = k;
    report.fused = SearchMerger::fuse(lists, fusion);

    if (report.fused.empty()) {
        LOG_DEBUG(lcRetrieval, "No hits for '%s' (keyword %s, vector %s)",
                  qUtf8Printable(query),
                  report.keywordAvailable ? "ok" : "unavailable",
                  report.vectorAvailable ? "ok" : "unavailable");
        return report;
    }

    std::vector<int64_t> ids;
    ids.reserve(report.fused.size());
    for (const FusedHit& hit : report.fused) {
        ids.push_back(hit.id);
    }

    std::unordered_map<int64_t, ParagraphRecord> hydrated;
    try {
        hydrated = m_records.getMany(ids);
    } catch (const std::exception& e) {
        report.error = ErrorCode::InternalError;
        report.errorMessage = QStringLiteral("record store failure: %1")
                                  .arg(QString::fromUtf8(e.what()));
        LOG_ERROR(lcRetrieval, "Hydration failed: %s", e.what());
        return report;
    }

    report.records.reserve(ids.size());
    for (int64_t id : ids) {
        auto it = hydrated.find(id);
        if (it == hydrated.end()) {
            report.droppedIds.push_back(id);
            continue;
        }
        report.records.push_back(std::move(it->second));
    }
    if (!report.droppedIds.empty()) {
        LOG_WARN(lcRetrieval, "Dropped %d fused ids with no stored record",
                 static_cast<int>(report.droppedIds.size()));
    }

    if (m_config.validatePayloads && m_payloads) {
        checkPayloads(report);
    }

    LOG_DEBUG(lcRetrieval, "'%s': keyword=%d vector=%d fused=%d records=%d",
              qUtf8Printable(query), report.keywordHits, report.vectorHits,
              static_cast<int>(report.fused.size()), static_cast<int>(report.records.size()));
    return report;
}

std::optional<std::vector<SearchHit>> HybridRetriever::runKeyword(const QString& query, int k,
                                                                  int timeoutMs)
{
    try {
        auto hits = m_keyword.search(query, k, timeoutMs);
        if (!hits.has_value()) {
            LOG_WARN(lcRetrieval, "Keyword source unavailable; continuing with vector hits only");
        }
        return hits;
    } catch (const std::exception& e) {
        LOG_WARN(lcRetrieval, "Keyword source threw: %s", e.what());
        return std::nullopt;
    }
}

HybridRetriever::VectorBranchResult HybridRetriever::runVector(const QString& query, int k,
                                                               int timeoutMs)
{
    VectorBranchResult result;
    try {
        const auto embedding = m_embedder.embedQuery(query, timeoutMs);
        if (!embedding.has_value()) {
            result.available = false;
            LOG_WARN(lcRetrieval, "Embedding provider unavailable; continuing with keyword hits only");
            return result;
        }

        const int expected = m_vectors.dimensions();
        if (static_cast<int>(embedding->size()) != expected) {
            result.available = false;
            result.dimensionMismatch = true;
            result.message = QStringLiteral("embedding has %1 dimensions, vector index expects %2")
                                 .arg(static_cast<int>(embedding->size()))
                                 .arg(expected);
            return result;
        }

        switch (m_vectors.search(*embedding, k, &result.hits)) {
        case VectorSearchStatus::Ok:
            break;
        case VectorSearchStatus::DimensionMismatch:
            result.hits.clear();
            result.available = false;
            result.dimensionMismatch = true;
            result.message = QStringLiteral("vector index rejected query dimensions");
            break;
        case VectorSearchStatus::Unavailable:
        case VectorSearchStatus::BackendError:
            result.hits.clear();
            result.available = false;
            LOG_WARN(lcRetrieval, "Vector source unavailable; continuing with keyword hits only");
            break;
        }
    } catch (const std::exception& e) {
        LOG_WARN(lcRetrieval, "Vector branch threw: %s", e.what());
        result.hits.clear();
        result.available = false;
    }
    return result;
}

void HybridRetriever::checkPayloads(RetrievalReport& report)
{
    for (const ParagraphRecord& record : report.records) {
        const auto location = m_payloads->getLocation(record.id);
        if (location.has_value() && *location != record.location) {
            report.driftIds.push_back(record.id);
            LOG_WARN(lcRetrieval,
                     "Payload drift for id=%lld: store (%lld,%lld,%lld) vector (%lld,%lld,%lld)",
                     static_cast<long long>(record.id),
                     static_cast<long long>(record.location.docId),
                     static_cast<long long>(record.location.chapterId),
                     static_cast<long long>(record.location.paragraphId),
                     static_cast<long long>(location->docId),
                     static_cast<long long>(location->chapterId),
                     static_cast<long long>(location->paragraphId));
        }
    }
}

} // namespace lc
