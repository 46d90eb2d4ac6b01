#include "core/retrieval/retrieval_stack.h"
#include "core/embedding/http_embedding_client.h"
#include "core/shared/logging.h"
#include "core/shared/settings_manager.h"

#include <QDir>
#include <QFileInfo>

namespace lc {

RetrievalStack::~RetrievalStack()
{
    m_retriever.reset();
    m_embedder.reset();
    m_vectors.reset();
    m_payloads.reset();
    m_keyword.reset();
    m_store.reset();
}

std::unique_ptr<RetrievalStack> RetrievalStack::open(const Settings& settings,
                                                     std::unique_ptr<EmbeddingProvider> embedder,
                                                     QString* error)
{
    auto fail = [error](const QString& message) -> std::unique_ptr<RetrievalStack> {
        LOG_ERROR(lcCore, "%s", qUtf8Printable(message));
        if (error) {
            *error = message;
        }
        return nullptr;
    };

    if (settings.embeddingDimensions <= 0) {
        return fail(QStringLiteral("embeddingDimensions must be positive"));
    }

    const QString dataDir = QFileInfo(settings.dbPath).absolutePath();
    if (!QDir().mkpath(dataDir)) {
        return fail(QStringLiteral("Cannot create data directory %1").arg(dataDir));
    }

    std::unique_ptr<RetrievalStack> stack(new RetrievalStack());
    stack->m_settings = settings;

    stack->m_store = RecordStore::open(settings.dbPath);
    if (!stack->m_store.has_value()) {
        return fail(QStringLiteral("Cannot open record store at %1").arg(settings.dbPath));
    }

    stack->m_keyword = std::make_unique<KeywordIndex>(stack->m_store->rawDb());
    stack->m_keyword->setMatchMode(settings.keywordMatchAny ? KeywordIndex::MatchMode::AnyTerms
                                                            : KeywordIndex::MatchMode::AllTerms);

    stack->m_payloads = std::make_unique<VectorStore>(stack->m_store->rawDb());
    if (!stack->m_payloads->isReady()) {
        return fail(QStringLiteral("Cannot prepare vector payload table"));
    }

    VectorIndex::IndexMetadata metadata;
    metadata.dimensions = settings.embeddingDimensions;
    metadata.modelId = settings.embeddingModel.toStdString();
    stack->m_vectors = std::make_unique<VectorIndex>(metadata);

    if (QFileInfo::exists(settings.vectorIndexPath)) {
        if (!stack->m_vectors->load(settings.vectorIndexPath.toStdString(),
                                    settings.vectorMetaPath.toStdString())) {
            return fail(QStringLiteral("Cannot load vector index %1").arg(settings.vectorIndexPath));
        }
        if (stack->m_vectors->metadata().modelId != metadata.modelId) {
            LOG_WARN(lcVector, "Vector index was built with model '%s', configured model is '%s'",
                     stack->m_vectors->metadata().modelId.c_str(), metadata.modelId.c_str());
        }
    } else if (!stack->createEmptyVectorIndex()) {
        return fail(QStringLiteral("Cannot create vector index"));
    }

    if (embedder) {
        stack->m_embedder = std::move(embedder);
    } else {
        HttpEmbeddingConfig embeddingConfig;
        embeddingConfig.baseUrl = settings.embeddingBaseUrl;
        embeddingConfig.model = settings.embeddingModel;
        embeddingConfig.apiKey = SettingsManager::resolveEmbeddingApiKey();
        embeddingConfig.dimensions = settings.embeddingDimensions;
        embeddingConfig.batchSize = settings.embeddingBatchSize;
        stack->m_embedder = std::make_unique<HttpEmbeddingClient>(embeddingConfig);
    }

    stack->buildRetriever();

    LOG_INFO(lcCore, "Retrieval stack ready: %d records, %d vectors (dims=%d)",
             stack->m_store->count(), stack->m_vectors->activeElements(),
             stack->m_vectors->dimensions());
    return stack;
}

bool RetrievalStack::createEmptyVectorIndex()
{
    VectorIndex::IndexMetadata metadata;
    metadata.dimensions = m_settings.embeddingDimensions;
    metadata.modelId = m_settings.embeddingModel.toStdString();
    m_vectors = std::make_unique<VectorIndex>(metadata);
    return m_vectors->create();
}

void RetrievalStack::buildRetriever()
{
    RetrieverConfig retrieverConfig;
    retrieverConfig.rrfK = m_settings.rrfK;
    retrieverConfig.defaultTopK = m_settings.topK;
    retrieverConfig.timeoutMs = static_cast<int>(m_settings.providerTimeoutMs);
    retrieverConfig.validatePayloads = m_settings.validatePayloads;
    m_retriever = std::make_unique<HybridRetriever>(*m_keyword, *m_vectors, *m_embedder,
                                                    *m_store, retrieverConfig);
    m_retriever->setPayloadValidator(m_payloads.get());
}

bool RetrievalStack::saveVectors()
{
    return m_vectors->save(m_settings.vectorIndexPath.toStdString(),
                           m_settings.vectorMetaPath.toStdString());
}

bool RetrievalStack::resetVectors()
{
    // The retriever holds a reference to the index; rebuild it too.
    m_retriever.reset();
    const bool created = createEmptyVectorIndex();
    buildRetriever();
    return created;
}

ConsistencyReport RetrievalStack::checkConsistency()
{
    return ConsistencyChecker::check(*m_store, *m_keyword, *m_vectors, *m_payloads);
}

} // namespace lc
