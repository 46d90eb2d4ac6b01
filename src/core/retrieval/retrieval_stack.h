#pragma once

#include "core/index/keyword_index.h"
#include "core/index/record_store.h"
#include "core/retrieval/consistency_checker.h"
#include "core/retrieval/hybrid_retriever.h"
#include "core/shared/settings.h"
#include "core/vector/vector_index.h"
#include "core/vector/vector_store.h"

#include <QString>

#include <memory>
#include <optional>

namespace lc {

class EmbeddingProvider;

// Everything a process needs to search the corpus, opened from Settings.
// Member order matters: statements prepared on the shared connection are
// finalized before the RecordStore closes it.
class RetrievalStack {
public:
    ~RetrievalStack();

    RetrievalStack(const RetrievalStack&) = delete;
    RetrievalStack& operator=(const RetrievalStack&) = delete;

    // Opens (or creates) the database and loads the vector index; a
    // missing index file yields an empty index with the configured
    // dimensions. Pass an embedder to override the HTTP client built from
    // settings. Returns nullptr and fills *error on failure.
    static std::unique_ptr<RetrievalStack> open(const Settings& settings,
                                                std::unique_ptr<EmbeddingProvider> embedder,
                                                QString* error);

    RecordStore& store() { return *m_store; }
    KeywordIndex& keyword() { return *m_keyword; }
    VectorIndex& vectors() { return *m_vectors; }
    VectorStore& payloads() { return *m_payloads; }
    EmbeddingProvider& embedder() { return *m_embedder; }
    HybridRetriever& retriever() { return *m_retriever; }
    const Settings& settings() const { return m_settings; }

    bool saveVectors();
    // Replace the vector index with an empty one (used before a rebuild).
    bool resetVectors();
    ConsistencyReport checkConsistency();

private:
    RetrievalStack() = default;
    bool createEmptyVectorIndex();
    void buildRetriever();

    Settings m_settings;
    std::optional<RecordStore> m_store;
    std::unique_ptr<KeywordIndex> m_keyword;
    std::unique_ptr<VectorStore> m_payloads;
    std::unique_ptr<VectorIndex> m_vectors;
    std::unique_ptr<EmbeddingProvider> m_embedder;
    std::unique_ptr<HybridRetriever> m_retriever;
};

} // namespace lc
