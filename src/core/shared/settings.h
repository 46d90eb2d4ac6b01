#pragma once

#include <QString>
#include <cstdint>

namespace lc {

struct Settings {
    // Storage
    QString dbPath;
    QString vectorIndexPath;
    QString vectorMetaPath;

    // Embedding provider (OpenAI-compatible /embeddings)
    QString embeddingBaseUrl = QStringLiteral("http://localhost:8080/v1");
    QString embeddingModel =
        QStringLiteral("sentence-transformers/paraphrase-multilingual-mpnet-base-v2");
    int embeddingDimensions = 768;
    int embeddingBatchSize = 32;

    // Reasoning engine (OpenAI-compatible /chat/completions)
    QString reasoningBaseUrl = QStringLiteral("https://api.openai.com/v1");
    QString reasoningModel = QStringLiteral("gpt-4-turbo");
    double reasoningTemperature = 0.0;

    // Retrieval
    int topK = 5;
    int rrfK = 60;
    bool keywordMatchAny = false;
    bool validatePayloads = true;

    // Refinement loop
    int maxIterations = 5;
    uint32_t providerTimeoutMs = 60000;
    uint32_t requestTimeoutMs = 300000;

    // Ingestion
    int minParagraphChars = 30;
};

} // namespace lc
