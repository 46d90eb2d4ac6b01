#pragma once

#include "core/embedding/embedding_provider.h"

#include <QString>
#include <QUrl>

#include <atomic>
#include <cstdint>

namespace lc {

struct EmbeddingCircuitBreaker {
    std::atomic<int> consecutiveFailures{0};
    std::atomic<int64_t> lastFailureTime{0};
    static constexpr int kOpenThreshold = 5;          // Open after 5 consecutive failures
    static constexpr int kHalfOpenDelayMs = 30000;    // Try again after 30s

    bool isOpen() const;
    void recordSuccess();
    void recordFailure();
};

struct HttpEmbeddingConfig {
    QString baseUrl;
    QString model;
    QString apiKey;
    int dimensions = 0;
    int batchSize = 32;
};

// Client for an OpenAI-compatible POST {baseUrl}/embeddings endpoint.
class HttpEmbeddingClient : public EmbeddingProvider {
public:
    explicit HttpEmbeddingClient(HttpEmbeddingConfig config);

    HttpEmbeddingClient(const HttpEmbeddingClient&) = delete;
    HttpEmbeddingClient& operator=(const HttpEmbeddingClient&) = delete;

    std::optional<std::vector<float>> embedQuery(const QString& text, int timeoutMs) override;
    std::optional<std::vector<std::vector<float>>> embedBatch(
        const std::vector<QString>& texts, int timeoutMs) override;

    int dimensions() const override { return m_config.dimensions; }
    QString modelId() const override { return m_config.model; }

    // Expose for testing
    EmbeddingCircuitBreaker& circuitBreaker() { return m_circuitBreaker; }

private:
    std::optional<std::vector<std::vector<float>>> requestEmbeddings(
        const std::vector<QString>& texts, int timeoutMs);

    HttpEmbeddingConfig m_config;
    QUrl m_endpoint;
    EmbeddingCircuitBreaker m_circuitBreaker;
};

} // namespace lc
