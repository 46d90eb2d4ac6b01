#include "core/embedding/http_embedding_client.h"
#include "core/net/http_json_client.h"
#include "core/shared/logging.h"

#include <QJsonArray>
#include <QJsonObject>

#include <algorithm>
#include <chrono>
#include <utility>

namespace lc {

namespace {

int64_t steadyNowMs()
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now().time_since_epoch())
        .count();
}

} // namespace

bool EmbeddingCircuitBreaker::isOpen() const
{
    if (consecutiveFailures.load() < kOpenThreshold) {
        return false;
    }
    // In open state: check if enough time has elapsed for half-open
    const int64_t lastFail = lastFailureTime.load();
    if (steadyNowMs() - lastFail >= kHalfOpenDelayMs) {
        return false;  // half-open: allow one attempt
    }
    return true;
}

void EmbeddingCircuitBreaker::recordSuccess()
{
    consecutiveFailures.store(0);
}

void EmbeddingCircuitBreaker::recordFailure()
{
    consecutiveFailures.fetch_add(1);
    lastFailureTime.store(steadyNowMs());
}

HttpEmbeddingClient::HttpEmbeddingClient(HttpEmbeddingConfig config)
    : m_config(std::move(config))
{
    QString base = m_config.baseUrl;
    while (base.endsWith(QLatin1Char('/'))) {
        base.chop(1);
    }
    m_endpoint = QUrl(base + QStringLiteral("/embeddings"));
    m_config.batchSize = std::max(1, m_config.batchSize);
}

std::optional<std::vector<float>> HttpEmbeddingClient::embedQuery(const QString& text,
                                                                  int timeoutMs)
{
    auto vectors = requestEmbeddings({text}, timeoutMs);
    if (!vectors.has_value() || vectors->size() != 1) {
        return std::nullopt;
    }
    return std::move(vectors->front());
}

std::optional<std::vector<std::vector<float>>> HttpEmbeddingClient::embedBatch(
    const std::vector<QString>& texts, int timeoutMs)
{
    std::vector<std::vector<float>> all;
    all.reserve(texts.size());

    const size_t batchSize = static_cast<size_t>(m_config.batchSize);
    for (size_t start = 0; start < texts.size(); start += batchSize) {
        const size_t end = std::min(texts.size(), start + batchSize);
        std::vector<QString> batch(texts.begin() + static_cast<std::ptrdiff_t>(start),
                                   texts.begin() + static_cast<std::ptrdiff_t>(end));
        auto vectors = requestEmbeddings(batch, timeoutMs);
        if (!vectors.has_value()) {
            return std::nullopt;
        }
        for (auto& vector : *vectors) {
            all.push_back(std::move(vector));
        }
    }
    return all;
}

std::optional<std::vector<std::vector<float>>> HttpEmbeddingClient::requestEmbeddings(
    const std::vector<QString>& texts, int timeoutMs)
{
    if (texts.empty()) {
        return std::vector<std::vector<float>>{};
    }
    if (m_circuitBreaker.isOpen()) {
        LOG_WARN(lcRetrieval, "Embedding circuit breaker open; skipping request");
        return std::nullopt;
    }

    QJsonArray input;
    for (const QString& text : texts) {
        input.append(text);
    }
    QJsonObject payload;
    payload.insert(QStringLiteral("model"), m_config.model);
    payload.insert(QStringLiteral("input"), input);

    const HttpResponse response = HttpJsonClient::postJson(
        m_endpoint, payload, HttpJsonClient::bearerHeaders(m_config.apiKey), timeoutMs);
    if (!response.ok()) {
        m_circuitBreaker.recordFailure();
        return std::nullopt;
    }

    QString parseError;
    const auto root = HttpJsonClient::parseObject(response.body, &parseError);
    if (!root.has_value()) {
        LOG_WARN(lcRetrieval, "Embedding response unparseable: %s", qUtf8Printable(parseError));
        m_circuitBreaker.recordFailure();
        return std::nullopt;
    }

    const QJsonArray data = root->value(QStringLiteral("data")).toArray();
    if (data.size() != static_cast<int>(texts.size())) {
        LOG_WARN(lcRetrieval, "Embedding response has %d vectors for %d inputs",
                 static_cast<int>(data.size()), static_cast<int>(texts.size()));
        m_circuitBreaker.recordFailure();
        return std::nullopt;
    }

    std::vector<std::vector<float>> vectors(texts.size());
    for (int i = 0; i < data.size(); ++i) {
        const QJsonObject entry = data.at(i).toObject();
        const int index = entry.value(QStringLiteral("index")).toInt(i);
        if (index < 0 || index >= static_cast<int>(vectors.size())) {
            LOG_WARN(lcRetrieval, "Embedding response index %d out of range", index);
            m_circuitBreaker.recordFailure();
            return std::nullopt;
        }
        const QJsonArray values = entry.value(QStringLiteral("embedding")).toArray();
        std::vector<float>& vector = vectors[static_cast<size_t>(index)];
        vector.reserve(static_cast<size_t>(values.size()));
        for (const QJsonValue& value : values) {
            vector.push_back(static_cast<float>(value.toDouble()));
        }
    }

    for (const auto& vector : vectors) {
        if (vector.empty()) {
            LOG_WARN(lcRetrieval, "Embedding response contains an empty vector");
            m_circuitBreaker.recordFailure();
            return std::nullopt;
        }
    }

    m_circuitBreaker.recordSuccess();
    return vectors;
}

} // namespace lc
