#pragma once

#include <QString>

#include <optional>
#include <vector>

namespace lc {

// Text -> vector. nullopt reports a provider failure (network, timeout,
// malformed response); callers decide whether that is fatal.
class EmbeddingProvider {
public:
    virtual ~EmbeddingProvider() = default;

    virtual std::optional<std::vector<float>> embedQuery(const QString& text, int timeoutMs) = 0;
    virtual std::optional<std::vector<std::vector<float>>> embedBatch(
        const std::vector<QString>& texts, int timeoutMs) = 0;

    virtual int dimensions() const = 0;
    virtual QString modelId() const = 0;
};

} // namespace lc
