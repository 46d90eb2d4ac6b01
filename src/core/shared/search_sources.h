#pragma once

#include "core/shared/types.h"

#include <QString>
#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

namespace lc {

// Seams between the hybrid retriever and its backends. Production code
// binds them to KeywordIndex, VectorIndex and RecordStore; tests bind
// them to in-memory doubles.

class KeywordSource {
public:
    virtual ~KeywordSource() = default;

    // Ranked hits for the query, at most k. nullopt means the backend
    // failed (or ran past timeoutMs); an empty vector is a valid answer.
    virtual std::optional<std::vector<SearchHit>> search(const QString& query, int k,
                                                         int timeoutMs) = 0;
};

enum class VectorSearchStatus {
    Ok,
    Unavailable,
    DimensionMismatch,
    BackendError,
};

class VectorSource {
public:
    virtual ~VectorSource() = default;

    virtual VectorSearchStatus search(const std::vector<float>& query, int k,
                                      std::vector<SearchHit>* hits) = 0;
    virtual int dimensions() const = 0;
};

class RecordSource {
public:
    virtual ~RecordSource() = default;

    // Missing ids are omitted from the result, never an error.
    virtual std::unordered_map<int64_t, ParagraphRecord> getMany(
        const std::vector<int64_t>& ids) = 0;
};

} // namespace lc
