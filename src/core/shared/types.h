#pragma once

#include <QJsonObject>
#include <QJsonValue>
#include <QString>
#include <cstdint>
#include <optional>

namespace lc {

// Addressable coordinate of a paragraph inside the source corpus.
struct ParagraphLocation {
    int64_t docId = 0;
    int64_t chapterId = 0;
    int64_t paragraphId = 0;

    bool operator==(const ParagraphLocation& other) const
    {
        return docId == other.docId && chapterId == other.chapterId
            && paragraphId == other.paragraphId;
    }
    bool operator!=(const ParagraphLocation& other) const { return !(*this == other); }

    QJsonObject toJson() const;
    static std::optional<ParagraphLocation> fromJson(const QJsonObject& json);
};

// A stored paragraph. `id` is the join key shared by the record store,
// the keyword index and the vector index.
struct ParagraphRecord {
    int64_t id = 0;
    ParagraphLocation location;
    QString text;

    QJsonObject toJson() const;
};

// One entry of a single source's ranked list. rawScore is only meaningful
// for ordering within that source.
struct SearchHit {
    int64_t id = 0;
    int rank = 0;
    double rawScore = 0.0;
};

struct FusedHit {
    int64_t id = 0;
    double fusedScore = 0.0;
};

enum class ErrorCode {
    None,
    SourceUnavailable,
    DimensionMismatch,
    NotFound,
    MalformedTerminalPayload,
    IterationLimitExceeded,
    MissingCredential,
    Cancelled,
    Timeout,
    InvalidParams,
    InternalError,
};

QString errorCodeToString(ErrorCode code);

// Integral JSON number or decimal string ("12"); nullopt for anything else.
std::optional<int64_t> integralJsonValue(const QJsonValue& value);

} // namespace lc
