#include "core/shared/types.h"

#include <QJsonValue>

#include <cmath>

namespace lc {

std::optional<int64_t> integralJsonValue(const QJsonValue& value)
{
    if (value.isDouble()) {
        const double number = value.toDouble();
        // 2^63 is exactly representable as a double but not as int64_t.
        constexpr double kInt64Bound = 9223372036854775808.0;
        if (!std::isfinite(number) || std::floor(number) != number
            || number >= kInt64Bound || number < -kInt64Bound) {
            return std::nullopt;
        }
        return static_cast<int64_t>(number);
    }
    if (value.isString()) {
        bool ok = false;
        const qlonglong parsed = value.toString().trimmed().toLongLong(&ok);
        if (!ok) {
            return std::nullopt;
        }
        return static_cast<int64_t>(parsed);
    }
    return std::nullopt;
}

QJsonObject ParagraphLocation::toJson() const
{
    QJsonObject json;
    json[QStringLiteral("doc_id")] = static_cast<qint64>(docId);
    json[QStringLiteral("chapter_id")] = static_cast<qint64>(chapterId);
    json[QStringLiteral("paragraph_id")] = static_cast<qint64>(paragraphId);
    return json;
}

std::optional<ParagraphLocation> ParagraphLocation::fromJson(const QJsonObject& json)
{
    const auto docId = integralJsonValue(json.value(QStringLiteral("doc_id")));
    const auto chapterId = integralJsonValue(json.value(QStringLiteral("chapter_id")));
    const auto paragraphId = integralJsonValue(json.value(QStringLiteral("paragraph_id")));
    if (!docId || !chapterId || !paragraphId) {
        return std::nullopt;
    }

    ParagraphLocation location;
    location.docId = *docId;
    location.chapterId = *chapterId;
    location.paragraphId = *paragraphId;
    return location;
}

QJsonObject ParagraphRecord::toJson() const
{
    QJsonObject json = location.toJson();
    json[QStringLiteral("id")] = static_cast<qint64>(id);
    json[QStringLiteral("text")] = text;
    return json;
}

QString errorCodeToString(ErrorCode code)
{
    switch (code) {
    case ErrorCode::None:                     return QStringLiteral("NONE");
    case ErrorCode::SourceUnavailable:        return QStringLiteral("SOURCE_UNAVAILABLE");
    case ErrorCode::DimensionMismatch:        return QStringLiteral("DIMENSION_MISMATCH");
    case ErrorCode::NotFound:                 return QStringLiteral("NOT_FOUND");
    case ErrorCode::MalformedTerminalPayload: return QStringLiteral("MALFORMED_TERMINAL_PAYLOAD");
    case ErrorCode::IterationLimitExceeded:   return QStringLiteral("ITERATION_LIMIT_EXCEEDED");
    case ErrorCode::MissingCredential:        return QStringLiteral("MISSING_CREDENTIAL");
    case ErrorCode::Cancelled:                return QStringLiteral("CANCELLED");
    case ErrorCode::Timeout:                  return QStringLiteral("TIMEOUT");
    case ErrorCode::InvalidParams:            return QStringLiteral("INVALID_PARAMS");
    case ErrorCode::InternalError:            return QStringLiteral("INTERNAL_ERROR");
    }
    return QStringLiteral("UNKNOWN");
}

} // namespace lc
