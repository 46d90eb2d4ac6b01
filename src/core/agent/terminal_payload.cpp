#include "core/agent/terminal_payload.h"

#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>

namespace lc {

QStringList TerminalPayload::extractJsonObjects(const QString& text)
{
    QStringList objects;
    int depth = 0;
    int start = -1;
    bool inString = false;
    bool escaped = false;

    for (int i = 0; i < text.size(); ++i) {
        const QChar ch = text.at(i);

        if (inString) {
            if (escaped) {
                escaped = false;
            } else if (ch == QLatin1Char('\\')) {
                escaped = true;
            } else if (ch == QLatin1Char('"')) {
                inString = false;
            }
            continue;
        }

        if (ch == QLatin1Char('"')) {
            // Quotes outside any object are prose, not JSON strings.
            if (depth > 0) {
                inString = true;
            }
        } else if (ch == QLatin1Char('{')) {
            if (depth == 0) {
                start = i;
            }
            ++depth;
        } else if (ch == QLatin1Char('}') && depth > 0) {
            --depth;
            if (depth == 0) {
                objects.push_back(text.mid(start, i - start + 1));
                start = -1;
            }
        }
    }
    return objects;
}

TerminalPayload TerminalPayload::interpret(const QString& text)
{
    TerminalPayload payload;
    payload.raw = text;

    const QStringList objects = extractJsonObjects(text);
    if (objects.isEmpty()) {
        payload.problem = QStringLiteral("no JSON object found");
        return payload;
    }
    if (objects.size() > 1) {
        payload.problem = QStringLiteral("expected one JSON object, found %1").arg(objects.size());
        return payload;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(objects.front().toUtf8(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        payload.problem = QStringLiteral("invalid JSON: %1").arg(parseError.errorString());
        return payload;
    }

    const QJsonObject object = doc.object();
    if (object.contains(QStringLiteral("error"))) {
        payload.kind = Kind::Failure;
        const QJsonValue reason = object.value(QStringLiteral("error"));
        payload.failureReason = reason.isString()
            ? reason.toString()
            : QString::fromUtf8(QJsonDocument(object).toJson(QJsonDocument::Compact));
        if (payload.failureReason.isEmpty()) {
            payload.failureReason = QStringLiteral("justification paragraph not found");
        }
        return payload;
    }

    const auto location = ParagraphLocation::fromJson(object);
    if (!location.has_value()) {
        payload.problem = QStringLiteral("object lacks integer doc_id, chapter_id, paragraph_id");
        return payload;
    }

    payload.kind = Kind::Location;
    payload.location = location;
    return payload;
}

} // namespace lc
