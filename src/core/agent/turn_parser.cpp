#include "core/agent/turn_parser.h"
#include "core/agent/terminal_payload.h"

#include <QRegularExpression>

namespace lc {

namespace {

// Strip matching quotes/backticks the engine sometimes wraps values in.
QString unwrap(QString value)
{
    value = value.trimmed();
    static const QString kWrappers = QStringLiteral("\"'`");
    while (value.size() >= 2 && kWrappers.contains(value.front())
           && value.back() == value.front()) {
        value = value.mid(1, value.size() - 2).trimmed();
    }
    return value;
}

QString normalizeToolName(QString tool)
{
    tool = unwrap(tool);
    if (tool.startsWith(QLatin1Char('[')) && tool.endsWith(QLatin1Char(']'))) {
        tool = tool.mid(1, tool.size() - 2).trimmed();
    }
    return tool;
}

// True when text, once code fences are dropped, is a single JSON object and
// nothing else.
bool isBareJsonObject(const QString& text)
{
    static const QRegularExpression fenceRe(QStringLiteral("```[A-Za-z]*"));
    const QString stripped = QString(text).remove(fenceRe).trimmed();
    const QStringList objects = TerminalPayload::extractJsonObjects(stripped);
    return objects.size() == 1 && objects.front() == stripped;
}

} // namespace

Turn TurnParser::parse(const QString& text)
{
    static const QRegularExpression finalAnswerRe(
        QStringLiteral("Final\\s*Answer\\s*:"),
        QRegularExpression::CaseInsensitiveOption);
    static const QRegularExpression actionRe(
        QStringLiteral("Action\\s*\\d*\\s*:[ \\t]*(.*?)[ \\t]*\\n\\s*Action\\s*\\d*\\s*Input\\s*\\d*\\s*:[ \\t]*(.*)"),
        QRegularExpression::CaseInsensitiveOption
            | QRegularExpression::DotMatchesEverythingOption);
    static const QRegularExpression bareActionRe(
        QStringLiteral("^\\s*Action\\s*\\d*\\s*:"),
        QRegularExpression::CaseInsensitiveOption
            | QRegularExpression::MultilineOption);
    static const QRegularExpression observationRe(
        QStringLiteral("\\n\\s*Observation\\s*:"),
        QRegularExpression::CaseInsensitiveOption);

    const QRegularExpressionMatch finalMatch = finalAnswerRe.match(text);
    const QRegularExpressionMatch actionMatch = actionRe.match(text);

    if (finalMatch.hasMatch() && actionMatch.hasMatch()) {
        return UnparseableTurn{text,
            QStringLiteral("reply contains both an Action and a Final Answer")};
    }

    if (finalMatch.hasMatch()) {
        const QString payload = text.mid(finalMatch.capturedEnd()).trimmed();
        if (payload.isEmpty()) {
            return UnparseableTurn{text, QStringLiteral("Final Answer is empty")};
        }
        return FinalAnswerTurn{payload};
    }

    if (actionMatch.hasMatch()) {
        const QString tool = normalizeToolName(actionMatch.captured(1));
        QString input = actionMatch.captured(2);
        // The engine may keep going and invent its own observation.
        const QRegularExpressionMatch observationMatch = observationRe.match(input);
        if (observationMatch.hasMatch()) {
            input = input.left(observationMatch.capturedStart());
        }
        const QString query = unwrap(input);

        if (tool.compare(QLatin1String(kSearchToolName), Qt::CaseInsensitive) != 0) {
            return UnparseableTurn{text,
                QStringLiteral("unknown tool '%1'; the only tool is %2")
                    .arg(tool, QString::fromLatin1(kSearchToolName))};
        }
        if (query.isEmpty()) {
            return UnparseableTurn{text, QStringLiteral("Action Input is empty")};
        }
        return ToolCallTurn{QLatin1String(kSearchToolName), query};
    }

    if (bareActionRe.match(text).hasMatch()) {
        return UnparseableTurn{text, QStringLiteral("Action is missing its Action Input")};
    }

    // A bare JSON object without the "Final Answer:" prefix is still a
    // terminal answer.
    if (isBareJsonObject(text)) {
        return FinalAnswerTurn{text.trimmed()};
    }

    return UnparseableTurn{text,
        QStringLiteral("reply contains neither an Action nor a Final Answer")};
}

} // namespace lc
