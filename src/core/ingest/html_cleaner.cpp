#include "core/ingest/html_cleaner.h"

#include <QHash>
#include <QRegularExpression>

namespace lc {

namespace {

const QHash<QString, QString>& namedEntities()
{
    static const QHash<QString, QString> entities = {
        {QStringLiteral("amp"), QStringLiteral("&")},
        {QStringLiteral("lt"), QStringLiteral("<")},
        {QStringLiteral("gt"), QStringLiteral(">")},
        {QStringLiteral("quot"), QStringLiteral("\"")},
        {QStringLiteral("apos"), QStringLiteral("'")},
        {QStringLiteral("nbsp"), QStringLiteral(" ")},
        {QStringLiteral("laquo"), QString(QChar(0x00AB))},
        {QStringLiteral("raquo"), QString(QChar(0x00BB))},
        {QStringLiteral("ndash"), QString(QChar(0x2013))},
        {QStringLiteral("mdash"), QString(QChar(0x2014))},
        {QStringLiteral("hellip"), QString(QChar(0x2026))},
        {QStringLiteral("sect"), QString(QChar(0x00A7))},
        {QStringLiteral("deg"), QString(QChar(0x00B0))},
        {QStringLiteral("shy"), QString()},
    };
    return entities;
}

QString codePointToString(uint codePoint)
{
    if (codePoint == 0 || codePoint > 0x10FFFF
        || (codePoint >= 0xD800 && codePoint <= 0xDFFF)) {
        return QString(QChar(QChar::ReplacementCharacter));
    }
    const char32_t value = static_cast<char32_t>(codePoint);
    return QString::fromUcs4(&value, 1);
}

} // namespace

QString HtmlCleaner::decodeEntities(const QString& text)
{
    if (!text.contains(QLatin1Char('&'))) {
        return text;
    }

    static const QRegularExpression entityRe(
        QStringLiteral("&(#[0-9]{1,7}|#[xX][0-9a-fA-F]{1,6}|[a-zA-Z]{2,8});"));

    QString result;
    result.reserve(text.size());
    int last = 0;
    auto it = entityRe.globalMatch(text);
    while (it.hasNext()) {
        const QRegularExpressionMatch match = it.next();
        result.append(text.mid(last, match.capturedStart() - last));
        const QString body = match.captured(1);

        if (body.startsWith(QLatin1Char('#'))) {
            bool ok = false;
            uint codePoint = 0;
            if (body.size() > 1 && (body.at(1) == QLatin1Char('x') || body.at(1) == QLatin1Char('X'))) {
                codePoint = body.mid(2).toUInt(&ok, 16);
            } else {
                codePoint = body.mid(1).toUInt(&ok, 10);
            }
            result.append(ok ? codePointToString(codePoint) : match.captured(0));
        } else {
            const auto& entities = namedEntities();
            const auto found = entities.constFind(body.toLower());
            // Unknown names stay as written.
            result.append(found != entities.constEnd() ? found.value() : match.captured(0));
        }
        last = match.capturedEnd();
    }
    result.append(text.mid(last));
    return result;
}

QString HtmlCleaner::clean(const QString& html)
{
    if (html.isEmpty()) {
        return html;
    }

    static const QRegularExpression scriptRe(
        QStringLiteral("<(script|style)\\b[^>]*>.*?</\\1\\s*>"),
        QRegularExpression::CaseInsensitiveOption
            | QRegularExpression::DotMatchesEverythingOption);
    static const QRegularExpression tagRe(
        QStringLiteral("<[^>]*>"),
        QRegularExpression::DotMatchesEverythingOption);

    QString text = html;
    text.replace(scriptRe, QStringLiteral(" "));
    text.replace(tagRe, QStringLiteral(" "));
    text = decodeEntities(text);

    QString result;
    result.reserve(text.size());
    bool pendingSpace = false;
    for (const QChar ch : text) {
        if (ch.isSpace() || ch == QChar(QChar::Nbsp)) {
            pendingSpace = true;
            continue;
        }
        // Strip control characters and DEL
        const ushort code = ch.unicode();
        if (code < 0x20 || code == 0x7F) {
            continue;
        }
        if (pendingSpace && !result.isEmpty()) {
            result.append(QLatin1Char(' '));
        }
        pendingSpace = false;
        result.append(ch);
    }
    return result;
}

} // namespace lc
