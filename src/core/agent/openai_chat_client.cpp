#include "core/agent/openai_chat_client.h"
#include "core/net/http_json_client.h"
#include "core/shared/logging.h"

#include <QJsonArray>
#include <QJsonObject>

#include <utility>

namespace lc {

OpenAiChatClient::OpenAiChatClient(OpenAiChatConfig config)
    : m_config(std::move(config))
{
    QString base = m_config.baseUrl;
    while (base.endsWith(QLatin1Char('/'))) {
        base.chop(1);
    }
    m_endpoint = QUrl(base + QStringLiteral("/chat/completions"));
}

QString OpenAiChatClient::roleName(ChatMessage::Role role)
{
    switch (role) {
    case ChatMessage::Role::System:
        return QStringLiteral("system");
    case ChatMessage::Role::User:
        return QStringLiteral("user");
    case ChatMessage::Role::Assistant:
        return QStringLiteral("assistant");
    }
    return QStringLiteral("user");
}

CompletionResult OpenAiChatClient::complete(const std::vector<ChatMessage>& messages,
                                            int timeoutMs)
{
    CompletionResult result;

    QJsonArray messagesJson;
    for (const ChatMessage& message : messages) {
        QJsonObject entry;
        entry.insert(QStringLiteral("role"), roleName(message.role));
        entry.insert(QStringLiteral("content"), message.content);
        messagesJson.append(entry);
    }

    QJsonObject payload;
    payload.insert(QStringLiteral("model"), m_config.model);
    payload.insert(QStringLiteral("messages"), messagesJson);
    payload.insert(QStringLiteral("temperature"), m_config.temperature);
    payload.insert(QStringLiteral("stop"), QJsonArray{QStringLiteral("\nObservation:")});

    const HttpResponse response = HttpJsonClient::postJson(
        m_endpoint, payload, HttpJsonClient::bearerHeaders(m_config.apiKey), timeoutMs);
    if (!response.ok()) {
        result.timedOut = response.timedOut;
        result.error = response.error;
        if (!response.body.isEmpty()) {
            QString ignored;
            const auto errorJson = HttpJsonClient::parseObject(response.body, &ignored);
            if (errorJson.has_value()) {
                const QString detail = errorJson->value(QStringLiteral("error")).toObject()
                                           .value(QStringLiteral("message")).toString();
                if (!detail.isEmpty()) {
                    result.error += QStringLiteral(": ") + detail;
                }
            }
        }
        return result;
    }

    QString parseError;
    const auto root = HttpJsonClient::parseObject(response.body, &parseError);
    if (!root.has_value()) {
        result.error = QStringLiteral("unparseable completion response: %1").arg(parseError);
        return result;
    }

    const QJsonArray choices = root->value(QStringLiteral("choices")).toArray();
    if (choices.isEmpty()) {
        result.error = QStringLiteral("completion response has no choices");
        return result;
    }

    const QJsonValue content = choices.first().toObject()
                                   .value(QStringLiteral("message")).toObject()
                                   .value(QStringLiteral("content"));
    if (!content.isString()) {
        result.error = QStringLiteral("completion response has no message content");
        return result;
    }

    result.ok = true;
    result.text = content.toString();
    LOG_DEBUG(lcAgent, "Completion received (%d chars)", static_cast<int>(result.text.size()));
    return result;
}

} // namespace lc
