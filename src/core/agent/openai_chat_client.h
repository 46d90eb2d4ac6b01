#pragma once

#include "core/agent/reasoning_engine.h"

#include <QString>
#include <QUrl>

namespace lc {

struct OpenAiChatConfig {
    QString baseUrl;
    QString model;
    QString apiKey;
    double temperature = 0.0;
};

// Client for an OpenAI-compatible POST {baseUrl}/chat/completions.
// Generation stops before the model writes its own "Observation:" line.
class OpenAiChatClient : public ReasoningEngine {
public:
    explicit OpenAiChatClient(OpenAiChatConfig config);

    CompletionResult complete(const std::vector<ChatMessage>& messages, int timeoutMs) override;

    static QString roleName(ChatMessage::Role role);

private:
    OpenAiChatConfig m_config;
    QUrl m_endpoint;
};

} // namespace lc
