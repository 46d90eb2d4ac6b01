#pragma once

#include <QString>

#include <vector>

namespace lc {

struct ChatMessage {
    enum class Role {
        System,
        User,
        Assistant,
    };

    Role role = Role::User;
    QString content;
};

struct CompletionResult {
    bool ok = false;
    QString text;
    QString error;
    bool timedOut = false;
};

// One completion per call; the loop owns the transcript.
class ReasoningEngine {
public:
    virtual ~ReasoningEngine() = default;

    virtual CompletionResult complete(const std::vector<ChatMessage>& messages, int timeoutMs) = 0;
};

} // namespace lc
