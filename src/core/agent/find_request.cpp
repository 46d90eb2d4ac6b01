#include "core/agent/find_request.h"
#include "core/agent/prompt_builder.h"

#include <QJsonArray>

namespace lc {

namespace {

std::optional<QStringList> stringList(const QJsonValue& value)
{
    if (!value.isArray()) {
        return std::nullopt;
    }
    QStringList list;
    for (const QJsonValue& entry : value.toArray()) {
        if (!entry.isString()) {
            return std::nullopt;
        }
        list.push_back(entry.toString());
    }
    return list;
}

} // namespace

QString FindRequest::taskDescription() const
{
    return PromptBuilder::taskDescription(questionText, correctAnswers);
}

std::optional<FindRequest> FindRequest::fromJson(const QJsonObject& params, QString* error)
{
    auto fail = [error](const QString& message) -> std::optional<FindRequest> {
        if (error) {
            *error = message;
        }
        return std::nullopt;
    };

    const QJsonValue questionValue = params.value(QStringLiteral("question"));
    if (!questionValue.isObject()) {
        return fail(QStringLiteral("'question' must be an object"));
    }
    const QJsonObject question = questionValue.toObject();

    const QJsonValue textValue = question.value(QStringLiteral("text"));
    if (!textValue.isString() || textValue.toString().trimmed().isEmpty()) {
        return fail(QStringLiteral("'question.text' must be a non-empty string"));
    }

    const QJsonValue imageValue = question.value(QStringLiteral("imageBase64"));
    if (!imageValue.isUndefined() && !imageValue.isNull() && !imageValue.isString()) {
        return fail(QStringLiteral("'question.imageBase64' must be a string"));
    }

    const auto answers = stringList(params.value(QStringLiteral("answers")));
    if (!answers.has_value()) {
        return fail(QStringLiteral("'answers' must be an array of strings"));
    }

    const auto correctAnswers = stringList(params.value(QStringLiteral("correctAnswers")));
    if (!correctAnswers.has_value()) {
        return fail(QStringLiteral("'correctAnswers' must be an array of strings"));
    }
    if (correctAnswers->isEmpty()) {
        return fail(QStringLiteral("'correctAnswers' must not be empty"));
    }

    FindRequest request;
    request.questionText = textValue.toString().trimmed();
    request.imageBase64 = imageValue.toString();
    request.answers = *answers;
    request.correctAnswers = *correctAnswers;
    return request;
}

} // namespace lc
