#pragma once

#include <QJsonObject>
#include <QString>
#include <QStringList>

#include <optional>

namespace lc {

// Parameters of a find_paragraph request:
//   {question: {text, imageBase64?}, answers: [..], correctAnswers: [..]}
struct FindRequest {
    QString questionText;
    QString imageBase64;    // accepted, not used for retrieval
    QStringList answers;
    QStringList correctAnswers;

    QString taskDescription() const;

    static std::optional<FindRequest> fromJson(const QJsonObject& params, QString* error);
};

} // namespace lc
