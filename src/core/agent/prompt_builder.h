#pragma once

#include "core/shared/types.h"

#include <QString>
#include <QStringList>

#include <vector>

namespace lc {

// Text the refinement loop exchanges with the reasoning engine.
class PromptBuilder {
public:
    static QString systemPrompt();

    // "Question: <text>\nCorrect Answer: <a>, <b>"
    static QString taskDescription(const QString& question, const QStringList& correctAnswers);

    // One block per record, separated by "\n---\n".
    static QString formatObservation(const std::vector<ParagraphRecord>& records);
    static QString formatParseError(const QString& reason);

    static QString noResultsObservation();
};

} // namespace lc
