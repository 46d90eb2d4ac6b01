#pragma once

#include "core/shared/types.h"

#include <QString>
#include <QStringList>

#include <optional>

namespace lc {

struct TerminalPayload {
    enum class Kind {
        Location,   // {doc_id, chapter_id, paragraph_id}
        Failure,    // {error: "..."}
        Malformed,
    };

    Kind kind = Kind::Malformed;
    std::optional<ParagraphLocation> location;
    QString failureReason;
    // Why a payload was rejected; empty unless kind == Malformed.
    QString problem;
    QString raw;

    // Interpret the text after "Final Answer:". Surrounding prose and code
    // fences are ignored; exactly one JSON object must be present.
    static TerminalPayload interpret(const QString& text);

    // Every top-level balanced {...} span in text, in order. Braces inside
    // JSON strings do not count.
    static QStringList extractJsonObjects(const QString& text);
};

} // namespace lc
