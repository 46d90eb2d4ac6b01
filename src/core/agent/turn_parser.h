#pragma once

#include <QString>

#include <variant>

namespace lc {

struct ToolCallTurn {
    QString tool;
    QString query;
};

struct FinalAnswerTurn {
    // Raw text after "Final Answer:"; validated by TerminalPayload.
    QString payload;
};

struct UnparseableTurn {
    QString raw;
    QString reason;
};

using Turn = std::variant<ToolCallTurn, FinalAnswerTurn, UnparseableTurn>;

// Parses one ReAct-formatted engine reply:
//   Thought: ...
//   Action: hybrid_search
//   Action Input: <query>
// or
//   Thought: ...
//   Final Answer: <json>
class TurnParser {
public:
    static constexpr const char* kSearchToolName = "hybrid_search";

    static Turn parse(const QString& text);
};

} // namespace lc
