#include "core/agent/refinement_loop.h"
#include "core/agent/prompt_builder.h"
#include "core/agent/terminal_payload.h"
#include "core/agent/turn_parser.h"
#include "core/retrieval/hybrid_retriever.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>

#include <algorithm>
#include <exception>

namespace lc {

namespace {

LoopOutcome finish(LoopState& state, int toolCalls, ErrorCode code, const QString& message)
{
    state.terminal = true;
    state.failure = code;

    LoopOutcome outcome;
    outcome.code = code;
    outcome.message = message;
    outcome.iterations = state.iteration;
    outcome.toolCalls = toolCalls;
    outcome.location = state.result;
    return outcome;
}

} // namespace

QueryRefinementLoop::QueryRefinementLoop(HybridRetriever& retriever, ReasoningEngine& engine,
                                         LoopConfig config)
    : m_retriever(retriever)
    , m_engine(engine)
    , m_config(config)
{
}

LoopOutcome QueryRefinementLoop::run(const FindRequest& request, const RunOptions& options)
{
    return run(request.taskDescription(), options);
}

LoopOutcome QueryRefinementLoop::run(const QString& taskDescription, const RunOptions& options)
{
    QElapsedTimer clock;
    clock.start();

    LoopState state;
    int toolCalls = 0;

    std::vector<ChatMessage> messages;
    messages.push_back({ChatMessage::Role::System, PromptBuilder::systemPrompt()});
    messages.push_back({ChatMessage::Role::User, taskDescription});

    LOG_INFO(lcAgent, "Refinement loop started (budget %d)", m_config.maxIterations);

    while (!state.terminal) {
        if (options.cancel && options.cancel->isCancelled()) {
            LOG_INFO(lcAgent, "Loop cancelled after %d iterations", state.iteration);
            return finish(state, toolCalls, ErrorCode::Cancelled, QStringLiteral("request cancelled"));
        }

        if (state.iteration >= m_config.maxIterations) {
            LOG_WARN(lcAgent, "Iteration budget of %d exhausted after %d tool calls",
                     m_config.maxIterations, toolCalls);
            return finish(state, toolCalls, ErrorCode::IterationLimitExceeded,
                          QStringLiteral("iteration limit exceeded"));
        }

        int remainingMs = m_config.providerTimeoutMs;
        if (options.timeoutMs > 0) {
            const qint64 left = options.timeoutMs - clock.elapsed();
            if (left <= 0) {
                LOG_WARN(lcAgent, "Loop deadline of %d ms exceeded", options.timeoutMs);
                return finish(state, toolCalls, ErrorCode::Timeout,
                              QStringLiteral("request deadline exceeded"));
            }
            remainingMs = static_cast<int>(std::min<qint64>(left, m_config.providerTimeoutMs));
        }

        CompletionResult completion;
        try {
            completion = m_engine.complete(messages, remainingMs);
        } catch (const std::exception& e) {
            LOG_ERROR(lcAgent, "Reasoning engine threw: %s", e.what());
            return finish(state, toolCalls, ErrorCode::InternalError,
                          QStringLiteral("reasoning engine failure: %1")
                              .arg(QString::fromUtf8(e.what())));
        }

        if (!completion.ok) {
            LOG_ERROR(lcAgent, "Reasoning engine failed: %s", qUtf8Printable(completion.error));
            return finish(state, toolCalls,
                          completion.timedOut ? ErrorCode::Timeout : ErrorCode::InternalError,
                          QStringLiteral("reasoning engine failure: %1").arg(completion.error));
        }

        messages.push_back({ChatMessage::Role::Assistant, completion.text});
        const Turn turn = TurnParser::parse(completion.text);

        if (const auto* answer = std::get_if<FinalAnswerTurn>(&turn)) {
            const TerminalPayload payload = TerminalPayload::interpret(answer->payload);
            switch (payload.kind) {
            case TerminalPayload::Kind::Location: {
                state.result = payload.location;
                LOG_INFO(lcAgent, "Found doc=%lld chapter=%lld paragraph=%lld after %d tool calls",
                         static_cast<long long>(payload.location->docId),
                         static_cast<long long>(payload.location->chapterId),
                         static_cast<long long>(payload.location->paragraphId), toolCalls);
                LoopOutcome outcome = finish(state, toolCalls, ErrorCode::None, QString());
                outcome.rawPayload = answer->payload;
                return outcome;
            }
            case TerminalPayload::Kind::Failure: {
                LOG_INFO(lcAgent, "Engine reported failure: %s",
                         qUtf8Printable(payload.failureReason));
                LoopOutcome outcome = finish(state, toolCalls, ErrorCode::NotFound,
                                             payload.failureReason);
                outcome.rawPayload = answer->payload;
                return outcome;
            }
            case TerminalPayload::Kind::Malformed: {
                LOG_WARN(lcAgent, "Malformed terminal payload (%s): %s",
                         qUtf8Printable(payload.problem), qUtf8Printable(answer->payload));
                LoopOutcome outcome = finish(state, toolCalls, ErrorCode::MalformedTerminalPayload,
                                             payload.problem);
                outcome.rawPayload = answer->payload;
                return outcome;
            }
            }
        }

        ++state.iteration;
        QString query;
        QString observation;

        if (const auto* call = std::get_if<ToolCallTurn>(&turn)) {
            ++toolCalls;
            query = call->query;
            LOG_INFO(lcAgent, "Iteration %d: %s(\"%s\")", state.iteration,
                     qUtf8Printable(call->tool), qUtf8Printable(query));

            const RetrievalReport report =
                m_retriever.retrieveDetailed(query, m_config.topK, remainingMs);
            if (report.error == ErrorCode::DimensionMismatch) {
                return finish(state, toolCalls, ErrorCode::DimensionMismatch, report.errorMessage);
            }
            if (!report.ok()) {
                return finish(state, toolCalls, ErrorCode::InternalError, report.errorMessage);
            }
            observation = PromptBuilder::formatObservation(report.records);
        } else if (const auto* bad = std::get_if<UnparseableTurn>(&turn)) {
            LOG_WARN(lcAgent, "Iteration %d: unparseable reply (%s)", state.iteration,
                     qUtf8Printable(bad->reason));
            observation = PromptBuilder::formatParseError(bad->reason);
        }

        state.history.emplace_back(query, observation);
        messages.push_back({ChatMessage::Role::User,
                            QStringLiteral("Observation: ") + observation});
    }

    // Unreachable: every terminal transition returns from inside the loop.
    return finish(state, toolCalls, ErrorCode::InternalError, QStringLiteral("loop ended"));
}

} // namespace lc
