#include "finder_service.h"

#include "core/retrieval/retrieval_stack.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>
#include <QJsonArray>

namespace lc {

FinderService::FinderService(RetrievalStack& stack, ReasoningEngine& engine,
                             LoopConfig loopConfig, int requestTimeoutMs, QObject* parent)
    : ServiceBase(QStringLiteral("finder"), parent)
    , m_stack(stack)
    , m_loop(stack.retriever(), engine, loopConfig)
    , m_requestTimeoutMs(requestTimeoutMs)
{
}

FinderService::~FinderService() = default;

QJsonObject FinderService::handleRequest(const QJsonObject& request)
{
    const QString method = request.value(QStringLiteral("method")).toString();
    const uint64_t id = IpcMessage::requestId(request);
    const QJsonObject params = request.value(QStringLiteral("params")).toObject();

    if (method == QLatin1String("find_paragraph")) return handleFindParagraph(id, params);
    if (method == QLatin1String("retrieve"))       return handleRetrieve(id, params);
    if (method == QLatin1String("get_health"))     return handleGetHealth(id);

    return ServiceBase::handleRequest(request);
}

QJsonObject FinderService::handleFindParagraph(uint64_t id, const QJsonObject& params)
{
    QString error;
    const auto request = FindRequest::fromJson(params, &error);
    if (!request.has_value()) {
        LOG_WARN(lcIpc, "find_paragraph id=%llu rejected: %s",
                 static_cast<unsigned long long>(id), qPrintable(error));
        return IpcMessage::makeError(id, IpcErrorCode::InvalidParams, error);
    }

    QElapsedTimer timer;
    timer.start();

    RunOptions options;
    options.timeoutMs = m_requestTimeoutMs;
    const LoopOutcome outcome = m_loop.run(*request, options);
    ++m_requestsServed;

    LOG_INFO(lcIpc, "find_paragraph id=%llu finished: %s after %d iteration(s), %lld ms",
             static_cast<unsigned long long>(id), qPrintable(errorCodeToString(outcome.code)),
             outcome.iterations, static_cast<long long>(timer.elapsed()));
    return outcomeToResponse(id, outcome);
}

QJsonObject FinderService::outcomeToResponse(uint64_t id, const LoopOutcome& outcome)
{
    if (outcome.ok()) {
        return IpcMessage::makeResponse(id, outcome.location->toJson());
    }

    switch (outcome.code) {
    case ErrorCode::NotFound:
    case ErrorCode::IterationLimitExceeded:
        return IpcMessage::makeError(
            id, IpcErrorCode::NotFound,
            outcome.message.isEmpty() ? QStringLiteral("paragraph not found") : outcome.message);
    case ErrorCode::MalformedTerminalPayload:
        return IpcMessage::makeError(
            id, IpcErrorCode::InternalError,
            QStringLiteral("malformed terminal payload: %1").arg(outcome.rawPayload));
    case ErrorCode::InvalidParams:
        return IpcMessage::makeError(id, IpcErrorCode::InvalidParams, outcome.message);
    case ErrorCode::Timeout:
    case ErrorCode::Cancelled:
        return IpcMessage::makeError(id, IpcErrorCode::Timeout, outcome.message);
    default:
        break;
    }

    QString message = outcome.message;
    if (message.isEmpty()) {
        message = errorCodeToString(outcome.code);
    }
    return IpcMessage::makeError(id, IpcErrorCode::InternalError, message);
}

QJsonObject FinderService::handleRetrieve(uint64_t id, const QJsonObject& params)
{
    const QString query = params.value(QStringLiteral("query")).toString();
    if (!params.value(QStringLiteral("query")).isString()) {
        return IpcMessage::makeError(id, IpcErrorCode::InvalidParams,
                                     QStringLiteral("'query' must be a string"));
    }

    int k = m_stack.retriever().config().defaultTopK;
    const QJsonValue kValue = params.value(QStringLiteral("k"));
    if (!kValue.isUndefined()) {
        const auto parsed = integralJsonValue(kValue);
        if (!parsed.has_value() || *parsed < 0 || *parsed > 1000) {
            return IpcMessage::makeError(id, IpcErrorCode::InvalidParams,
                                         QStringLiteral("'k' must be an integer in [0, 1000]"));
        }
        k = static_cast<int>(*parsed);
    }

    const RetrievalReport report = m_stack.retriever().retrieveDetailed(query, k);
    if (!report.ok()) {
        const IpcErrorCode code = report.error == ErrorCode::Timeout
            ? IpcErrorCode::Timeout : IpcErrorCode::InternalError;
        return IpcMessage::makeError(id, code, report.errorMessage);
    }
    return IpcMessage::makeResponse(id, report.toJson());
}

QJsonObject FinderService::handleGetHealth(uint64_t id)
{
    const ConsistencyReport consistency = m_stack.checkConsistency();

    QJsonObject result;
    result[QStringLiteral("records")] = consistency.records;
    result[QStringLiteral("keyword_entries")] = consistency.keywordEntries;
    result[QStringLiteral("vector_labels")] = consistency.vectorLabels;
    result[QStringLiteral("payload_rows")] = consistency.payloadRows;
    result[QStringLiteral("vector_dimensions")] = m_stack.vectors().dimensions();
    result[QStringLiteral("vector_needs_rebuild")] = m_stack.vectors().needsRebuild();
    result[QStringLiteral("requests_served")] = static_cast<qint64>(m_requestsServed);
    result[QStringLiteral("consistent")] = consistency.isConsistent();
    result[QStringLiteral("consistency")] = consistency.toJson();
    return IpcMessage::makeResponse(id, result);
}

} // namespace lc
