#pragma once

#include "core/agent/find_request.h"
#include "core/agent/reasoning_engine.h"
#include "core/shared/types.h"

#include <QString>

#include <atomic>
#include <optional>
#include <utility>
#include <vector>

namespace lc {

class HybridRetriever;

class CancellationToken {
public:
    void cancel() { m_cancelled.store(true); }
    bool isCancelled() const { return m_cancelled.load(); }

private:
    std::atomic<bool> m_cancelled{false};
};

struct LoopConfig {
    int maxIterations = 5;
    int topK = 5;
    int providerTimeoutMs = 60000;
};

struct RunOptions {
    const CancellationToken* cancel = nullptr;
    // Whole-request deadline; <= 0 disables it.
    int timeoutMs = 0;
};

// Per-request scratch state, discarded when run() returns.
struct LoopState {
    int iteration = 0;
    std::vector<std::pair<QString, QString>> history;   // (query, observation)
    bool terminal = false;
    std::optional<ParagraphLocation> result;
    ErrorCode failure = ErrorCode::None;
};

struct LoopOutcome {
    ErrorCode code = ErrorCode::None;
    std::optional<ParagraphLocation> location;
    QString message;
    int iterations = 0;
    int toolCalls = 0;
    // Final Answer text as emitted by the engine, if any.
    QString rawPayload;

    bool ok() const { return code == ErrorCode::None && location.has_value(); }
};

// Drives the retriever through a reasoning engine until the engine names a
// paragraph, gives up, or the iteration budget runs out. Every tool call
// and every unparseable reply consumes one unit of the budget.
class QueryRefinementLoop {
public:
    QueryRefinementLoop(HybridRetriever& retriever, ReasoningEngine& engine,
                        LoopConfig config = {});

    QueryRefinementLoop(const QueryRefinementLoop&) = delete;
    QueryRefinementLoop& operator=(const QueryRefinementLoop&) = delete;

    LoopOutcome run(const FindRequest& request, const RunOptions& options = {});
    LoopOutcome run(const QString& taskDescription, const RunOptions& options = {});

    const LoopConfig& config() const { return m_config; }

private:
    HybridRetriever& m_retriever;
    ReasoningEngine& m_engine;
    LoopConfig m_config;
};

} // namespace lc
