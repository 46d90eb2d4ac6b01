#pragma once

#include "core/agent/refinement_loop.h"
#include "core/ipc/service_base.h"

#include <cstdint>

namespace lc {

class ReasoningEngine;
class RetrievalStack;

// IPC front end: ping, shutdown, find_paragraph, retrieve, get_health.
class FinderService : public ServiceBase {
    Q_OBJECT
public:
    FinderService(RetrievalStack& stack, ReasoningEngine& engine,
                  LoopConfig loopConfig = {}, int requestTimeoutMs = 0,
                  QObject* parent = nullptr);
    ~FinderService() override;

    QJsonObject handleRequest(const QJsonObject& request) override;

private:
    QJsonObject handleFindParagraph(uint64_t id, const QJsonObject& params);
    QJsonObject handleRetrieve(uint64_t id, const QJsonObject& params);
    QJsonObject handleGetHealth(uint64_t id);

    static QJsonObject outcomeToResponse(uint64_t id, const LoopOutcome& outcome);

    RetrievalStack& m_stack;
    QueryRefinementLoop m_loop;
    int m_requestTimeoutMs = 0;
    uint64_t m_requestsServed = 0;
};

} // namespace lc
