#include "core/shared/logging.h"

// Enable per-category output with QT_LOGGING_RULES, e.g. "lexcite.agent.debug=true".
Q_LOGGING_CATEGORY(lcCore, "lexcite.core")
Q_LOGGING_CATEGORY(lcStore, "lexcite.store")
Q_LOGGING_CATEGORY(lcIndex, "lexcite.index")
Q_LOGGING_CATEGORY(lcVector, "lexcite.vector")
Q_LOGGING_CATEGORY(lcRetrieval, "lexcite.retrieval")
Q_LOGGING_CATEGORY(lcAgent, "lexcite.agent")
Q_LOGGING_CATEGORY(lcIngest, "lexcite.ingest")
Q_LOGGING_CATEGORY(lcIpc, "lexcite.ipc")
