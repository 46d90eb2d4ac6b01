#include "finder_service.h"

#include "core/agent/openai_chat_client.h"
#include "core/retrieval/retrieval_stack.h"
#include "core/shared/logging.h"
#include "core/shared/settings_manager.h"

#include <QCoreApplication>

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("lexcite-finder"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    const lc::Settings settings = lc::SettingsManager::loadEffective();

    const auto apiKey = lc::SettingsManager::resolveApiKey();
    if (!apiKey.has_value()) {
        LOG_ERROR(lcCore, "%s: set OPENAI_API_KEY (or LEXCITE_API_KEY) before starting",
                  qPrintable(lc::errorCodeToString(lc::ErrorCode::MissingCredential)));
        return 1;
    }

    QString error;
    auto stack = lc::RetrievalStack::open(settings, nullptr, &error);
    if (!stack) {
        LOG_ERROR(lcCore, "Cannot open retrieval stack: %s", qPrintable(error));
        return 1;
    }

    lc::OpenAiChatConfig chatConfig;
    chatConfig.baseUrl = settings.reasoningBaseUrl;
    chatConfig.model = settings.reasoningModel;
    chatConfig.apiKey = *apiKey;
    chatConfig.temperature = settings.reasoningTemperature;
    lc::OpenAiChatClient engine(chatConfig);

    lc::LoopConfig loopConfig;
    loopConfig.maxIterations = settings.maxIterations;
    loopConfig.topK = settings.topK;
    loopConfig.providerTimeoutMs = static_cast<int>(settings.providerTimeoutMs);

    lc::FinderService service(*stack, engine, loopConfig,
                              static_cast<int>(settings.requestTimeoutMs));
    return service.run();
}
