#include "core/ingest/ingestor.h"
#include "core/retrieval/retrieval_stack.h"
#include "core/shared/logging.h"
#include "core/shared/settings_manager.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QJsonDocument>
#include <QTextStream>

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("lexcite-ingest"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Load raw corpus documents into the paragraph store and both indexes."));
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument(QStringLiteral("raw_dir"),
                                 QStringLiteral("Directory of raw document *.json files."));
    const QCommandLineOption rebuildOption(
        QStringLiteral("rebuild"), QStringLiteral("Clear every store before ingesting."));
    const QCommandLineOption verifyOption(
        QStringLiteral("verify"), QStringLiteral("Run a consistency check when done."));
    parser.addOption(rebuildOption);
    parser.addOption(verifyOption);
    parser.process(app);

    const QStringList positional = parser.positionalArguments();
    if (positional.size() != 1) {
        parser.showHelp(2);
    }
    const QString rawDir = QDir(positional.first()).absolutePath();
    if (!QDir(rawDir).exists()) {
        LOG_ERROR(lcIngest, "No such directory: %s", qPrintable(rawDir));
        return 2;
    }

    const lc::Settings settings = lc::SettingsManager::loadEffective();
    QString error;
    auto stack = lc::RetrievalStack::open(settings, nullptr, &error);
    if (!stack) {
        LOG_ERROR(lcIngest, "Cannot open retrieval stack: %s", qPrintable(error));
        return 1;
    }

    if (parser.isSet(rebuildOption)) {
        LOG_INFO(lcIngest, "Rebuild requested, clearing all stores");
        if (!stack->store().deleteAll() || !stack->resetVectors()) {
            LOG_ERROR(lcIngest, "Failed to clear stores");
            return 1;
        }
    }

    lc::IngestConfig config;
    config.minParagraphChars = settings.minParagraphChars;
    config.embedTimeoutMs = static_cast<int>(settings.providerTimeoutMs);
    config.modelId = settings.embeddingModel.toStdString();

    lc::Ingestor ingestor(stack->store(), stack->keyword(), stack->vectors(),
                          stack->payloads(), stack->embedder(), config);
    const lc::IngestStats stats = ingestor.ingestDirectory(rawDir);

    if (!stack->saveVectors()) {
        LOG_ERROR(lcIngest, "Failed to save vector index to %s",
                  qPrintable(settings.vectorIndexPath));
        return 1;
    }
    stack->keyword().optimize();

    QJsonObject summary = stats.toJson();
    int exitCode = stats.documentsFailed > 0 ? 3 : 0;
    if (parser.isSet(verifyOption)) {
        const lc::ConsistencyReport report = stack->checkConsistency();
        summary[QStringLiteral("consistency")] = report.toJson();
        if (!report.isConsistent()) {
            LOG_WARN(lcIngest, "Stores are inconsistent after ingestion");
            exitCode = 4;
        }
    }

    QTextStream out(stdout);
    out << QJsonDocument(summary).toJson(QJsonDocument::Indented);
    return exitCode;
}
