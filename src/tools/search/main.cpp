#include "core/retrieval/retrieval_stack.h"
#include "core/shared/logging.h"
#include "core/shared/settings_manager.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QTextStream>

namespace {

void printRecord(QTextStream& out, int position, const lc::ParagraphRecord& record)
{
    out << position + 1 << ". id=" << record.id
        << " doc=" << record.location.docId
        << " chapter=" << record.location.chapterId
        << " paragraph=" << record.location.paragraphId << '\n'
        << "   " << record.text << "\n\n";
}

} // namespace

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("lexcite-search"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));

    QCommandLineParser parser;
    parser.setApplicationDescription(QStringLiteral("Run a hybrid search against the corpus."));
    parser.addHelpOption();
    parser.addPositionalArgument(QStringLiteral("query"), QStringLiteral("Search text."));
    const QCommandLineOption kOption(QStringLiteral("k"),
                                     QStringLiteral("Number of results (default from settings)."),
                                     QStringLiteral("N"));
    const QCommandLineOption keywordOnlyOption(QStringLiteral("keyword-only"),
                                               QStringLiteral("Query the keyword index alone."));
    parser.addOption(kOption);
    parser.addOption(keywordOnlyOption);
    parser.process(app);

    const QStringList positional = parser.positionalArguments();
    if (positional.isEmpty()) {
        parser.showHelp(2);
    }
    const QString query = positional.join(QLatin1Char(' '));

    const lc::Settings settings = lc::SettingsManager::loadEffective();
    int k = settings.topK;
    if (parser.isSet(kOption)) {
        bool ok = false;
        k = parser.value(kOption).toInt(&ok);
        if (!ok || k < 0) {
            LOG_ERROR(lcCore, "--k expects a non-negative integer");
            return 2;
        }
    }

    QString error;
    auto stack = lc::RetrievalStack::open(settings, nullptr, &error);
    if (!stack) {
        LOG_ERROR(lcCore, "Cannot open retrieval stack: %s", qPrintable(error));
        return 1;
    }

    QTextStream out(stdout);

    if (parser.isSet(keywordOnlyOption)) {
        const auto hits = stack->keyword().search(query, k, static_cast<int>(settings.providerTimeoutMs));
        if (!hits.has_value()) {
            LOG_ERROR(lcIndex, "Keyword search failed");
            return 1;
        }
        std::vector<int64_t> ids;
        ids.reserve(hits->size());
        for (const lc::SearchHit& hit : *hits) {
            ids.push_back(hit.id);
        }
        const auto records = stack->store().getMany(ids);
        int position = 0;
        for (int64_t id : ids) {
            const auto it = records.find(id);
            if (it != records.end()) {
                printRecord(out, position++, it->second);
            }
        }
        return 0;
    }

    const lc::RetrievalReport report = stack->retriever().retrieveDetailed(query, k);
    if (!report.ok()) {
        LOG_ERROR(lcRetrieval, "%s: %s", qPrintable(lc::errorCodeToString(report.error)),
                  qPrintable(report.errorMessage));
        return 1;
    }
    if (!report.keywordAvailable || !report.vectorAvailable) {
        out << "(degraded: keyword=" << (report.keywordAvailable ? "ok" : "unavailable")
            << " vector=" << (report.vectorAvailable ? "ok" : "unavailable") << ")\n";
    }
    for (size_t i = 0; i < report.records.size(); ++i) {
        printRecord(out, static_cast<int>(i), report.records[i]);
    }
    return 0;
}
