#include "core/shared/settings_manager.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QStandardPaths>

namespace lc {

namespace {

QString envString(const char* name)
{
    return qEnvironmentVariable(name).trimmed();
}

void overrideString(const char* name, QString& target)
{
    const QString value = envString(name);
    if (!value.isEmpty()) {
        target = value;
    }
}

void overrideInt(const char* name, int& target)
{
    const QString value = envString(name);
    if (value.isEmpty()) {
        return;
    }
    bool ok = false;
    const int parsed = value.toInt(&ok);
    if (!ok) {
        LOG_WARN(lcCore, "Ignoring non-integer %s=%s", name, qUtf8Printable(value));
        return;
    }
    target = parsed;
}

void overrideUInt(const char* name, uint32_t& target)
{
    const QString value = envString(name);
    if (value.isEmpty()) {
        return;
    }
    bool ok = false;
    const uint parsed = value.toUInt(&ok);
    if (!ok) {
        LOG_WARN(lcCore, "Ignoring non-integer %s=%s", name, qUtf8Printable(value));
        return;
    }
    target = parsed;
}

} // namespace

std::optional<Settings> SettingsManager::load(const QString& filePath)
{
    QFile file(filePath);
    if (!file.exists()) {
        return std::nullopt;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(lcCore, "Failed to open settings file for read: %s", qUtf8Printable(filePath));
        return std::nullopt;
    }

    const QByteArray rawJson = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(rawJson, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(lcCore,
                 "Failed to parse settings JSON (%s): %s",
                 qUtf8Printable(filePath),
                 qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    return fromJson(doc.object());
}

Settings SettingsManager::loadEffective()
{
    const QString filePath = settingsFilePath();
    Settings settings = load(filePath).value_or(Settings{});
    applyEnvironmentOverrides(settings);
    fillDefaultPaths(settings);
    LOG_DEBUG(lcCore, "Effective settings: db=%s index=%s",
              qUtf8Printable(settings.dbPath), qUtf8Printable(settings.vectorIndexPath));
    return settings;
}

bool SettingsManager::save(const Settings& settings, const QString& filePath)
{
    const QFileInfo fileInfo(filePath);
    const QString parentDir = fileInfo.absolutePath();

    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(lcCore, "Failed to create settings directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    const QJsonDocument doc(toJson(settings));
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(lcCore, "Failed to open settings file for write: %s", qUtf8Printable(filePath));
        return false;
    }

    const qint64 bytesWritten = file.write(doc.toJson(QJsonDocument::Indented));
    file.close();

    if (bytesWritten < 0) {
        LOG_ERROR(lcCore, "Failed to write settings file: %s", qUtf8Printable(filePath));
        return false;
    }

    return true;
}

QString SettingsManager::settingsFilePath()
{
    const QString explicitPath = envString("LEXCITE_CONFIG");
    if (!explicitPath.isEmpty()) {
        return QDir::cleanPath(explicitPath);
    }
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation);
    return basePath + QStringLiteral("/lexcite/settings.json");
}

QString SettingsManager::defaultDataDirectory()
{
    const QString explicitDir = envString("LEXCITE_DATA_DIR");
    if (!explicitDir.isEmpty()) {
        return QDir::cleanPath(explicitDir);
    }
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return basePath + QStringLiteral("/lexcite");
}

QJsonObject SettingsManager::toJson(const Settings& settings)
{
    QJsonObject json;
    json.insert(QStringLiteral("dbPath"), settings.dbPath);
    json.insert(QStringLiteral("vectorIndexPath"), settings.vectorIndexPath);
    json.insert(QStringLiteral("vectorMetaPath"), settings.vectorMetaPath);
    json.insert(QStringLiteral("embeddingBaseUrl"), settings.embeddingBaseUrl);
    json.insert(QStringLiteral("embeddingModel"), settings.embeddingModel);
    json.insert(QStringLiteral("embeddingDimensions"), settings.embeddingDimensions);
    json.insert(QStringLiteral("embeddingBatchSize"), settings.embeddingBatchSize);
    json.insert(QStringLiteral("reasoningBaseUrl"), settings.reasoningBaseUrl);
    json.insert(QStringLiteral("reasoningModel"), settings.reasoningModel);
    json.insert(QStringLiteral("reasoningTemperature"), settings.reasoningTemperature);
    json.insert(QStringLiteral("topK"), settings.topK);
    json.insert(QStringLiteral("rrfK"), settings.rrfK);
    json.insert(QStringLiteral("keywordMatchAny"), settings.keywordMatchAny);
    json.insert(QStringLiteral("validatePayloads"), settings.validatePayloads);
    json.insert(QStringLiteral("maxIterations"), settings.maxIterations);
    json.insert(QStringLiteral("providerTimeoutMs"), static_cast<qint64>(settings.providerTimeoutMs));
    json.insert(QStringLiteral("requestTimeoutMs"), static_cast<qint64>(settings.requestTimeoutMs));
    json.insert(QStringLiteral("minParagraphChars"), settings.minParagraphChars);
    return json;
}

Settings SettingsManager::fromJson(const QJsonObject& json)
{
    Settings settings;

    settings.dbPath = json.value(QStringLiteral("dbPath")).toString(settings.dbPath);
    settings.vectorIndexPath =
        json.value(QStringLiteral("vectorIndexPath")).toString(settings.vectorIndexPath);
    settings.vectorMetaPath =
        json.value(QStringLiteral("vectorMetaPath")).toString(settings.vectorMetaPath);

    settings.embeddingBaseUrl =
        json.value(QStringLiteral("embeddingBaseUrl")).toString(settings.embeddingBaseUrl);
    settings.embeddingModel =
        json.value(QStringLiteral("embeddingModel")).toString(settings.embeddingModel);
    settings.embeddingDimensions =
        json.value(QStringLiteral("embeddingDimensions")).toInt(settings.embeddingDimensions);
    settings.embeddingBatchSize =
        json.value(QStringLiteral("embeddingBatchSize")).toInt(settings.embeddingBatchSize);

    settings.reasoningBaseUrl =
        json.value(QStringLiteral("reasoningBaseUrl")).toString(settings.reasoningBaseUrl);
    settings.reasoningModel =
        json.value(QStringLiteral("reasoningModel")).toString(settings.reasoningModel);
    settings.reasoningTemperature =
        json.value(QStringLiteral("reasoningTemperature")).toDouble(settings.reasoningTemperature);

    settings.topK = json.value(QStringLiteral("topK")).toInt(settings.topK);
    settings.rrfK = json.value(QStringLiteral("rrfK")).toInt(settings.rrfK);
    settings.keywordMatchAny =
        json.value(QStringLiteral("keywordMatchAny")).toBool(settings.keywordMatchAny);
    settings.validatePayloads =
        json.value(QStringLiteral("validatePayloads")).toBool(settings.validatePayloads);
    settings.maxIterations =
        json.value(QStringLiteral("maxIterations")).toInt(settings.maxIterations);

    if (json.contains(QStringLiteral("providerTimeoutMs"))) {
        settings.providerTimeoutMs = json.value(QStringLiteral("providerTimeoutMs"))
                                         .toVariant()
                                         .toUInt();
    }
    if (json.contains(QStringLiteral("requestTimeoutMs"))) {
        settings.requestTimeoutMs = json.value(QStringLiteral("requestTimeoutMs"))
                                        .toVariant()
                                        .toUInt();
    }

    settings.minParagraphChars =
        json.value(QStringLiteral("minParagraphChars")).toInt(settings.minParagraphChars);

    return settings;
}

void SettingsManager::applyEnvironmentOverrides(Settings& settings)
{
    overrideString("LEXCITE_DB_PATH", settings.dbPath);
    overrideString("LEXCITE_VECTOR_INDEX_PATH", settings.vectorIndexPath);
    overrideString("LEXCITE_VECTOR_META_PATH", settings.vectorMetaPath);
    overrideString("LEXCITE_EMBEDDING_URL", settings.embeddingBaseUrl);
    overrideString("LEXCITE_EMBEDDING_MODEL", settings.embeddingModel);
    overrideInt("LEXCITE_EMBEDDING_DIMENSIONS", settings.embeddingDimensions);
    overrideString("LEXCITE_REASONING_URL", settings.reasoningBaseUrl);
    overrideString("LEXCITE_REASONING_MODEL", settings.reasoningModel);
    overrideInt("LEXCITE_TOP_K", settings.topK);
    overrideInt("LEXCITE_RRF_K", settings.rrfK);
    overrideInt("LEXCITE_MAX_ITERATIONS", settings.maxIterations);
    overrideUInt("LEXCITE_PROVIDER_TIMEOUT_MS", settings.providerTimeoutMs);
    overrideUInt("LEXCITE_REQUEST_TIMEOUT_MS", settings.requestTimeoutMs);
}

void SettingsManager::fillDefaultPaths(Settings& settings)
{
    const QString dataDir = defaultDataDirectory();
    if (settings.dbPath.isEmpty()) {
        settings.dbPath = dataDir + QStringLiteral("/hybrid_search.db");
    }
    if (settings.vectorIndexPath.isEmpty()) {
        settings.vectorIndexPath = dataDir + QStringLiteral("/paragraphs.hnsw");
    }
    if (settings.vectorMetaPath.isEmpty()) {
        settings.vectorMetaPath = settings.vectorIndexPath + QStringLiteral(".meta.json");
    }
}

std::optional<QString> SettingsManager::resolveApiKey()
{
    QString key = envString("OPENAI_API_KEY");
    if (key.isEmpty()) {
        key = envString("LEXCITE_API_KEY");
    }
    if (key.isEmpty()) {
        return std::nullopt;
    }
    return key;
}

QString SettingsManager::resolveEmbeddingApiKey()
{
    return envString("LEXCITE_EMBEDDING_API_KEY");
}

} // namespace lc
