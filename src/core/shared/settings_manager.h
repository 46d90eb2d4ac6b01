#pragma once

#include "core/shared/settings.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace lc {

// SettingsManager -- JSON save/load for service configuration.
//
// Settings are stored as a JSON file at $LEXCITE_CONFIG, or
//   <GenericConfigLocation>/lexcite/settings.json
// Environment variables (LEXCITE_*) override values from the file.
// Credentials never live in the file; see resolveApiKey().
class SettingsManager {
public:
    // Load settings from the given file. Returns nullopt if the file
    // doesn't exist or cannot be parsed.
    static std::optional<Settings> load(const QString& filePath);

    // Load from the default location, falling back to defaults, then
    // apply environment overrides and fill in derived storage paths.
    static Settings loadEffective();

    // Save settings to disk. Creates the directory if it doesn't exist.
    static bool save(const Settings& settings, const QString& filePath);

    static QString settingsFilePath();
    static QString defaultDataDirectory();

    static QJsonObject toJson(const Settings& settings);
    static Settings fromJson(const QJsonObject& json);

    static void applyEnvironmentOverrides(Settings& settings);
    static void fillDefaultPaths(Settings& settings);

    // Reasoning engine key from OPENAI_API_KEY (or LEXCITE_API_KEY).
    static std::optional<QString> resolveApiKey();
    // Optional key for the embedding endpoint (LEXCITE_EMBEDDING_API_KEY).
    static QString resolveEmbeddingApiKey();
};

} // namespace lc
