#pragma once

#include "core/shared/settings.h"

#include <QJsonObject>
#include <QString>

#include <optional>

namespace hr {

// SettingsManager -- JSON save/load for service settings.
//
// Settings are stored as a JSON file at $HYBRIDRAG_SETTINGS, or
//   <GenericDataLocation>/hybridrag/settings.json
// when the variable is unset.
class SettingsManager {
public:
    // Load settings from disk. Returns nullopt if file doesn't exist
    // or cannot be parsed.
    static std::optional<Settings> load();
    static std::optional<Settings> load(const QString& filePath);

    // Save settings to disk. Creates the directory if it doesn't exist.
    // Returns true on success.
    static bool save(const Settings& settings);
    static bool save(const Settings& settings, const QString& filePath);

    // Loaded settings (or defaults) with HYBRIDRAG_DB_PATH and
    // HYBRIDRAG_MODELS_DIR applied on top, and empty paths filled in.
    static Settings resolve();

    static void applyEnvironmentOverrides(Settings& settings);

    // Returns the default file path for the settings file.
    static QString settingsFilePath();
    static QString defaultDataDir();

    // Convert settings to/from JSON.
    static QJsonObject toJson(const Settings& settings);
    static Settings fromJson(const QJsonObject& json);
};

} // namespace hr
