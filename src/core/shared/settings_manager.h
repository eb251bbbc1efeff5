#pragma once

#include "core/shared/settings.h"

#include <QJsonObject>
#include <QProcessEnvironment>
#include <QString>

#include <optional>

namespace rw {

// SettingsManager -- JSON save/load for router settings.
//
// Settings are stored as a JSON file, by default at:
//   <GenericDataLocation>/routewise/settings.json
// Environment variables (ROUTEWISE_*) override values read from disk.
class SettingsManager {
public:
    // Load settings from the given file. Returns nullopt if the file
    // doesn't exist or cannot be parsed.
    static std::optional<RouterSettings> load(const QString& filePath);
    static std::optional<RouterSettings> load();

    // Save settings to disk. Creates the directory if it doesn't exist.
    // Returns true on success.
    static bool save(const RouterSettings& settings, const QString& filePath);

    static QString settingsFilePath();

    // Apply ROUTEWISE_CACHE_ENABLED, ROUTEWISE_CACHE_TTL,
    // ROUTEWISE_CACHE_MAX_ENTRIES, ROUTEWISE_CACHE_DB and
    // ROUTEWISE_TOOL_TIMEOUT_MS. Malformed values are logged and skipped.
    static void applyEnvironment(RouterSettings& settings,
                                 const QProcessEnvironment& env
                                 = QProcessEnvironment::systemEnvironment());

    // Convert settings to/from JSON.
    static QJsonObject toJson(const RouterSettings& settings);
    static RouterSettings fromJson(const QJsonObject& json);
};

} // namespace rw
