#include "core/shared/settings_manager.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QStandardPaths>

#include <algorithm>

namespace rw {

namespace {

std::optional<int> parseNonNegativeInt(const QString& name, const QString& raw)
{
    bool ok = false;
    const int value = raw.trimmed().toInt(&ok);
    if (!ok || value < 0) {
        LOG_WARN(rwCore, "Ignoring invalid value for %s: '%s'",
                 qUtf8Printable(name), qUtf8Printable(raw));
        return std::nullopt;
    }
    return value;
}

std::optional<bool> parseBool(const QString& name, const QString& raw)
{
    const QString lower = raw.trimmed().toLower();
    if (lower == QLatin1String("true") || lower == QLatin1String("1")
        || lower == QLatin1String("yes") || lower == QLatin1String("on")) {
        return true;
    }
    if (lower == QLatin1String("false") || lower == QLatin1String("0")
        || lower == QLatin1String("no") || lower == QLatin1String("off")) {
        return false;
    }
    LOG_WARN(rwCore, "Ignoring invalid value for %s: '%s'",
             qUtf8Printable(name), qUtf8Printable(raw));
    return std::nullopt;
}

} // namespace

std::optional<RouterSettings> SettingsManager::load(const QString& filePath)
{
    QFile file(filePath);
    if (!file.exists()) {
        return std::nullopt;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(rwCore, "Failed to open settings file for read: %s", qUtf8Printable(filePath));
        return std::nullopt;
    }

    const QByteArray rawJson = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(rawJson, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(rwCore,
                 "Failed to parse settings JSON (%s): %s",
                 qUtf8Printable(filePath),
                 qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    return fromJson(doc.object());
}

std::optional<RouterSettings> SettingsManager::load()
{
    return load(settingsFilePath());
}

bool SettingsManager::save(const RouterSettings& settings, const QString& filePath)
{
    const QFileInfo fileInfo(filePath);
    const QString parentDir = fileInfo.absolutePath();

    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(rwCore, "Failed to create settings directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    const QJsonDocument doc(toJson(settings));
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(rwCore, "Failed to open settings file for write: %s", qUtf8Printable(filePath));
        return false;
    }

    const qint64 bytesWritten = file.write(doc.toJson(QJsonDocument::Indented));
    file.close();

    if (bytesWritten < 0) {
        LOG_ERROR(rwCore, "Failed to write settings file: %s", qUtf8Printable(filePath));
        return false;
    }

    return true;
}

QString SettingsManager::settingsFilePath()
{
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return basePath + QStringLiteral("/routewise/settings.json");
}

void SettingsManager::applyEnvironment(RouterSettings& settings, const QProcessEnvironment& env)
{
    const QString enabledKey = QStringLiteral("ROUTEWISE_CACHE_ENABLED");
    if (env.contains(enabledKey)) {
        if (auto value = parseBool(enabledKey, env.value(enabledKey))) {
            settings.cacheEnabled = *value;
        }
    }

    const QString ttlKey = QStringLiteral("ROUTEWISE_CACHE_TTL");
    if (env.contains(ttlKey)) {
        if (auto value = parseNonNegativeInt(ttlKey, env.value(ttlKey))) {
            settings.cacheTtlSeconds = *value;
        }
    }

    const QString maxEntriesKey = QStringLiteral("ROUTEWISE_CACHE_MAX_ENTRIES");
    if (env.contains(maxEntriesKey)) {
        if (auto value = parseNonNegativeInt(maxEntriesKey, env.value(maxEntriesKey))) {
            settings.cacheMaxEntries = *value;
        }
    }

    const QString dbKey = QStringLiteral("ROUTEWISE_CACHE_DB");
    if (env.contains(dbKey)) {
        settings.cacheDbPath = env.value(dbKey).trimmed();
    }

    const QString timeoutKey = QStringLiteral("ROUTEWISE_TOOL_TIMEOUT_MS");
    if (env.contains(timeoutKey)) {
        if (auto value = parseNonNegativeInt(timeoutKey, env.value(timeoutKey))) {
            settings.toolTimeoutMs = *value;
        }
    }
}

QJsonObject SettingsManager::toJson(const RouterSettings& settings)
{
    QJsonObject json;
    json.insert(QStringLiteral("cacheEnabled"), settings.cacheEnabled);
    json.insert(QStringLiteral("cacheTtlSeconds"), settings.cacheTtlSeconds);
    json.insert(QStringLiteral("cacheMaxEntries"), settings.cacheMaxEntries);
    json.insert(QStringLiteral("cacheDbPath"), settings.cacheDbPath);
    json.insert(QStringLiteral("toolTimeoutMs"), settings.toolTimeoutMs);
    json.insert(QStringLiteral("webSearchFallback"), settings.webSearchFallback);
    return json;
}

RouterSettings SettingsManager::fromJson(const QJsonObject& json)
{
    RouterSettings settings;

    settings.cacheEnabled = json.value(QStringLiteral("cacheEnabled"))
                                .toBool(settings.cacheEnabled);
    settings.cacheDbPath = json.value(QStringLiteral("cacheDbPath")).toString(settings.cacheDbPath);
    settings.webSearchFallback = json.value(QStringLiteral("webSearchFallback"))
                                     .toBool(settings.webSearchFallback);

    if (json.contains(QStringLiteral("cacheTtlSeconds"))) {
        settings.cacheTtlSeconds = std::max(
            0, json.value(QStringLiteral("cacheTtlSeconds")).toInt(settings.cacheTtlSeconds));
    }

    if (json.contains(QStringLiteral("cacheMaxEntries"))) {
        settings.cacheMaxEntries = std::max(
            0, json.value(QStringLiteral("cacheMaxEntries")).toInt(settings.cacheMaxEntries));
    }

    if (json.contains(QStringLiteral("toolTimeoutMs"))) {
        settings.toolTimeoutMs = std::max(
            0, json.value(QStringLiteral("toolTimeoutMs")).toInt(settings.toolTimeoutMs));
    }

    return settings;
}

} // namespace rw
