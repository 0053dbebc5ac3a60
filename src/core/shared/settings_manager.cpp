#include "core/shared/settings_manager.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QStandardPaths>

namespace hr {

namespace {

void readInt(const QJsonObject& json, const char* key, int& target)
{
    const QString name = QString::fromLatin1(key);
    if (json.contains(name)) {
        target = json.value(name).toVariant().toInt();
    }
}

} // anonymous namespace

std::optional<Settings> SettingsManager::load()
{
    return load(settingsFilePath());
}

std::optional<Settings> SettingsManager::load(const QString& filePath)
{
    QFile file(filePath);
    if (!file.exists()) {
        return std::nullopt;
    }

    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(hrCore, "Failed to open settings file for read: %s", qUtf8Printable(filePath));
        return std::nullopt;
    }

    const QByteArray rawJson = file.readAll();
    file.close();

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(rawJson, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(hrCore,
                 "Failed to parse settings JSON (%s): %s",
                 qUtf8Printable(filePath),
                 qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    return fromJson(doc.object());
}

bool SettingsManager::save(const Settings& settings)
{
    return save(settings, settingsFilePath());
}

bool SettingsManager::save(const Settings& settings, const QString& filePath)
{
    const QFileInfo fileInfo(filePath);
    const QString parentDir = fileInfo.absolutePath();

    if (!QDir().mkpath(parentDir)) {
        LOG_ERROR(hrCore, "Failed to create settings directory: %s", qUtf8Printable(parentDir));
        return false;
    }

    const QJsonDocument doc(toJson(settings));
    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        LOG_ERROR(hrCore, "Failed to open settings file for write: %s", qUtf8Printable(filePath));
        return false;
    }

    const qint64 bytesWritten = file.write(doc.toJson(QJsonDocument::Indented));
    file.close();

    if (bytesWritten < 0) {
        LOG_ERROR(hrCore, "Failed to write settings file: %s", qUtf8Printable(filePath));
        return false;
    }

    return true;
}

Settings SettingsManager::resolve()
{
    Settings settings = load().value_or(Settings{});
    applyEnvironmentOverrides(settings);

    if (settings.dbPath.isEmpty()) {
        settings.dbPath = defaultDataDir() + QStringLiteral("/index.db");
    }
    if (settings.modelsDir.isEmpty()) {
        settings.modelsDir = defaultDataDir() + QStringLiteral("/models");
    }
    return settings;
}

void SettingsManager::applyEnvironmentOverrides(Settings& settings)
{
    const QString dbPath = qEnvironmentVariable("HYBRIDRAG_DB_PATH");
    if (!dbPath.isEmpty()) {
        settings.dbPath = dbPath;
    }
    const QString modelsDir = qEnvironmentVariable("HYBRIDRAG_MODELS_DIR");
    if (!modelsDir.isEmpty()) {
        settings.modelsDir = modelsDir;
    }
}

QString SettingsManager::settingsFilePath()
{
    const QString overridePath = qEnvironmentVariable("HYBRIDRAG_SETTINGS");
    if (!overridePath.isEmpty()) {
        return overridePath;
    }
    return defaultDataDir() + QStringLiteral("/settings.json");
}

QString SettingsManager::defaultDataDir()
{
    const QString basePath = QStandardPaths::writableLocation(QStandardPaths::GenericDataLocation);
    return basePath + QStringLiteral("/hybridrag");
}

QJsonObject SettingsManager::toJson(const Settings& settings)
{
    QJsonObject json;
    json.insert(QStringLiteral("dbPath"), settings.dbPath);
    json.insert(QStringLiteral("modelsDir"), settings.modelsDir);
    json.insert(QStringLiteral("chunkSize"), settings.chunkSize);
    json.insert(QStringLiteral("chunkOverlap"), settings.chunkOverlap);
    json.insert(QStringLiteral("minChunkSize"), settings.minChunkSize);
    json.insert(QStringLiteral("rrfK"), settings.rrfK);
    json.insert(QStringLiteral("minCandidatesPerSignal"), settings.minCandidatesPerSignal);
    json.insert(QStringLiteral("maxTopK"), settings.maxTopK);
    json.insert(QStringLiteral("minQuestionChars"), settings.minQuestionChars);
    json.insert(QStringLiteral("maxQuestionChars"), settings.maxQuestionChars);
    json.insert(QStringLiteral("signalTimeoutMs"), settings.signalTimeoutMs);
    json.insert(QStringLiteral("cacheMaxEntries"), settings.cacheMaxEntries);
    json.insert(QStringLiteral("cacheTtlSeconds"), settings.cacheTtlSeconds);
    json.insert(QStringLiteral("sparseMaxTerms"), settings.sparseMaxTerms);
    json.insert(QStringLiteral("inferenceTimeoutMs"), settings.inferenceTimeoutMs);
    return json;
}

Settings SettingsManager::fromJson(const QJsonObject& json)
{
    Settings settings;

    settings.dbPath = json.value(QStringLiteral("dbPath")).toString(settings.dbPath);
    settings.modelsDir = json.value(QStringLiteral("modelsDir")).toString(settings.modelsDir);

    readInt(json, "chunkSize", settings.chunkSize);
    readInt(json, "chunkOverlap", settings.chunkOverlap);
    readInt(json, "minChunkSize", settings.minChunkSize);
    readInt(json, "rrfK", settings.rrfK);
    readInt(json, "minCandidatesPerSignal", settings.minCandidatesPerSignal);
    readInt(json, "maxTopK", settings.maxTopK);
    readInt(json, "minQuestionChars", settings.minQuestionChars);
    readInt(json, "maxQuestionChars", settings.maxQuestionChars);
    readInt(json, "signalTimeoutMs", settings.signalTimeoutMs);
    readInt(json, "cacheMaxEntries", settings.cacheMaxEntries);
    readInt(json, "cacheTtlSeconds", settings.cacheTtlSeconds);
    readInt(json, "sparseMaxTerms", settings.sparseMaxTerms);
    readInt(json, "inferenceTimeoutMs", settings.inferenceTimeoutMs);

    return settings;
}

} // namespace hr
