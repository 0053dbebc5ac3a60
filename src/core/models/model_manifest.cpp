#include "core/models/model_manifest.h"

#include "core/shared/logging.h"

#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>

namespace hr {

namespace {

std::vector<QString> stringList(const QJsonValue& value)
{
    std::vector<QString> out;
    const QJsonArray array = value.toArray();
    out.reserve(static_cast<size_t>(array.size()));
    for (const QJsonValue& v : array) {
        out.push_back(v.toString());
    }
    return out;
}

std::optional<ModelManifestEntry> parseEntry(const QJsonObject& obj)
{
    if (!obj.contains(QStringLiteral("name")) || !obj.contains(QStringLiteral("file"))) {
        return std::nullopt;
    }

    ModelManifestEntry entry;
    entry.name = obj.value(QStringLiteral("name")).toString();
    entry.file = obj.value(QStringLiteral("file")).toString();
    entry.vocab = obj.value(QStringLiteral("vocab")).toString();
    entry.modelId = obj.value(QStringLiteral("modelId")).toString(entry.name);
    entry.dimensions = obj.value(QStringLiteral("dimensions")).toInt(0);
    entry.maxSeqLength = obj.value(QStringLiteral("maxSeqLength")).toInt(512);
    entry.queryPrefix = obj.value(QStringLiteral("queryPrefix")).toString();
    entry.tokenizer = obj.value(QStringLiteral("tokenizer")).toString(entry.tokenizer);
    entry.pooling = obj.value(QStringLiteral("pooling")).toString(entry.pooling);
    entry.intraOpThreads = obj.value(QStringLiteral("intraOpThreads")).toInt(entry.intraOpThreads);
    entry.inputs = stringList(obj.value(QStringLiteral("inputs")));
    entry.outputs = stringList(obj.value(QStringLiteral("outputs")));
    return entry;
}

} // anonymous namespace

std::optional<ModelManifest> ModelManifest::loadFromFile(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        LOG_WARN(hrEmbedding, "ModelManifest: cannot open %s", qUtf8Printable(path));
        return std::nullopt;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_WARN(hrEmbedding, "ModelManifest: invalid JSON in %s: %s",
                 qUtf8Printable(path), qUtf8Printable(parseError.errorString()));
        return std::nullopt;
    }

    return loadFromJson(doc.object());
}

std::optional<ModelManifest> ModelManifest::loadFromJson(const QJsonObject& root)
{
    const QJsonValue modelsValue = root.value(QStringLiteral("models"));
    if (!modelsValue.isObject()) {
        LOG_WARN(hrEmbedding, "ModelManifest: missing or invalid 'models' key");
        return std::nullopt;
    }

    ModelManifest manifest;
    const QJsonObject modelsObj = modelsValue.toObject();
    for (auto it = modelsObj.begin(); it != modelsObj.end(); ++it) {
        std::optional<ModelManifestEntry> entry =
            it.value().isObject() ? parseEntry(it.value().toObject()) : std::nullopt;
        if (!entry) {
            LOG_WARN(hrEmbedding, "ModelManifest: skipping malformed entry '%s'",
                     qUtf8Printable(it.key()));
            continue;
        }
        manifest.models[it.key().toStdString()] = std::move(*entry);
    }

    return manifest;
}

} // namespace hr
