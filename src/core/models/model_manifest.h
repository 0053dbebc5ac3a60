#pragma once

#include <QJsonObject>
#include <QString>

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace hr {

// Manifest roles understood by the encoders.
inline constexpr const char* kDenseEncoderRole = "dense-encoder";
inline constexpr const char* kSparseEncoderRole = "sparse-encoder";

struct ModelManifestEntry {
    QString name;
    QString file;
    QString vocab;
    QString modelId;
    int dimensions = 0;             // dense output size; 0 for sparse models
    int maxSeqLength = 512;
    QString queryPrefix;
    QString tokenizer = QStringLiteral("wordpiece");
    QString pooling = QStringLiteral("cls");   // "cls" or "mean" (dense only)
    int intraOpThreads = 2;
    std::vector<QString> inputs;
    std::vector<QString> outputs;
};

// models/manifest.json:
//   { "models": { "<role>": { "name": ..., "file": ..., "vocab": ..., ... } } }
struct ModelManifest {
    std::unordered_map<std::string, ModelManifestEntry> models;

    static std::optional<ModelManifest> loadFromFile(const QString& path);
    static std::optional<ModelManifest> loadFromJson(const QJsonObject& root);
};

} // namespace hr
