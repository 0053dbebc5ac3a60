#pragma once

#include "core/models/model_manifest.h"
#include "core/models/model_session.h"

#include <QString>

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace hr {

// Loads <modelsDir>/manifest.json and hands out one lazily created
// ModelSession per role.
class ModelRegistry {
public:
    explicit ModelRegistry(const QString& modelsDir);
    ~ModelRegistry();

    ModelRegistry(const ModelRegistry&) = delete;
    ModelRegistry& operator=(const ModelRegistry&) = delete;
    ModelRegistry(ModelRegistry&&) = delete;
    ModelRegistry& operator=(ModelRegistry&&) = delete;

    // nullptr if the role is not in the manifest or the session can't be
    // initialized. A failed role is not retried.
    ModelSession* getSession(const std::string& role);

    bool hasModel(const std::string& role) const;

    const ModelManifest& manifest() const;
    const QString& modelsDir() const;

private:
    QString m_modelsDir;
    ModelManifest m_manifest;
    std::unordered_map<std::string, std::unique_ptr<ModelSession>> m_sessions;
    mutable std::mutex m_mutex;
};

} // namespace hr
