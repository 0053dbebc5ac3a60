#include "core/models/model_registry.h"

#include "core/shared/logging.h"

#include <QDir>

namespace hr {

ModelRegistry::ModelRegistry(const QString& modelsDir)
    : m_modelsDir(QDir::cleanPath(modelsDir))
{
    const QString manifestPath = m_modelsDir + QStringLiteral("/manifest.json");
    std::optional<ModelManifest> loaded = ModelManifest::loadFromFile(manifestPath);
    if (loaded) {
        m_manifest = std::move(*loaded);
        LOG_INFO(hrEmbedding, "ModelRegistry: %zu model(s) listed in %s",
                 m_manifest.models.size(), qUtf8Printable(manifestPath));
    } else {
        LOG_WARN(hrEmbedding, "ModelRegistry: no usable manifest at %s, encoders disabled",
                 qUtf8Printable(manifestPath));
    }
}

ModelRegistry::~ModelRegistry() = default;

ModelSession* ModelRegistry::getSession(const std::string& role)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    auto sessionIt = m_sessions.find(role);
    if (sessionIt != m_sessions.end()) {
        return sessionIt->second && sessionIt->second->isAvailable()
            ? sessionIt->second.get()
            : nullptr;
    }

    auto manifestIt = m_manifest.models.find(role);
    if (manifestIt == m_manifest.models.end()) {
        LOG_WARN(hrEmbedding, "ModelRegistry: no manifest entry for role '%s'", role.c_str());
        m_sessions.emplace(role, nullptr);
        return nullptr;
    }

    const ModelManifestEntry& entry = manifestIt->second;
    auto session = std::make_unique<ModelSession>(entry);
    if (!session->initialize(m_modelsDir + QLatin1Char('/') + entry.file)) {
        LOG_WARN(hrEmbedding, "ModelRegistry: failed to initialize role '%s'", role.c_str());
        m_sessions.emplace(role, nullptr);
        return nullptr;
    }

    ModelSession* raw = session.get();
    m_sessions.emplace(role, std::move(session));
    return raw;
}

bool ModelRegistry::hasModel(const std::string& role) const
{
    return m_manifest.models.find(role) != m_manifest.models.end();
}

const ModelManifest& ModelRegistry::manifest() const
{
    return m_manifest;
}

const QString& ModelRegistry::modelsDir() const
{
    return m_modelsDir;
}

} // namespace hr
