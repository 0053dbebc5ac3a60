#pragma once

#include "core/models/model_manifest.h"

#include <QString>

#include <memory>
#include <string>
#include <vector>

namespace Ort {
struct Session;
struct Value;
}

namespace hr {

// Owns one ONNX Runtime CPU session for a manifest entry.
class ModelSession {
public:
    explicit ModelSession(const ModelManifestEntry& manifest);
    ~ModelSession();

    ModelSession(const ModelSession&) = delete;
    ModelSession& operator=(const ModelSession&) = delete;
    ModelSession(ModelSession&&) = delete;
    ModelSession& operator=(ModelSession&&) = delete;

    bool initialize(const QString& modelPath);
    bool isAvailable() const;

    const ModelManifestEntry& manifest() const;
    const std::vector<std::string>& inputNames() const;
    const std::vector<std::string>& outputNames() const;

    // nullptr until initialize() succeeds. Run() is safe from multiple threads.
    Ort::Session* session() const;

    // Session::Run with a deadline. A positive timeoutMs terminates the run
    // once exceeded, which surfaces as Ort::Exception like any other failure.
    std::vector<Ort::Value> run(const char* const* inputNames,
                                const Ort::Value* inputs,
                                size_t inputCount,
                                const char* const* outputNames,
                                size_t outputCount,
                                int timeoutMs) const;

private:
    class Impl;
    std::unique_ptr<Impl> m_impl;

    ModelManifestEntry m_manifest;
    std::vector<std::string> m_inputNames;
    std::vector<std::string> m_outputNames;
    bool m_available = false;
};

} // namespace hr
