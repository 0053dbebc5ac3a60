#include "core/models/model_session.h"

#include "core/shared/logging.h"

#include <QFile>

#include <onnxruntime_cxx_api.h>

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace hr {

namespace {

Ort::Env& ortEnvironment()
{
    static Ort::Env env(ORT_LOGGING_LEVEL_WARNING, "hybridrag-models");
    return env;
}

// Calls SetTerminate on the run options if the owning scope outlives the
// deadline. Joined on destruction.
class RunWatchdog {
public:
    RunWatchdog(Ort::RunOptions& options, int timeoutMs)
    {
        if (timeoutMs <= 0) {
            return;
        }
        m_thread = std::thread([this, &options, timeoutMs]() {
            std::unique_lock<std::mutex> lock(m_mutex);
            if (!m_cv.wait_for(lock, std::chrono::milliseconds(timeoutMs),
                               [this]() { return m_done; })) {
                LOG_WARN(hrEmbedding, "ModelSession: inference exceeded %d ms, terminating",
                         timeoutMs);
                options.SetTerminate();
            }
        });
    }

    ~RunWatchdog()
    {
        if (!m_thread.joinable()) {
            return;
        }
        {
            std::lock_guard<std::mutex> lock(m_mutex);
            m_done = true;
        }
        m_cv.notify_one();
        m_thread.join();
    }

    RunWatchdog(const RunWatchdog&) = delete;
    RunWatchdog& operator=(const RunWatchdog&) = delete;

private:
    std::mutex m_mutex;
    std::condition_variable m_cv;
    bool m_done = false;
    std::thread m_thread;
};

} // anonymous namespace

class ModelSession::Impl {
public:
    Ort::SessionOptions sessionOptions;
    std::unique_ptr<Ort::Session> session;
};

ModelSession::ModelSession(const ModelManifestEntry& manifest)
    : m_impl(std::make_unique<Impl>())
    , m_manifest(manifest)
{
}

ModelSession::~ModelSession() = default;

bool ModelSession::initialize(const QString& modelPath)
{
    m_available = false;
    if (modelPath.isEmpty() || !QFile::exists(modelPath)) {
        LOG_WARN(hrEmbedding, "ModelSession: model file missing at %s", qUtf8Printable(modelPath));
        return false;
    }

    try {
        m_impl->sessionOptions.SetIntraOpNumThreads(std::max(1, m_manifest.intraOpThreads));
        m_impl->sessionOptions.SetInterOpNumThreads(1);
        m_impl->sessionOptions.SetExecutionMode(ExecutionMode::ORT_SEQUENTIAL);
        m_impl->sessionOptions.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_ALL);

        m_impl->session = std::make_unique<Ort::Session>(
            ortEnvironment(), modelPath.toUtf8().constData(), m_impl->sessionOptions);

        Ort::AllocatorWithDefaultOptions allocator;

        m_inputNames.clear();
        const size_t inputCount = m_impl->session->GetInputCount();
        for (size_t i = 0; i < inputCount; ++i) {
            Ort::AllocatedStringPtr name = m_impl->session->GetInputNameAllocated(i, allocator);
            if (name.get() != nullptr) {
                m_inputNames.emplace_back(name.get());
            }
        }

        for (const QString& expectedInput : m_manifest.inputs) {
            const std::string expected = expectedInput.toStdString();
            if (std::find(m_inputNames.begin(), m_inputNames.end(), expected) == m_inputNames.end()) {
                LOG_WARN(hrEmbedding, "ModelSession: required input '%s' not found in %s",
                         qUtf8Printable(expectedInput), qUtf8Printable(m_manifest.name));
                m_impl->session.reset();
                return false;
            }
        }

        m_outputNames.clear();
        const size_t outputCount = m_impl->session->GetOutputCount();
        for (size_t i = 0; i < outputCount; ++i) {
            Ort::AllocatedStringPtr name = m_impl->session->GetOutputNameAllocated(i, allocator);
            if (name.get() != nullptr && name.get()[0] != '\0') {
                m_outputNames.emplace_back(name.get());
            }
        }

        // A manifest-declared output goes first so callers can take front().
        if (!m_manifest.outputs.empty()) {
            const std::string preferred = m_manifest.outputs.front().toStdString();
            auto it = std::find(m_outputNames.begin(), m_outputNames.end(), preferred);
            if (it == m_outputNames.end()) {
                LOG_WARN(hrEmbedding, "ModelSession: declared output '%s' not found in %s",
                         preferred.c_str(), qUtf8Printable(m_manifest.name));
                m_impl->session.reset();
                return false;
            }
            std::rotate(m_outputNames.begin(), it, it + 1);
        }

        if (m_outputNames.empty()) {
            LOG_WARN(hrEmbedding, "ModelSession: no outputs in %s", qUtf8Printable(m_manifest.name));
            m_impl->session.reset();
            return false;
        }

        LOG_INFO(hrEmbedding, "ModelSession: initialized '%s' (%zu inputs, %zu outputs)",
                 qUtf8Printable(m_manifest.name), m_inputNames.size(), m_outputNames.size());
        m_available = true;
        return true;
    } catch (const Ort::Exception& ex) {
        LOG_WARN(hrEmbedding, "ModelSession: ONNX initialization failed for %s: %s",
                 qUtf8Printable(m_manifest.name), ex.what());
    }

    m_impl->session.reset();
    return false;
}

bool ModelSession::isAvailable() const
{
    return m_available;
}

const ModelManifestEntry& ModelSession::manifest() const
{
    return m_manifest;
}

const std::vector<std::string>& ModelSession::inputNames() const
{
    return m_inputNames;
}

const std::vector<std::string>& ModelSession::outputNames() const
{
    return m_outputNames;
}

Ort::Session* ModelSession::session() const
{
    return m_impl->session.get();
}

std::vector<Ort::Value> ModelSession::run(const char* const* inputNames,
                                          const Ort::Value* inputs,
                                          size_t inputCount,
                                          const char* const* outputNames,
                                          size_t outputCount,
                                          int timeoutMs) const
{
    if (!m_impl->session) {
        throw Ort::Exception("session not initialized", ORT_FAIL);
    }

    Ort::RunOptions options;
    RunWatchdog watchdog(options, timeoutMs);
    return m_impl->session->Run(options, inputNames, inputs, inputCount,
                                outputNames, outputCount);
}

} // namespace hr
