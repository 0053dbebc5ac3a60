#include "core/embedding/embedding_manager.h"
#include "core/embedding/tokenizer.h"
#include "core/models/model_registry.h"
#include "core/models/model_session.h"
#include "core/models/tokenizer_factory.h"
#include "core/shared/logging.h"

#include <onnxruntime_cxx_api.h>

#include <algorithm>
#include <cmath>

namespace hr {

EmbeddingManager::EmbeddingManager(ModelRegistry* registry, int inferenceTimeoutMs)
    : m_registry(registry)
    , m_inferenceTimeoutMs(inferenceTimeoutMs)
{
}

EmbeddingManager::~EmbeddingManager() = default;

bool EmbeddingManager::initialize()
{
    m_available = false;
    if (!m_registry) {
        LOG_WARN(hrEmbedding, "EmbeddingManager: no model registry, dense encoding disabled");
        return false;
    }

    m_session = m_registry->getSession(kDenseEncoderRole);
    if (!m_session) {
        LOG_WARN(hrEmbedding, "EmbeddingManager: dense-encoder session unavailable");
        return false;
    }

    const ModelManifestEntry& entry = m_session->manifest();
    m_tokenizer = TokenizerFactory::create(entry, m_registry->modelsDir());
    if (!m_tokenizer) {
        LOG_WARN(hrEmbedding, "EmbeddingManager: tokenizer creation failed for %s",
                 qUtf8Printable(entry.name));
        return false;
    }

    m_embeddingSize = entry.dimensions;
    if (m_embeddingSize <= 0) {
        LOG_WARN(hrEmbedding, "EmbeddingManager: invalid dimensions %d for %s",
                 m_embeddingSize, qUtf8Printable(entry.name));
        return false;
    }

    m_queryPrefix = entry.queryPrefix;
    m_meanPooling = entry.pooling.compare(QStringLiteral("mean"), Qt::CaseInsensitive) == 0;
    m_available = true;
    LOG_INFO(hrEmbedding, "EmbeddingManager: %s ready (%d dims, %s pooling)",
             qUtf8Printable(entry.name), m_embeddingSize, m_meanPooling ? "mean" : "cls");
    return true;
}

bool EmbeddingManager::isAvailable() const
{
    return m_available;
}

int EmbeddingManager::dimensions() const
{
    return m_embeddingSize;
}

DenseVector EmbeddingManager::normalizeEmbedding(DenseVector embedding)
{
    double sumSquares = 0.0;
    for (const float value : embedding) {
        sumSquares += static_cast<double>(value) * static_cast<double>(value);
    }

    const double norm = std::sqrt(sumSquares);
    if (norm <= 0.0 || !std::isfinite(norm)) {
        return embedding;
    }

    for (float& value : embedding) {
        value = static_cast<float>(static_cast<double>(value) / norm);
    }
    return embedding;
}

std::optional<DenseVector> EmbeddingManager::embed(const QString& text)
{
    std::vector<DenseVector> result = embedBatch({text});
    if (result.empty()) {
        return std::nullopt;
    }
    return std::move(result.front());
}

std::optional<DenseVector> EmbeddingManager::embedQuery(const QString& text)
{
    return embed(m_queryPrefix + text);
}

std::vector<DenseVector> EmbeddingManager::embedBatch(const std::vector<QString>& texts)
{
    if (!m_available || !m_session || !m_tokenizer || texts.empty()) {
        return {};
    }

    if (m_circuitBreaker.isOpen()) {
        LOG_DEBUG(hrEmbedding, "EmbeddingManager: circuit breaker open, skipping inference");
        return {};
    }

    const BatchTokenizerOutput tokenized = m_tokenizer->tokenizeBatch(texts);
    if (tokenized.batchSize <= 0 || tokenized.seqLength <= 0) {
        return {};
    }

    const int64_t inputShape[2] = {
        static_cast<int64_t>(tokenized.batchSize),
        static_cast<int64_t>(tokenized.seqLength),
    };

    try {
        Ort::MemoryInfo memoryInfo = Ort::MemoryInfo::CreateCpu(OrtAllocatorType::OrtArenaAllocator,
                                                                OrtMemTypeDefault);

        Ort::Value inputTensors[3] = {
            Ort::Value::CreateTensor<int64_t>(
                memoryInfo, const_cast<int64_t*>(tokenized.inputIds.data()),
                tokenized.inputIds.size(), inputShape, 2),
            Ort::Value::CreateTensor<int64_t>(
                memoryInfo, const_cast<int64_t*>(tokenized.attentionMask.data()),
                tokenized.attentionMask.size(), inputShape, 2),
            Ort::Value::CreateTensor<int64_t>(
                memoryInfo, const_cast<int64_t*>(tokenized.tokenTypeIds.data()),
                tokenized.tokenTypeIds.size(), inputShape, 2),
        };

        static constexpr const char* inputNames[3] = {
            "input_ids",
            "attention_mask",
            "token_type_ids",
        };
        const std::vector<std::string>& modelInputs = m_session->inputNames();
        const size_t inputCount =
            std::find(modelInputs.begin(), modelInputs.end(), "token_type_ids") != modelInputs.end()
            ? 3 : 2;
        const char* outputNames[1] = {m_session->outputNames().front().c_str()};

        std::vector<Ort::Value> outputs = m_session->run(
            inputNames, inputTensors, inputCount, outputNames, 1, m_inferenceTimeoutMs);

        if (outputs.empty() || !outputs[0].IsTensor()) {
            LOG_WARN(hrEmbedding, "EmbeddingManager: inference returned no tensor");
            m_circuitBreaker.recordFailure();
            return {};
        }

        const std::vector<int64_t> shape = outputs[0].GetTensorTypeAndShapeInfo().GetShape();
        const float* data = outputs[0].GetTensorData<float>();
        const int batch = tokenized.batchSize;
        const int dim = m_embeddingSize;

        std::vector<DenseVector> embeddings;
        embeddings.reserve(static_cast<size_t>(batch));

        if (shape.size() == 2 && shape[0] == batch && shape[1] == dim) {
            for (int i = 0; i < batch; ++i) {
                const float* row = data + static_cast<size_t>(i) * dim;
                embeddings.push_back(normalizeEmbedding(DenseVector(row, row + dim)));
            }
        } else if (shape.size() == 3 && shape[0] == batch && shape[1] >= 1 && shape[2] == dim) {
            const int64_t seqLen = shape[1];
            for (int i = 0; i < batch; ++i) {
                const float* hidden = data + static_cast<size_t>(i * seqLen * dim);
                DenseVector pooled(static_cast<size_t>(dim), 0.0f);
                if (m_meanPooling) {
                    const int64_t* mask = tokenized.attentionMask.data()
                        + static_cast<size_t>(i) * tokenized.seqLength;
                    int counted = 0;
                    for (int64_t t = 0; t < std::min<int64_t>(seqLen, tokenized.seqLength); ++t) {
                        if (mask[t] == 0) {
                            continue;
                        }
                        const float* tok = hidden + static_cast<size_t>(t * dim);
                        for (int j = 0; j < dim; ++j) {
                            pooled[static_cast<size_t>(j)] += tok[j];
                        }
                        ++counted;
                    }
                    for (float& v : pooled) {
                        v /= static_cast<float>(std::max(1, counted));
                    }
                } else {
                    std::copy(hidden, hidden + dim, pooled.begin());
                }
                embeddings.push_back(normalizeEmbedding(std::move(pooled)));
            }
        } else {
            LOG_WARN(hrEmbedding, "EmbeddingManager: unsupported output rank %zu",
                     shape.size());
            m_circuitBreaker.recordFailure();
            return {};
        }

        m_circuitBreaker.recordSuccess();
        return embeddings;
    } catch (const Ort::Exception& ex) {
        LOG_WARN(hrEmbedding, "EmbeddingManager: inference failed: %s", ex.what());
        m_circuitBreaker.recordFailure();
        return {};
    }
}

} // namespace hr
