#include "core/embedding/sparse_encoder.h"
#include "core/embedding/tokenizer.h"
#include "core/models/model_registry.h"
#include "core/models/model_session.h"
#include "core/models/tokenizer_factory.h"
#include "core/shared/logging.h"

#include <onnxruntime_cxx_api.h>

#include <algorithm>
#include <cmath>
#include <utility>

namespace hr {

SparseExpansionEncoder::SparseExpansionEncoder(ModelRegistry* registry, const Config& config)
    : m_registry(registry)
    , m_config(config)
{
}

SparseExpansionEncoder::~SparseExpansionEncoder() = default;

bool SparseExpansionEncoder::initialize()
{
    m_available = false;
    if (!m_registry) {
        LOG_WARN(hrEmbedding, "SparseExpansionEncoder: no model registry, sparse encoding disabled");
        return false;
    }

    m_session = m_registry->getSession(kSparseEncoderRole);
    if (!m_session) {
        LOG_WARN(hrEmbedding, "SparseExpansionEncoder: sparse-encoder session unavailable");
        return false;
    }

    m_tokenizer = TokenizerFactory::create(m_session->manifest(), m_registry->modelsDir());
    if (!m_tokenizer) {
        LOG_WARN(hrEmbedding, "SparseExpansionEncoder: tokenizer creation failed");
        return false;
    }

    m_available = true;
    LOG_INFO(hrEmbedding, "SparseExpansionEncoder: %s ready (vocab %d, max %d terms)",
             qUtf8Printable(m_session->manifest().name), m_tokenizer->vocabSize(),
             m_config.maxTerms);
    return true;
}

bool SparseExpansionEncoder::isAvailable() const
{
    return m_available;
}

SparseVector SparseExpansionEncoder::pruneTerms(const SparseVector& weights, int maxTerms)
{
    std::vector<std::pair<QString, float>> ranked;
    ranked.reserve(weights.size());
    for (const auto& [term, weight] : weights) {
        if (weight > 0.0f && std::isfinite(weight)) {
            ranked.emplace_back(term, weight);
        }
    }

    if (maxTerms > 0 && static_cast<int>(ranked.size()) > maxTerms) {
        std::partial_sort(ranked.begin(), ranked.begin() + maxTerms, ranked.end(),
                          [](const auto& a, const auto& b) {
                              if (a.second != b.second) {
                                  return a.second > b.second;
                              }
                              return a.first < b.first;
                          });
        ranked.resize(static_cast<size_t>(maxTerms));
    }

    return SparseVector(ranked.begin(), ranked.end());
}

std::optional<SparseVector> SparseExpansionEncoder::expand(const QString& text)
{
    std::vector<std::optional<SparseVector>> batch = expandBatch({text});
    if (batch.size() != 1) {
        return std::nullopt;
    }
    return std::move(batch.front());
}

std::vector<std::optional<SparseVector>> SparseExpansionEncoder::expandBatch(
    const std::vector<QString>& texts)
{
    if (!m_available || texts.empty()) {
        return {};
    }

    if (m_circuitBreaker.isOpen()) {
        LOG_DEBUG(hrEmbedding, "SparseExpansionEncoder: circuit breaker open, skipping inference");
        return {};
    }

    const BatchTokenizerOutput tokenized = m_tokenizer->tokenizeBatch(texts);
    if (tokenized.batchSize != static_cast<int>(texts.size()) || tokenized.seqLength <= 0) {
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
            inputNames, inputTensors, inputCount, outputNames, 1, m_config.inferenceTimeoutMs);

        if (outputs.empty() || !outputs[0].IsTensor()) {
            LOG_WARN(hrEmbedding, "SparseExpansionEncoder: inference returned no tensor");
            m_circuitBreaker.recordFailure();
            return {};
        }

        const std::vector<int64_t> shape = outputs[0].GetTensorTypeAndShapeInfo().GetShape();
        if (shape.size() != 3 || shape[0] != tokenized.batchSize
            || shape[1] != tokenized.seqLength || shape[2] <= 0) {
            LOG_WARN(hrEmbedding, "SparseExpansionEncoder: expected [batch, seq, vocab] logits");
            m_circuitBreaker.recordFailure();
            return {};
        }

        const float* logits = outputs[0].GetTensorData<float>();
        const int64_t seqLen = shape[1];
        const int64_t vocab = shape[2];

        std::vector<std::optional<SparseVector>> results;
        results.reserve(texts.size());

        std::vector<float> maxWeights(static_cast<size_t>(vocab));
        for (int b = 0; b < tokenized.batchSize; ++b) {
            std::fill(maxWeights.begin(), maxWeights.end(), 0.0f);
            const int64_t* mask = tokenized.attentionMask.data() + static_cast<size_t>(b) * seqLen;

            for (int64_t t = 0; t < seqLen; ++t) {
                if (mask[t] == 0) {
                    continue;
                }
                const float* row = logits + static_cast<size_t>((b * seqLen + t) * vocab);
                for (int64_t v = 0; v < vocab; ++v) {
                    if (row[v] > 0.0f) {
                        const float w = std::log1p(row[v]);
                        if (w > maxWeights[static_cast<size_t>(v)]) {
                            maxWeights[static_cast<size_t>(v)] = w;
                        }
                    }
                }
            }

            SparseVector weights;
            for (int64_t v = 0; v < vocab; ++v) {
                const float w = maxWeights[static_cast<size_t>(v)];
                if (w <= 0.0f || m_tokenizer->isSpecialToken(v)) {
                    continue;
                }
                const QString term = m_tokenizer->tokenForId(v);
                if (term.isEmpty()) {
                    continue;
                }
                float& slot = weights[term];
                slot = std::max(slot, w);
            }
            results.emplace_back(pruneTerms(weights, m_config.maxTerms));
        }

        m_circuitBreaker.recordSuccess();
        return results;
    } catch (const Ort::Exception& ex) {
        LOG_WARN(hrEmbedding, "SparseExpansionEncoder: batch of %zu failed: %s",
                 texts.size(), ex.what());
        m_circuitBreaker.recordFailure();
        return {};
    }
}

} // namespace hr
