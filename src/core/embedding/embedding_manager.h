#pragma once

#include "core/embedding/circuit_breaker.h"
#include "core/embedding/encoder.h"

#include <QString>

#include <memory>
#include <vector>

namespace hr {

class ModelRegistry;
class ModelSession;
class WordPieceTokenizer;

// Dense encoder backed by the manifest's "dense-encoder" ONNX model.
// Accepts [batch, dim] pooled outputs or [batch, seq, dim] hidden states
// (pooled by CLS or attention-masked mean per the manifest).
class EmbeddingManager : public DenseEncoder {
public:
    explicit EmbeddingManager(ModelRegistry* registry, int inferenceTimeoutMs = 30000);
    ~EmbeddingManager() override;

    EmbeddingManager(const EmbeddingManager&) = delete;
    EmbeddingManager& operator=(const EmbeddingManager&) = delete;
    EmbeddingManager(EmbeddingManager&&) = delete;
    EmbeddingManager& operator=(EmbeddingManager&&) = delete;

    bool initialize();

    bool isAvailable() const override;
    int dimensions() const override;

    std::optional<DenseVector> embed(const QString& text) override;
    std::optional<DenseVector> embedQuery(const QString& text) override;

    // Empty on failure; otherwise exactly one vector per text.
    std::vector<DenseVector> embedBatch(const std::vector<QString>& texts);

    EncoderCircuitBreaker& circuitBreaker() { return m_circuitBreaker; }

    static DenseVector normalizeEmbedding(DenseVector embedding);

private:
    ModelRegistry* m_registry = nullptr;
    ModelSession* m_session = nullptr;
    std::unique_ptr<WordPieceTokenizer> m_tokenizer;
    int m_embeddingSize = 0;
    int m_inferenceTimeoutMs = 30000;
    bool m_meanPooling = false;
    QString m_queryPrefix;
    bool m_available = false;
    EncoderCircuitBreaker m_circuitBreaker;
};

} // namespace hr
