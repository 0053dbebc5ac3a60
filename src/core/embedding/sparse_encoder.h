#pragma once

#include "core/embedding/circuit_breaker.h"
#include "core/embedding/encoder.h"

#include <memory>
#include <vector>

namespace hr {

class ModelRegistry;
class ModelSession;
class WordPieceTokenizer;

// Learned term expansion backed by the manifest's "sparse-encoder" model,
// a masked-LM head emitting [batch, seq, vocab] logits.
//
// weight(term) = max over attended tokens of log(1 + relu(logit))
//
// Special tokens are dropped and at most maxTerms positive weights kept.
class SparseExpansionEncoder : public SparseEncoder {
public:
    struct Config {
        int maxTerms = 256;
        int inferenceTimeoutMs = 30000;
    };

    SparseExpansionEncoder(ModelRegistry* registry, const Config& config);
    ~SparseExpansionEncoder() override;

    SparseExpansionEncoder(const SparseExpansionEncoder&) = delete;
    SparseExpansionEncoder& operator=(const SparseExpansionEncoder&) = delete;

    bool initialize();

    bool isAvailable() const override;
    std::optional<SparseVector> expand(const QString& text) override;
    std::vector<std::optional<SparseVector>> expandBatch(
        const std::vector<QString>& texts) override;

    EncoderCircuitBreaker& circuitBreaker() { return m_circuitBreaker; }

    // Keeps the maxTerms highest weights (ties by term), dropping weights <= 0.
    static SparseVector pruneTerms(const SparseVector& weights, int maxTerms);

private:
    ModelRegistry* m_registry = nullptr;
    ModelSession* m_session = nullptr;
    std::unique_ptr<WordPieceTokenizer> m_tokenizer;
    Config m_config;
    bool m_available = false;
    EncoderCircuitBreaker m_circuitBreaker;
};

} // namespace hr
