#include "core/embedding/embedding_generator.h"
#include "core/shared/logging.h"

#include <cmath>
#include <exception>

namespace hr {

EmbeddingGenerator::EmbeddingGenerator(DenseEncoder* dense, SparseEncoder* sparse)
    : m_dense(dense)
    , m_sparse(sparse)
{
}

bool EmbeddingGenerator::denseAvailable() const
{
    return m_dense && m_dense->isAvailable();
}

bool EmbeddingGenerator::sparseAvailable() const
{
    return m_sparse && m_sparse->isAvailable();
}

std::optional<DenseVector> EmbeddingGenerator::sanitizeDense(DenseVector vector)
{
    if (vector.empty()) {
        return std::nullopt;
    }

    double sumSquares = 0.0;
    for (const float v : vector) {
        if (!std::isfinite(v)) {
            return std::nullopt;
        }
        sumSquares += static_cast<double>(v) * static_cast<double>(v);
    }

    const double norm = std::sqrt(sumSquares);
    if (norm <= 0.0 || !std::isfinite(norm)) {
        return std::nullopt;
    }

    for (float& v : vector) {
        v = static_cast<float>(static_cast<double>(v) / norm);
    }
    return vector;
}

std::optional<DenseVector> EmbeddingGenerator::denseForText(const QString& text) const
{
    if (!denseAvailable()) {
        return std::nullopt;
    }
    std::optional<DenseVector> raw;
    try {
        raw = m_dense->embed(text);
    } catch (const std::exception& e) {
        LOG_WARN(hrEmbedding, "Dense encoder threw: %s", e.what());
        return std::nullopt;
    }
    if (!raw) {
        return std::nullopt;
    }
    std::optional<DenseVector> clean = sanitizeDense(std::move(*raw));
    if (!clean) {
        LOG_WARN(hrEmbedding, "Dropping degenerate dense vector (zero norm or non-finite)");
    }
    return clean;
}

std::optional<DenseVector> EmbeddingGenerator::denseForQuery(const QString& question) const
{
    if (!denseAvailable()) {
        return std::nullopt;
    }
    std::optional<DenseVector> raw = m_dense->embedQuery(question);
    if (!raw) {
        return std::nullopt;
    }
    return sanitizeDense(std::move(*raw));
}

std::vector<std::optional<SparseVector>> EmbeddingGenerator::sparseForBatch(
    const std::vector<QString>& texts) const
{
    std::vector<std::optional<SparseVector>> absent(texts.size());
    if (texts.empty() || !sparseAvailable()) {
        return absent;
    }

    std::vector<std::optional<SparseVector>> results;
    try {
        results = m_sparse->expandBatch(texts);
    } catch (const std::exception& e) {
        LOG_WARN(hrEmbedding, "Sparse batch threw: %s", e.what());
        return absent;
    }
    if (results.size() != texts.size()) {
        LOG_WARN(hrEmbedding,
                 "Sparse batch returned %zu result(s) for %zu text(s); "
                 "leaving sparse expansions absent for the whole batch",
                 results.size(), texts.size());
        return absent;
    }
    return results;
}

std::optional<SparseVector> EmbeddingGenerator::sparseForQuery(const QString& question) const
{
    if (!sparseAvailable()) {
        return std::nullopt;
    }
    return m_sparse->expand(question);
}

std::vector<EmbeddedChunk> EmbeddingGenerator::embedChunks(const std::vector<Chunk>& chunks) const
{
    std::vector<EmbeddedChunk> out;
    if (chunks.empty()) {
        return out;
    }

    std::vector<QString> texts;
    texts.reserve(chunks.size());
    for (const Chunk& chunk : chunks) {
        texts.push_back(chunk.text);
    }
    std::vector<std::optional<SparseVector>> sparse = sparseForBatch(texts);

    out.reserve(chunks.size());
    for (size_t i = 0; i < chunks.size(); ++i) {
        EmbeddedChunk embedded;
        embedded.chunk = chunks[i];
        embedded.dense = denseForText(chunks[i].text);
        embedded.sparse = std::move(sparse[i]);
        out.push_back(std::move(embedded));
    }
    return out;
}

} // namespace hr
