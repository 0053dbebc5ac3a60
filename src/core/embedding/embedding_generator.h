#pragma once

#include "core/embedding/encoder.h"
#include "core/shared/chunk.h"

#include <optional>
#include <vector>

namespace hr {

struct EmbeddedChunk {
    Chunk chunk;
    std::optional<DenseVector> dense;
    std::optional<SparseVector> sparse;
};

// Best-effort embedding of chunks and queries. Nothing here throws; a
// representation that can't be computed is left absent and logged.
class EmbeddingGenerator {
public:
    // Either encoder may be null, which behaves like an unavailable model.
    EmbeddingGenerator(DenseEncoder* dense, SparseEncoder* sparse);

    // Dense vectors are computed per chunk, sparse expansions with a single
    // batch call. Output order and size match the input.
    std::vector<EmbeddedChunk> embedChunks(const std::vector<Chunk>& chunks) const;

    std::optional<DenseVector> denseForText(const QString& text) const;
    std::optional<DenseVector> denseForQuery(const QString& question) const;

    // Always returns texts.size() entries.
    std::vector<std::optional<SparseVector>> sparseForBatch(const std::vector<QString>& texts) const;
    std::optional<SparseVector> sparseForQuery(const QString& question) const;

    bool denseAvailable() const;
    bool sparseAvailable() const;

    // Re-normalizes to unit length; nullopt for empty, zero-norm or
    // non-finite vectors.
    static std::optional<DenseVector> sanitizeDense(DenseVector vector);

private:
    DenseEncoder* m_dense = nullptr;
    SparseEncoder* m_sparse = nullptr;
};

} // namespace hr
