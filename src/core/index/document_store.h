#pragma once

#include "core/embedding/encoder.h"
#include "core/shared/chunk.h"

#include <QString>

#include <cstdint>
#include <optional>
#include <vector>

namespace hr {

// What the store persists for one chunk.
struct ChunkDocument {
    Chunk chunk;
    std::optional<DenseVector> denseEmbedding;
    std::optional<SparseVector> sparseExpansion;
    double indexedAt = 0.0;     // epoch seconds
};

enum class UpsertOutcome {
    Created,
    Updated,
};

// One ranked hit from a single retrieval signal. score is the signal's
// native score (higher is better).
struct StoreHit {
    Chunk chunk;
    double score = 0.0;
};

struct StoreHealth {
    bool indexExists = false;
    int64_t chunkCount = 0;
    int64_t denseCount = 0;
    int64_t sparseCount = 0;
    int denseDimensions = 0;
    double lastIndexedAt = 0.0;
};

// Document store seam. Implementations never throw across this interface:
// search methods return std::nullopt on query failure and an empty vector
// when nothing matches.
class DocumentStore {
public:
    virtual ~DocumentStore() = default;

    // Idempotent: an existing index is left untouched.
    virtual bool ensureIndex() = 0;
    virtual bool indexExists() = 0;
    virtual bool deleteIndex() = 0;

    // Keyed by (documentId, chunkId). Replaces text, metadata and both
    // vector fields, including clearing a field that is now absent.
    virtual std::optional<UpsertOutcome> upsert(const ChunkDocument& doc) = 0;
    virtual std::optional<ChunkDocument> get(const QString& documentId, int chunkId) = 0;
    virtual int64_t count() = 0;

    virtual std::optional<std::vector<StoreHit>> searchLexical(const QString& text, int limit) = 0;
    virtual std::optional<std::vector<StoreHit>> searchDense(const DenseVector& vector, int limit) = 0;
    virtual std::optional<std::vector<StoreHit>> searchSparse(const SparseVector& vector, int limit) = 0;

    virtual StoreHealth health() = 0;
};

} // namespace hr
