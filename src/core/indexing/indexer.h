#pragma once

#include "core/shared/chunk.h"

#include <vector>

namespace hr {

class DocumentStore;
class EmbeddingGenerator;

// Aggregate outcome of one indexChunks() batch.
struct IndexReport {
    int indexed = 0;
    int errors = 0;
};

// Indexer: turns chunks into persisted ChunkDocuments.
//
// For each batch it:
//   1. Requests sparse expansions for every chunk in one call
//   2. Computes the dense embedding per chunk
//   3. Upserts the document by (documentId, chunkId)
//
// A chunk that fails is logged and counted in IndexReport::errors; the rest
// of the batch still runs. Missing embeddings are not failures.
class Indexer {
public:
    Indexer(DocumentStore& store, const EmbeddingGenerator& embeddings);

    IndexReport indexChunks(const std::vector<Chunk>& chunks);

private:
    DocumentStore& m_store;
    const EmbeddingGenerator& m_embeddings;
};

} // namespace hr
