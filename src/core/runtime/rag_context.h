#pragma once

#include "core/embedding/embedding_generator.h"
#include "core/index/document_store.h"
#include "core/indexing/indexer.h"
#include "core/ingestion/chunker.h"
#include "core/ingestion/ingestion_pipeline.h"
#include "core/retrieval/hybrid_retriever.h"
#include "core/retrieval/result_cache.h"
#include "core/shared/settings.h"

#include <memory>

namespace hr {

class ModelRegistry;

// RagContext: owns every component of one process, wired once at start.
// Components receive collaborators by reference; nothing is global.
class RagContext {
public:
    // Production wiring: SQLite store at settings.dbPath, ONNX encoders from
    // settings.modelsDir. Encoders that fail to load stay unavailable.
    // Returns nullptr when the store cannot be opened or its index created.
    static std::unique_ptr<RagContext> create(const Settings& settings);

    // Any encoder may be null.
    RagContext(const Settings& settings,
               std::unique_ptr<DocumentStore> store,
               std::unique_ptr<DenseEncoder> dense,
               std::unique_ptr<SparseEncoder> sparse,
               std::unique_ptr<ModelRegistry> registry = nullptr);
    ~RagContext();

    RagContext(const RagContext&) = delete;
    RagContext& operator=(const RagContext&) = delete;

    // Creates the index if it does not exist yet.
    bool initialize();

    const Settings& settings() const { return m_settings; }
    DocumentStore& store() { return *m_store; }
    const EmbeddingGenerator& embeddings() const { return m_embeddings; }
    const Chunker& chunker() const { return m_chunker; }
    Indexer& indexer() { return m_indexer; }
    IngestionPipeline& ingestion() { return m_ingestion; }
    HybridRetriever& retriever() { return m_retriever; }
    CachedRetriever& cachedRetriever() { return m_cache; }

private:
    Settings m_settings;
    std::unique_ptr<ModelRegistry> m_registry;
    std::unique_ptr<DocumentStore> m_store;
    std::unique_ptr<DenseEncoder> m_dense;
    std::unique_ptr<SparseEncoder> m_sparse;

    EmbeddingGenerator m_embeddings;
    Chunker m_chunker;
    Indexer m_indexer;
    IngestionPipeline m_ingestion;
    HybridRetriever m_retriever;
    CachedRetriever m_cache;
};

} // namespace hr
