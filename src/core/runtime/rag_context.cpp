#include "core/runtime/rag_context.h"
#include "core/embedding/embedding_manager.h"
#include "core/embedding/sparse_encoder.h"
#include "core/index/sqlite_document_store.h"
#include "core/models/model_registry.h"
#include "core/shared/logging.h"

#include <QDir>
#include <QFileInfo>

namespace hr {

namespace {

ChunkerConfig chunkerConfig(const Settings& settings)
{
    ChunkerConfig config;
    config.chunkSize = settings.chunkSize;
    config.chunkOverlap = settings.chunkOverlap;
    config.minChunkSize = settings.minChunkSize;
    return config;
}

ResultCacheConfig cacheConfig(const Settings& settings)
{
    ResultCacheConfig config;
    config.maxEntries = settings.cacheMaxEntries;
    config.ttlSeconds = settings.cacheTtlSeconds;
    return config;
}

} // namespace

std::unique_ptr<RagContext> RagContext::create(const Settings& settings)
{
    const QString dbDir = QFileInfo(settings.dbPath).absolutePath();
    if (!QDir().mkpath(dbDir)) {
        LOG_ERROR(hrCore, "Cannot create database directory %s", qUtf8Printable(dbDir));
        return nullptr;
    }

    std::unique_ptr<DocumentStore> store = SQLiteDocumentStore::open(settings.dbPath);
    if (!store) {
        return nullptr;
    }

    auto registry = std::make_unique<ModelRegistry>(settings.modelsDir);

    auto dense = std::make_unique<EmbeddingManager>(registry.get(), settings.inferenceTimeoutMs);
    if (!dense->initialize()) {
        LOG_WARN(hrCore, "Dense encoder unavailable; dense fields will be absent");
    }

    SparseExpansionEncoder::Config sparseConfig;
    sparseConfig.maxTerms = settings.sparseMaxTerms;
    sparseConfig.inferenceTimeoutMs = settings.inferenceTimeoutMs;
    auto sparse = std::make_unique<SparseExpansionEncoder>(registry.get(), sparseConfig);
    if (!sparse->initialize()) {
        LOG_WARN(hrCore, "Sparse encoder unavailable; sparse fields will be absent");
    }

    auto context = std::make_unique<RagContext>(settings, std::move(store), std::move(dense),
                                                std::move(sparse), std::move(registry));
    if (!context->initialize()) {
        return nullptr;
    }
    return context;
}

RagContext::RagContext(const Settings& settings,
                       std::unique_ptr<DocumentStore> store,
                       std::unique_ptr<DenseEncoder> dense,
                       std::unique_ptr<SparseEncoder> sparse,
                       std::unique_ptr<ModelRegistry> registry)
    : m_settings(settings)
    , m_registry(std::move(registry))
    , m_store(std::move(store))
    , m_dense(std::move(dense))
    , m_sparse(std::move(sparse))
    , m_embeddings(m_dense.get(), m_sparse.get())
    , m_chunker(chunkerConfig(settings))
    , m_indexer(*m_store, m_embeddings)
    , m_ingestion(m_chunker, m_indexer)
    , m_retriever(*m_store, m_embeddings, RetrieverConfig::fromSettings(settings))
    , m_cache(m_retriever, cacheConfig(settings))
{
}

RagContext::~RagContext() = default;

bool RagContext::initialize()
{
    if (!m_store->ensureIndex()) {
        LOG_ERROR(hrCore, "Failed to create the chunk index");
        return false;
    }
    LOG_INFO(hrCore, "Context ready: %lld chunks, dense=%s sparse=%s",
             static_cast<long long>(m_store->count()),
             m_embeddings.denseAvailable() ? "yes" : "no",
             m_embeddings.sparseAvailable() ? "yes" : "no");
    return true;
}

} // namespace hr
