#include "core/indexing/indexer.h"
#include "core/embedding/embedding_generator.h"
#include "core/index/document_store.h"
#include "core/shared/logging.h"

#include <QDateTime>
#include <QElapsedTimer>

#include <exception>

namespace hr {

// ── Construction ────────────────────────────────────────────

Indexer::Indexer(DocumentStore& store, const EmbeddingGenerator& embeddings)
    : m_store(store)
    , m_embeddings(embeddings)
{
    LOG_INFO(hrIndex, "Indexer initialised");
}

// ── Batch entry point ───────────────────────────────────────

IndexReport Indexer::indexChunks(const std::vector<Chunk>& chunks)
{
    IndexReport report;
    if (chunks.empty()) {
        return report;
    }

    QElapsedTimer timer;
    timer.start();

    // Sparse expansions come from one batch call, paired with their chunks
    // by the generator; dense vectors are computed per chunk.
    std::vector<EmbeddedChunk> batch = m_embeddings.embedChunks(chunks);

    for (EmbeddedChunk& entry : batch) {
        const QString key = compositeKey(entry.chunk);
        try {
            ChunkDocument doc;
            doc.chunk = entry.chunk;
            doc.denseEmbedding = std::move(entry.dense);
            doc.sparseExpansion = std::move(entry.sparse);
            doc.indexedAt = static_cast<double>(QDateTime::currentMSecsSinceEpoch()) / 1000.0;

            const std::optional<UpsertOutcome> outcome = m_store.upsert(doc);
            if (!outcome) {
                ++report.errors;
                LOG_ERROR(hrIndex, "Failed to index chunk %s: store rejected document",
                          qUtf8Printable(key));
                continue;
            }

            ++report.indexed;
            LOG_DEBUG(hrIndex, "%s chunk %s",
                      *outcome == UpsertOutcome::Created ? "Created" : "Updated",
                      qUtf8Printable(key));
        } catch (const std::exception& e) {
            ++report.errors;
            LOG_ERROR(hrIndex, "Failed to index chunk %s: %s", qUtf8Printable(key), e.what());
        }
    }

    LOG_INFO(hrIndex, "Indexed %d/%zu chunks (%d errors) in %lld ms",
             report.indexed, chunks.size(), report.errors,
             static_cast<long long>(timer.elapsed()));
    return report;
}

} // namespace hr
