#include "core/ingestion/ingestion_pipeline.h"
#include "core/ingestion/chunker.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>

namespace hr {

IngestionPipeline::IngestionPipeline(const Chunker& chunker, Indexer& indexer)
    : m_chunker(chunker)
    , m_indexer(indexer)
{
}

IngestReport IngestionPipeline::ingestDocuments(const std::vector<ParsedDocument>& documents)
{
    QElapsedTimer timer;
    timer.start();

    IngestReport report;
    for (const ParsedDocument& doc : documents) {
        if (!doc.extractionSuccess) {
            LOG_WARN(hrIngest, "Skipping %s: extraction failed", qUtf8Printable(doc.filename));
            continue;
        }
        if (doc.documentId.isEmpty()) {
            LOG_WARN(hrIngest, "Skipping %s: missing document id", qUtf8Printable(doc.filename));
            continue;
        }

        const std::vector<Chunk> chunks =
            m_chunker.chunkDocument(doc.documentId, doc.text, doc.filename, doc.sourceUrl);
        ++report.documentsProcessed;
        if (chunks.empty()) {
            LOG_INFO(hrIngest, "No content to index in %s", qUtf8Printable(doc.filename));
            continue;
        }

        report.chunksCreated += static_cast<int>(chunks.size());
        const IndexReport indexed = m_indexer.indexChunks(chunks);
        report.indexed += indexed.indexed;
        report.errors += indexed.errors;

        LOG_DEBUG(hrIngest, "%s: %zu chunks, %d indexed, %d errors",
                  qUtf8Printable(doc.documentId), chunks.size(), indexed.indexed, indexed.errors);
    }

    LOG_INFO(hrIngest, "Ingested %d documents: %d chunks, %d indexed, %d errors (%lld ms)",
             report.documentsProcessed, report.chunksCreated, report.indexed, report.errors,
             static_cast<long long>(timer.elapsed()));
    return report;
}

IngestReport IngestionPipeline::ingestSampleText(const QString& text, const QString& filename)
{
    ParsedDocument doc;
    doc.documentId = QString::fromLatin1(kSampleDocumentId);
    doc.filename = filename;
    doc.text = text;
    doc.charCount = static_cast<int>(text.size());
    doc.extractionSuccess = true;
    return ingestDocuments({doc});
}

} // namespace hr
