#pragma once

#include "core/indexing/indexer.h"

#include <QString>

#include <vector>

namespace hr {

class Chunker;

// A document as handed over by the extraction collaborator.
struct ParsedDocument {
    QString documentId;
    QString filename;
    QString sourceUrl;
    QString text;
    int charCount = 0;
    bool extractionSuccess = false;
};

struct IngestReport {
    int documentsProcessed = 0;
    int chunksCreated = 0;
    int indexed = 0;
    int errors = 0;
};

// Parsed documents -> chunks -> Indexer. Documents whose extraction failed
// (or that produced no text) are skipped, not counted as errors.
class IngestionPipeline {
public:
    static constexpr const char* kSampleDocumentId = "sample_id";

    IngestionPipeline(const Chunker& chunker, Indexer& indexer);

    IngestReport ingestDocuments(const std::vector<ParsedDocument>& documents);

    // Indexes raw text as a single document with id kSampleDocumentId.
    IngestReport ingestSampleText(const QString& text,
                                  const QString& filename = QStringLiteral("sample.txt"));

private:
    const Chunker& m_chunker;
    Indexer& m_indexer;
};

} // namespace hr
