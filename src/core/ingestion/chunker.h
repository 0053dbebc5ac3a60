#pragma once

#include "core/shared/chunk.h"

#include <QString>
#include <vector>

namespace hr {

// Sizes are in characters.
struct ChunkerConfig {
    int chunkSize = 1200;
    int chunkOverlap = 200;
    int minChunkSize = 200;
};

// Chunker: splits cleaned document text into overlapping chunks.
//
// Split priority when a chunk has to end before the text does:
//   1. Paragraph boundary (\n\n)
//   2. Line break
//   3. Sentence end (". ", "! ", "? ")
//   4. Clause ("; ", ", ")
//   5. Word boundary (space)
//   6. Forced split at chunkSize
//
// The next chunk starts up to chunkOverlap characters before the previous
// end, moved forward to the first word boundary inside that window.
class Chunker {
public:
    using Config = ChunkerConfig;

    explicit Chunker(const Config& config = {});

    // Chunk ids run 0..n-1. Whitespace-only text yields no chunks.
    std::vector<Chunk> chunkDocument(const QString& documentId,
                                     const QString& text,
                                     const QString& filename = {},
                                     const QString& sourceUrl = {}) const;

    const Config& config() const { return m_config; }

private:
    // Returns the index one past the last character of the chunk that
    // starts at chunkStart and must end at or before targetEnd.
    int findSplitPoint(const QString& text, int chunkStart, int targetEnd) const;

    // Start of the chunk following one that spanned [chunkStart, chunkEnd).
    int nextChunkStart(const QString& text, int chunkStart, int chunkEnd) const;

    Config m_config;
};

} // namespace hr
