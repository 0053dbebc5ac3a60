#include "core/ingestion/chunker.h"
#include "core/ingestion/text_cleaner.h"
#include "core/shared/logging.h"

#include <algorithm>

namespace hr {

namespace {

bool isSpace(const QString& text, int i)
{
    return i >= 0 && i < text.size() && text.at(i).isSpace();
}

// True when text[i-1] is one of `marks` and text[i] is a space.
bool endsWithMarkAndSpace(const QString& text, int i, const char* marks)
{
    if (i < 1 || i >= text.size() || text.at(i) != QLatin1Char(' ')) {
        return false;
    }
    const QChar prev = text.at(i - 1);
    for (const char* m = marks; *m; ++m) {
        if (prev == QLatin1Char(*m)) {
            return true;
        }
    }
    return false;
}

} // anonymous namespace

// ── Construction ────────────────────────────────────────────

Chunker::Chunker(const Config& config)
    : m_config(config)
{
    m_config.chunkSize = std::max(1, m_config.chunkSize);
    m_config.chunkOverlap = std::clamp(m_config.chunkOverlap, 0, m_config.chunkSize - 1);
    m_config.minChunkSize = std::clamp(m_config.minChunkSize, 0, m_config.chunkSize);
}

// ── Public API ──────────────────────────────────────────────

std::vector<Chunk> Chunker::chunkDocument(const QString& documentId,
                                          const QString& text,
                                          const QString& filename,
                                          const QString& sourceUrl) const
{
    std::vector<Chunk> chunks;

    const QString cleaned = TextCleaner::clean(text);
    if (cleaned.isEmpty()) {
        return chunks;
    }

    const int len = static_cast<int>(cleaned.size());
    int pos = 0;

    while (pos < len) {
        const int remaining = len - pos;

        int chunkEnd = len;
        // A tail shorter than minChunkSize is absorbed into the current chunk.
        if (remaining > m_config.chunkSize + m_config.minChunkSize) {
            chunkEnd = findSplitPoint(cleaned, pos, pos + m_config.chunkSize);
        } else if (remaining > m_config.chunkSize) {
            const int split = findSplitPoint(cleaned, pos, pos + m_config.chunkSize);
            if (len - split >= m_config.minChunkSize) {
                chunkEnd = split;
            }
        }

        const QString body = cleaned.mid(pos, chunkEnd - pos).trimmed();
        if (!body.isEmpty()) {
            Chunk c;
            c.documentId = documentId;
            c.chunkId = static_cast<int>(chunks.size());
            c.filename = filename;
            c.sourceUrl = sourceUrl;
            c.text = body;
            c.charCount = static_cast<int>(body.size());
            c.tokenCount = estimateTokenCount(c.charCount);
            chunks.push_back(std::move(c));
        }

        if (chunkEnd >= len) {
            break;
        }
        pos = nextChunkStart(cleaned, pos, chunkEnd);
    }

    LOG_DEBUG(hrIngest, "Chunked %s: %d chunks from %d chars",
              qUtf8Printable(documentId),
              static_cast<int>(chunks.size()),
              len);

    return chunks;
}

// ── Private helpers ─────────────────────────────────────────

int Chunker::findSplitPoint(const QString& text, int chunkStart, int targetEnd) const
{
    int searchFloor = chunkStart + m_config.minChunkSize;
    if (searchFloor >= targetEnd) {
        searchFloor = chunkStart;
    }

    // 1. Paragraph boundary
    for (int i = targetEnd; i > searchFloor; --i) {
        if (i >= 2 && text.at(i - 1) == QLatin1Char('\n') && text.at(i - 2) == QLatin1Char('\n')) {
            return i;
        }
    }

    // 2. Line break
    for (int i = targetEnd; i > searchFloor; --i) {
        if (text.at(i - 1) == QLatin1Char('\n')) {
            return i;
        }
    }

    // 3. Sentence end, split after the space
    for (int i = targetEnd - 1; i > searchFloor; --i) {
        if (endsWithMarkAndSpace(text, i, ".!?")) {
            return i + 1;
        }
    }

    // 4. Clause
    for (int i = targetEnd - 1; i > searchFloor; --i) {
        if (endsWithMarkAndSpace(text, i, ";,")) {
            return i + 1;
        }
    }

    // 5. Word boundary
    for (int i = targetEnd; i > searchFloor; --i) {
        if (text.at(i - 1) == QLatin1Char(' ')) {
            return i;
        }
    }

    // 6. Forced, never between the halves of a surrogate pair
    if (targetEnd - 1 > chunkStart && text.at(targetEnd - 1).isHighSurrogate()) {
        return targetEnd - 1;
    }
    return targetEnd;
}

int Chunker::nextChunkStart(const QString& text, int chunkStart, int chunkEnd) const
{
    if (m_config.chunkOverlap <= 0) {
        return chunkEnd;
    }

    int start = std::max(chunkStart + 1, chunkEnd - m_config.chunkOverlap);
    if (start >= chunkEnd) {
        return chunkEnd;
    }

    // Don't begin mid-word when a boundary exists inside the window.
    if (!isSpace(text, start - 1)) {
        int i = start;
        while (i < chunkEnd && !isSpace(text, i)) {
            ++i;
        }
        if (i < chunkEnd) {
            start = i + 1;
        }
    }
    start = std::min(start, chunkEnd);
    if (start < chunkEnd && text.at(start).isLowSurrogate()) {
        start = start - 1 > chunkStart ? start - 1 : start + 1;
    }
    return start;
}

} // namespace hr
