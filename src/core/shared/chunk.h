#pragma once

#include <QString>

namespace hr {

// The atomic retrievable unit. (documentId, chunkId) is unique across
// the store; text is never modified after the chunker emits it.
struct Chunk {
    QString documentId;
    int chunkId = 0;
    QString filename;
    QString sourceUrl;
    QString text;
    int tokenCount = 0;
    int charCount = 0;
};

// "<documentId>_<chunkId>", used for log lines and tie-breaking.
QString compositeKey(const QString& documentId, int chunkId);
QString compositeKey(const Chunk& chunk);

// Rough token estimate used when no tokenizer is involved (4 chars/token).
int estimateTokenCount(int charCount);

} // namespace hr
