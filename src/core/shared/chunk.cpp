#include "core/shared/chunk.h"

namespace hr {

QString compositeKey(const QString& documentId, int chunkId)
{
    return documentId + QLatin1Char('_') + QString::number(chunkId);
}

QString compositeKey(const Chunk& chunk)
{
    return compositeKey(chunk.documentId, chunk.chunkId);
}

int estimateTokenCount(int charCount)
{
    return charCount > 0 ? charCount / 4 : 0;
}

} // namespace hr
