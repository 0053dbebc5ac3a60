#pragma once

#include <QString>

namespace hr {

struct Settings {
    // Storage
    QString dbPath;
    QString modelsDir;

    // Chunking (characters)
    int chunkSize = 1200;
    int chunkOverlap = 200;
    int minChunkSize = 200;

    // Retrieval
    int rrfK = 60;
    int minCandidatesPerSignal = 20;
    int maxTopK = 20;
    int minQuestionChars = 3;
    int maxQuestionChars = 1000;
    int signalTimeoutMs = 10000;

    // Result cache
    int cacheMaxEntries = 256;
    int cacheTtlSeconds = 300;     // <= 0 disables expiry

    // Embedding
    int sparseMaxTerms = 256;
    int inferenceTimeoutMs = 30000;
};

} // namespace hr
