#pragma once

#include "core/retrieval/search_mode.h"

#include <QString>

#include <vector>

namespace hr {

struct RetrievalRequest {
    QString question;
    int topK = 5;
    SearchMode mode = SearchMode::FullHybrid;
};

// One ranked result, carrying everything answer generation and citation
// display need.
struct RetrievedChunk {
    QString documentId;
    int chunkId = 0;
    QString filename;
    QString sourceUrl;
    QString content;
    double score = 0.0;                     // native score, or fused RRF score
    std::vector<RetrievalSignal> signals;   // signals that returned this chunk
    int bestRank = 0;                       // best 1-based rank across signals
};

struct RetrievalResponse {
    enum class Status {
        Ok,               // results may be empty
        InvalidRequest,   // rejected before any retrieval
        Failed,           // every signal of the mode failed
    };

    Status status = Status::Ok;
    QString errorMessage;
    std::vector<RetrievedChunk> results;
    std::vector<RetrievalSignal> failedSignals;

    bool ok() const { return status == Status::Ok; }
};

class Retriever {
public:
    virtual ~Retriever() = default;

    virtual RetrievalResponse retrieve(const RetrievalRequest& request) = 0;
};

} // namespace hr
