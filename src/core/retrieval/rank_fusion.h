#pragma once

#include "core/index/document_store.h"
#include "core/retrieval/retriever.h"

#include <vector>

namespace hr {

// One signal's hits, best first.
struct RankedList {
    RetrievalSignal signal = RetrievalSignal::Lexical;
    std::vector<StoreHit> hits;
};

struct FusionConfig {
    int rrfK = 60;
    int maxResults = 20;
};

class RankFusion {
public:
    // Reciprocal-rank fusion: score = sum over lists of 1 / (rank + K),
    // rank 1-based. Ties break by best single-list rank, then composite key.
    // A chunk repeated within one list counts at its first rank only.
    static std::vector<RetrievedChunk> fuse(const std::vector<RankedList>& lists,
                                            FusionConfig config = {});

    // Single-signal passthrough keeping the store's native score and order.
    static std::vector<RetrievedChunk> passthrough(const RankedList& list, int maxResults);

    static double rrfContribution(int rank, int rrfK);
};

} // namespace hr
