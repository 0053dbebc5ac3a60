#include "core/retrieval/rank_fusion.h"

#include <QHash>

#include <algorithm>

namespace hr {

namespace {

RetrievedChunk fromHit(const StoreHit& hit)
{
    RetrievedChunk result;
    result.documentId = hit.chunk.documentId;
    result.chunkId = hit.chunk.chunkId;
    result.filename = hit.chunk.filename;
    result.sourceUrl = hit.chunk.sourceUrl;
    result.content = hit.chunk.text;
    return result;
}

struct FusedEntry {
    RetrievedChunk chunk;
    QString key;
};

} // namespace

double RankFusion::rrfContribution(int rank, int rrfK)
{
    if (rank <= 0) {
        return 0.0;
    }
    const int denom = std::max(1, rrfK) + rank;
    return 1.0 / static_cast<double>(denom);
}

std::vector<RetrievedChunk> RankFusion::passthrough(const RankedList& list, int maxResults)
{
    std::vector<RetrievedChunk> results;
    const size_t limit = static_cast<size_t>(std::max(maxResults, 0));
    results.reserve(std::min(limit, list.hits.size()));

    for (size_t i = 0; i < list.hits.size() && results.size() < limit; ++i) {
        RetrievedChunk result = fromHit(list.hits[i]);
        result.score = list.hits[i].score;
        result.signals = {list.signal};
        result.bestRank = static_cast<int>(i) + 1;
        results.push_back(std::move(result));
    }
    return results;
}

std::vector<RetrievedChunk> RankFusion::fuse(const std::vector<RankedList>& lists,
                                             FusionConfig config)
{
    QHash<QString, size_t> indexByKey;
    std::vector<FusedEntry> entries;

    for (const RankedList& list : lists) {
        QHash<QString, bool> seenInList;
        for (size_t i = 0; i < list.hits.size(); ++i) {
            const StoreHit& hit = list.hits[i];
            const QString key = compositeKey(hit.chunk);
            if (seenInList.contains(key)) {
                continue;
            }
            seenInList.insert(key, true);

            const int rank = static_cast<int>(i) + 1;
            auto it = indexByKey.find(key);
            if (it == indexByKey.end()) {
                FusedEntry entry{fromHit(hit), key};
                entry.chunk.bestRank = rank;
                indexByKey.insert(key, entries.size());
                entries.push_back(std::move(entry));
                it = indexByKey.find(key);
            }

            RetrievedChunk& fused = entries[it.value()].chunk;
            fused.score += rrfContribution(rank, config.rrfK);
            fused.bestRank = std::min(fused.bestRank, rank);
            fused.signals.push_back(list.signal);
        }
    }

    std::sort(entries.begin(), entries.end(),
              [](const FusedEntry& lhs, const FusedEntry& rhs) {
                  if (lhs.chunk.score != rhs.chunk.score) {
                      return lhs.chunk.score > rhs.chunk.score;
                  }
                  if (lhs.chunk.bestRank != rhs.chunk.bestRank) {
                      return lhs.chunk.bestRank < rhs.chunk.bestRank;
                  }
                  return lhs.key < rhs.key;
              });

    const size_t limit = static_cast<size_t>(std::max(config.maxResults, 0));
    std::vector<RetrievedChunk> results;
    results.reserve(std::min(limit, entries.size()));
    for (size_t i = 0; i < entries.size() && i < limit; ++i) {
        results.push_back(std::move(entries[i].chunk));
    }
    return results;
}

} // namespace hr
