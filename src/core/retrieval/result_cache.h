#pragma once

#include "core/retrieval/retriever.h"

#include <QHash>
#include <QString>

#include <chrono>
#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <tuple>
#include <unordered_map>

namespace hr {

struct ResultCacheConfig {
    int maxEntries = 256;
    int ttlSeconds = 300;    // <= 0: entries never expire, only clear() removes them
};

// CachedRetriever: memoizes another Retriever by the exact
// (question, mode, topK) triple. No normalization: "Foo" and "foo" are
// separate entries. Only Ok responses are stored.
class CachedRetriever : public Retriever {
public:
    explicit CachedRetriever(Retriever& inner, ResultCacheConfig config = {});

    RetrievalResponse retrieve(const RetrievalRequest& request) override;

    void clear();

    struct Stats {
        uint64_t hits = 0;
        uint64_t misses = 0;
        uint64_t evictions = 0;
        int currentSize = 0;
        int ttlSeconds = 0;
    };
    Stats stats() const;

private:
    struct Key {
        QString question;
        SearchMode mode = SearchMode::FullHybrid;
        int topK = 0;

        bool operator==(const Key& other) const
        {
            return std::tie(question, mode, topK)
                == std::tie(other.question, other.mode, other.topK);
        }
    };

    struct KeyHash {
        size_t operator()(const Key& key) const
        {
            return qHashMulti(0, key.question, static_cast<int>(key.mode), key.topK);
        }
    };

    struct Entry {
        Key key;
        RetrievalResponse value;
        std::chrono::steady_clock::time_point insertedAt;
    };

    // Returns cached value or nullopt. Lazily evicts an expired entry.
    std::optional<RetrievalResponse> lookup(const Key& key);
    void store(const Key& key, const RetrievalResponse& response);

    Retriever& m_inner;
    ResultCacheConfig m_config;
    mutable std::mutex m_mutex;
    std::list<Entry> m_list;  // front = most recently used
    std::unordered_map<Key, std::list<Entry>::iterator, KeyHash> m_index;

    uint64_t m_hits = 0;
    uint64_t m_misses = 0;
    uint64_t m_evictions = 0;
};

} // namespace hr
