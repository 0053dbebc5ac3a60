#include "core/retrieval/result_cache.h"
#include "core/shared/logging.h"

namespace hr {

CachedRetriever::CachedRetriever(Retriever& inner, ResultCacheConfig config)
    : m_inner(inner)
    , m_config(config)
{
}

RetrievalResponse CachedRetriever::retrieve(const RetrievalRequest& request)
{
    const Key key{request.question, request.mode, request.topK};

    if (std::optional<RetrievalResponse> cached = lookup(key)) {
        LOG_DEBUG(hrRetrieval, "Cache hit: mode=%s topK=%d",
                  qUtf8Printable(searchModeToString(request.mode)), request.topK);
        return *cached;
    }

    // Retrieval runs outside the lock.
    RetrievalResponse response = m_inner.retrieve(request);
    // A degraded answer (some signal failed or timed out) is not cached.
    if (response.ok() && response.failedSignals.empty()) {
        store(key, response);
    }
    return response;
}

std::optional<RetrievalResponse> CachedRetriever::lookup(const Key& key)
{
    std::lock_guard<std::mutex> lock(m_mutex);

    auto it = m_index.find(key);
    if (it == m_index.end()) {
        ++m_misses;
        return std::nullopt;
    }

    if (m_config.ttlSeconds > 0) {
        const auto age = std::chrono::steady_clock::now() - it->second->insertedAt;
        if (age >= std::chrono::seconds(m_config.ttlSeconds)) {
            m_list.erase(it->second);
            m_index.erase(it);
            ++m_evictions;
            ++m_misses;
            return std::nullopt;
        }
    }

    // Move to front (most recently used)
    if (it->second != m_list.begin()) {
        m_list.splice(m_list.begin(), m_list, it->second);
    }

    ++m_hits;
    return it->second->value;
}

void CachedRetriever::store(const Key& key, const RetrievalResponse& response)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_config.maxEntries <= 0) {
        return;
    }

    auto existing = m_index.find(key);
    if (existing != m_index.end()) {
        m_list.erase(existing->second);
        m_index.erase(existing);
    }

    while (static_cast<int>(m_list.size()) >= m_config.maxEntries && !m_list.empty()) {
        m_index.erase(m_list.back().key);
        m_list.pop_back();
        ++m_evictions;
    }

    m_list.push_front({key, response, std::chrono::steady_clock::now()});
    m_index[key] = m_list.begin();
}

void CachedRetriever::clear()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_list.clear();
    m_index.clear();
    LOG_INFO(hrRetrieval, "Result cache cleared");
}

CachedRetriever::Stats CachedRetriever::stats() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return {m_hits, m_misses, m_evictions, static_cast<int>(m_list.size()), m_config.ttlSeconds};
}

} // namespace hr
