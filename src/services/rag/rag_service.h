#pragma once

#include "core/ipc/service_base.h"
#include "core/retrieval/retriever.h"

#include <QJsonArray>

#include <cstdint>

namespace hr {

class RagContext;

// RagService: the query and ingestion boundary over local-socket IPC.
//
// Methods: query, ingest, health, cache_stats, clear_cache (plus ping and
// shutdown from ServiceBase). Invalid input is rejected with
// InvalidParams before any retrieval runs.
class RagService : public ServiceBase {
    Q_OBJECT
public:
    explicit RagService(RagContext& context, QObject* parent = nullptr);
    ~RagService() override;

    QJsonObject handleRequest(const QJsonObject& request) override;

    static QJsonObject resultToJson(const RetrievedChunk& chunk);

private:
    QJsonObject handleQuery(uint64_t id, const QJsonObject& params);
    QJsonObject handleIngest(uint64_t id, const QJsonObject& params);
    QJsonObject handleHealth(uint64_t id);
    QJsonObject handleCacheStats(uint64_t id);
    QJsonObject handleClearCache(uint64_t id);

    QJsonObject cacheStatsJson() const;

    RagContext& m_context;
};

} // namespace hr
