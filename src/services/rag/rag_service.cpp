#include "rag_service.h"
#include "core/ipc/message.h"
#include "core/runtime/rag_context.h"
#include "core/shared/logging.h"

#include <QElapsedTimer>
#include <QJsonValue>

#include <cmath>

namespace hr {

namespace {

constexpr int kDefaultTopK = 5;

const char* const kDefaultSampleText =
    "This is a sample document for testing the RAG system. It contains some text "
    "that will be chunked and indexed.";

QJsonArray signalsToJson(const std::vector<RetrievalSignal>& signals)
{
    QJsonArray array;
    for (RetrievalSignal signal : signals) {
        array.append(signalToString(signal));
    }
    return array;
}

ParsedDocument documentFromJson(const QJsonObject& json)
{
    ParsedDocument doc;
    doc.documentId = json.value(QStringLiteral("document_id")).toString();
    if (doc.documentId.isEmpty()) {
        doc.documentId = json.value(QStringLiteral("file_id")).toString();
    }
    doc.filename = json.value(QStringLiteral("filename")).toString();
    doc.sourceUrl = json.value(QStringLiteral("source_url")).toString();
    if (doc.sourceUrl.isEmpty()) {
        doc.sourceUrl = json.value(QStringLiteral("file_url")).toString();
    }
    doc.text = json.value(QStringLiteral("text")).toString();
    doc.charCount = json.value(QStringLiteral("char_count")).toInt(doc.text.size());
    doc.extractionSuccess = json.value(QStringLiteral("extraction_success")).toBool(true);
    return doc;
}

} // namespace

RagService::RagService(RagContext& context, QObject* parent)
    : ServiceBase(QStringLiteral("rag"), parent)
    , m_context(context)
{
    LOG_INFO(hrIpc, "RagService created");
}

RagService::~RagService() = default;

QJsonObject RagService::handleRequest(const QJsonObject& request)
{
    const QString method = request.value(QStringLiteral("method")).toString();
    const uint64_t id = IpcMessage::requestId(request);
    const QJsonObject params = request.value(QStringLiteral("params")).toObject();

    LOG_DEBUG(hrIpc, "Request %llu: %s", static_cast<unsigned long long>(id),
              qUtf8Printable(method));

    if (method == QLatin1String("query"))       return handleQuery(id, params);
    if (method == QLatin1String("ingest"))      return handleIngest(id, params);
    if (method == QLatin1String("health"))      return handleHealth(id);
    if (method == QLatin1String("cache_stats")) return handleCacheStats(id);
    if (method == QLatin1String("clear_cache")) return handleClearCache(id);

    return ServiceBase::handleRequest(request);
}

QJsonObject RagService::resultToJson(const RetrievedChunk& chunk)
{
    QJsonObject json;
    json[QStringLiteral("content")] = chunk.content;
    json[QStringLiteral("filename")] = chunk.filename;
    json[QStringLiteral("document_id")] = chunk.documentId;
    json[QStringLiteral("chunk_id")] = chunk.chunkId;
    json[QStringLiteral("source_url")] = chunk.sourceUrl;
    json[QStringLiteral("score")] = chunk.score;
    json[QStringLiteral("signals")] = signalsToJson(chunk.signals);
    json[QStringLiteral("best_rank")] = chunk.bestRank;
    return json;
}

// ── query ───────────────────────────────────────────────────

QJsonObject RagService::handleQuery(uint64_t id, const QJsonObject& params)
{
    const QJsonValue questionValue = params.value(QStringLiteral("question"));
    if (!questionValue.isString()) {
        return IpcMessage::makeError(id, IpcErrorCode::InvalidParams,
                                     QStringLiteral("Missing 'question' parameter"));
    }

    const QJsonValue topKValue = params.value(QStringLiteral("top_k"));
    if (!topKValue.isUndefined() && !topKValue.isDouble()) {
        return IpcMessage::makeError(id, IpcErrorCode::InvalidParams,
                                     QStringLiteral("'top_k' must be an integer"));
    }
    const double topKNumber = topKValue.toDouble(kDefaultTopK);
    if (std::floor(topKNumber) != topKNumber) {
        return IpcMessage::makeError(id, IpcErrorCode::InvalidParams,
                                     QStringLiteral("'top_k' must be an integer"));
    }
    // Range-checked as a double so the narrowing below is always defined.
    const int maxTopK = m_context.retriever().config().maxTopK;
    if (topKNumber < 1.0 || topKNumber > static_cast<double>(maxTopK)) {
        return IpcMessage::makeError(id, IpcErrorCode::InvalidParams,
                                     QStringLiteral("top_k must be between 1 and %1").arg(maxTopK));
    }

    const QJsonValue modeValue = params.value(QStringLiteral("search_mode"));
    const QString modeName = modeValue.isUndefined()
        ? searchModeToString(SearchMode::FullHybrid)
        : modeValue.toString();
    const std::optional<SearchMode> mode = parseSearchMode(modeName);
    if (!mode) {
        LOG_WARN(hrIpc, "Rejected query with unknown search_mode '%s'", qUtf8Printable(modeName));
        return IpcMessage::makeError(id, IpcErrorCode::InvalidParams,
                                     QStringLiteral("Unknown search_mode: %1").arg(modeName));
    }

    RetrievalRequest request;
    request.question = questionValue.toString();
    request.topK = static_cast<int>(topKNumber);
    request.mode = *mode;

    QElapsedTimer timer;
    timer.start();
    const RetrievalResponse response = m_context.cachedRetriever().retrieve(request);

    switch (response.status) {
    case RetrievalResponse::Status::InvalidRequest:
        return IpcMessage::makeError(id, IpcErrorCode::InvalidParams, response.errorMessage);
    case RetrievalResponse::Status::Failed:
        return IpcMessage::makeError(id, IpcErrorCode::ServiceUnavailable, response.errorMessage);
    case RetrievalResponse::Status::Ok:
        break;
    }

    QJsonArray results;
    for (const RetrievedChunk& chunk : response.results) {
        results.append(resultToJson(chunk));
    }

    QJsonObject result;
    result[QStringLiteral("question")] = request.question;
    result[QStringLiteral("search_mode")] = searchModeToString(request.mode);
    result[QStringLiteral("results")] = results;
    result[QStringLiteral("total_results")] = static_cast<int>(response.results.size());
    result[QStringLiteral("failed_signals")] = signalsToJson(response.failedSignals);
    result[QStringLiteral("elapsed_ms")] = static_cast<qint64>(timer.elapsed());
    return IpcMessage::makeResponse(id, result);
}

// ── ingest ──────────────────────────────────────────────────

QJsonObject RagService::handleIngest(uint64_t id, const QJsonObject& params)
{
    const QString source = params.value(QStringLiteral("source")).toString();
    IngestReport report;

    if (source == QLatin1String("sample")) {
        QString text = params.value(QStringLiteral("sample_text")).toString();
        if (text.trimmed().isEmpty()) {
            text = QString::fromLatin1(kDefaultSampleText);
        }
        const QString filename =
            params.value(QStringLiteral("filename")).toString(QStringLiteral("sample.txt"));
        report = m_context.ingestion().ingestSampleText(text, filename);
    } else if (source == QLatin1String("documents")) {
        const QJsonValue docsValue = params.value(QStringLiteral("documents"));
        if (!docsValue.isArray()) {
            return IpcMessage::makeError(id, IpcErrorCode::InvalidParams,
                                         QStringLiteral("'documents' array required for documents source"));
        }
        std::vector<ParsedDocument> documents;
        for (const QJsonValue& value : docsValue.toArray()) {
            if (!value.isObject()) {
                return IpcMessage::makeError(id, IpcErrorCode::InvalidParams,
                                             QStringLiteral("Each document must be an object"));
            }
            documents.push_back(documentFromJson(value.toObject()));
        }
        report = m_context.ingestion().ingestDocuments(documents);
    } else {
        return IpcMessage::makeError(id, IpcErrorCode::InvalidParams,
                                     QStringLiteral("Unsupported source type: %1").arg(source));
    }

    QJsonObject result;
    result[QStringLiteral("status")] = QStringLiteral("success");
    result[QStringLiteral("documents_processed")] = report.documentsProcessed;
    result[QStringLiteral("chunks_created")] = report.chunksCreated;
    result[QStringLiteral("chunks_indexed")] = report.indexed;
    result[QStringLiteral("indexed")] = report.indexed;
    result[QStringLiteral("errors")] = report.errors;
    result[QStringLiteral("source")] = source;

    if (report.indexed > 0) {
        QJsonObject note;
        note[QStringLiteral("indexed")] = report.indexed;
        note[QStringLiteral("errors")] = report.errors;
        sendNotification(QStringLiteral("index_updated"), note);
    }
    return IpcMessage::makeResponse(id, result);
}

// ── health / cache ──────────────────────────────────────────

QJsonObject RagService::handleHealth(uint64_t id)
{
    const StoreHealth health = m_context.store().health();

    QJsonObject result;
    result[QStringLiteral("status")] = health.indexExists ? QStringLiteral("healthy")
                                                          : QStringLiteral("degraded");
    result[QStringLiteral("index_exists")] = health.indexExists;
    result[QStringLiteral("chunk_count")] = static_cast<qint64>(health.chunkCount);
    result[QStringLiteral("dense_count")] = static_cast<qint64>(health.denseCount);
    result[QStringLiteral("sparse_count")] = static_cast<qint64>(health.sparseCount);
    result[QStringLiteral("dense_dimensions")] = health.denseDimensions;
    result[QStringLiteral("last_indexed_at")] = health.lastIndexedAt;
    result[QStringLiteral("dense_available")] = m_context.embeddings().denseAvailable();
    result[QStringLiteral("sparse_available")] = m_context.embeddings().sparseAvailable();
    result[QStringLiteral("cache")] = cacheStatsJson();
    return IpcMessage::makeResponse(id, result);
}

QJsonObject RagService::cacheStatsJson() const
{
    const CachedRetriever::Stats stats = m_context.cachedRetriever().stats();
    QJsonObject json;
    json[QStringLiteral("hits")] = static_cast<qint64>(stats.hits);
    json[QStringLiteral("misses")] = static_cast<qint64>(stats.misses);
    json[QStringLiteral("evictions")] = static_cast<qint64>(stats.evictions);
    json[QStringLiteral("size")] = stats.currentSize;
    json[QStringLiteral("ttl_seconds")] = stats.ttlSeconds;
    return json;
}

QJsonObject RagService::handleCacheStats(uint64_t id)
{
    return IpcMessage::makeResponse(id, cacheStatsJson());
}

QJsonObject RagService::handleClearCache(uint64_t id)
{
    m_context.cachedRetriever().clear();
    QJsonObject result;
    result[QStringLiteral("cleared")] = true;
    return IpcMessage::makeResponse(id, result);
}

} // namespace hr
