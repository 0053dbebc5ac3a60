#include "core/retrieval/hybrid_retriever.h"
#include "core/embedding/embedding_generator.h"
#include "core/retrieval/rank_fusion.h"
#include "core/shared/logging.h"
#include "core/shared/settings.h"

#include <QElapsedTimer>
#include <QStringList>

#include <algorithm>
#include <chrono>
#include <exception>
#include <future>
#include <memory>
#include <system_error>
#include <thread>

namespace hr {

namespace {

struct SignalTask {
    RetrievalSignal signal = RetrievalSignal::Lexical;
    std::promise<std::optional<std::vector<StoreHit>>> promise;
};

} // namespace

RetrieverConfig RetrieverConfig::fromSettings(const Settings& settings)
{
    RetrieverConfig config;
    config.rrfK = settings.rrfK;
    config.minCandidatesPerSignal = settings.minCandidatesPerSignal;
    config.maxTopK = settings.maxTopK;
    config.minQuestionChars = settings.minQuestionChars;
    config.maxQuestionChars = settings.maxQuestionChars;
    config.signalTimeoutMs = settings.signalTimeoutMs;
    return config;
}

// ── Construction ────────────────────────────────────────────

HybridRetriever::HybridRetriever(DocumentStore& store, const EmbeddingGenerator& embeddings,
                                 RetrieverConfig config)
    : m_store(store)
    , m_embeddings(embeddings)
    , m_config(config)
{
}

HybridRetriever::~HybridRetriever()
{
    // Timed-out workers still reference the store and encoders.
    std::unique_lock<std::mutex> lock(m_inflightMutex);
    m_inflightCv.wait(lock, [this] { return m_inflight == 0; });
}

// ── Validation ──────────────────────────────────────────────

std::optional<QString> HybridRetriever::validate(const RetrievalRequest& request) const
{
    const int length = request.question.trimmed().size();
    if (length < m_config.minQuestionChars) {
        return QStringLiteral("Question must be at least %1 characters")
            .arg(m_config.minQuestionChars);
    }
    if (length > m_config.maxQuestionChars) {
        return QStringLiteral("Question must be at most %1 characters")
            .arg(m_config.maxQuestionChars);
    }
    if (request.topK < 1 || request.topK > m_config.maxTopK) {
        return QStringLiteral("top_k must be between 1 and %1").arg(m_config.maxTopK);
    }
    return std::nullopt;
}

int HybridRetriever::candidatesPerSignal(int topK, SearchMode mode) const
{
    if (!isFusedMode(mode)) {
        return topK;
    }
    return std::max(topK, m_config.minCandidatesPerSignal);
}

// ── Retrieval ───────────────────────────────────────────────

RetrievalResponse HybridRetriever::retrieve(const RetrievalRequest& request)
{
    RetrievalResponse response;
    if (const std::optional<QString> error = validate(request)) {
        response.status = RetrievalResponse::Status::InvalidRequest;
        response.errorMessage = *error;
        LOG_WARN(hrRetrieval, "Rejected request: %s", qUtf8Printable(*error));
        return response;
    }

    QElapsedTimer timer;
    timer.start();

    const QString question = request.question.trimmed();
    const std::vector<RetrievalSignal> signals = signalsForMode(request.mode);
    const int limit = candidatesPerSignal(request.topK, request.mode);

    // Fan out: one worker per signal.
    std::vector<std::pair<RetrievalSignal, std::future<std::optional<std::vector<StoreHit>>>>> pending;
    pending.reserve(signals.size());
    for (RetrievalSignal signal : signals) {
        auto task = std::make_shared<SignalTask>();
        task->signal = signal;
        pending.emplace_back(signal, task->promise.get_future());

        {
            std::lock_guard<std::mutex> lock(m_inflightMutex);
            ++m_inflight;
        }
        try {
            launchWorker(signal, [this, task, question, limit]() {
                task->promise.set_value(runSignal(task->signal, question, limit));
                std::lock_guard<std::mutex> lock(m_inflightMutex);
                --m_inflight;
                m_inflightCv.notify_all();
            });
        } catch (const std::system_error& e) {
            LOG_ERROR(hrRetrieval, "Could not start %s signal worker: %s",
                      qUtf8Printable(signalToString(signal)), e.what());
            {
                std::lock_guard<std::mutex> lock(m_inflightMutex);
                --m_inflight;
            }
            m_inflightCv.notify_all();
            task->promise.set_value(std::nullopt);
        }
    }

    // Join: every signal resolves to hits, failure or timeout.
    const auto deadline = std::chrono::steady_clock::now()
        + std::chrono::milliseconds(std::max(1, m_config.signalTimeoutMs));
    std::vector<RankedList> lists;
    for (auto& [signal, future] : pending) {
        if (future.wait_until(deadline) != std::future_status::ready) {
            LOG_WARN(hrRetrieval, "%s signal timed out after %d ms",
                     qUtf8Printable(signalToString(signal)), m_config.signalTimeoutMs);
            response.failedSignals.push_back(signal);
            continue;
        }
        std::optional<std::vector<StoreHit>> hits = future.get();
        if (!hits) {
            response.failedSignals.push_back(signal);
            continue;
        }
        lists.push_back(RankedList{signal, std::move(*hits)});
    }

    if (lists.empty()) {
        QStringList failed;
        for (RetrievalSignal signal : response.failedSignals) {
            failed.append(signalToString(signal));
        }
        response.status = RetrievalResponse::Status::Failed;
        response.errorMessage = QStringLiteral("All retrieval signals failed (%1)")
            .arg(failed.join(QStringLiteral(", ")));
        LOG_ERROR(hrRetrieval, "%s for mode %s", qUtf8Printable(response.errorMessage),
                  qUtf8Printable(searchModeToString(request.mode)));
        return response;
    }

    if (isFusedMode(request.mode)) {
        FusionConfig fusion;
        fusion.rrfK = m_config.rrfK;
        fusion.maxResults = request.topK;
        response.results = RankFusion::fuse(lists, fusion);
    } else {
        response.results = RankFusion::passthrough(lists.front(), request.topK);
    }

    LOG_INFO(hrRetrieval, "mode=%s topK=%d results=%zu failed=%zu in %lld ms",
             qUtf8Printable(searchModeToString(request.mode)), request.topK,
             response.results.size(), response.failedSignals.size(),
             static_cast<long long>(timer.elapsed()));
    return response;
}

void HybridRetriever::launchWorker(RetrievalSignal /*signal*/, std::function<void()> work)
{
    std::thread(std::move(work)).detach();
}

std::optional<std::vector<StoreHit>> HybridRetriever::runSignal(RetrievalSignal signal,
                                                                const QString& question,
                                                                int limit)
{
    try {
        switch (signal) {
        case RetrievalSignal::Lexical:
            return m_store.searchLexical(question, limit);
        case RetrievalSignal::Dense: {
            const std::optional<DenseVector> query = m_embeddings.denseForQuery(question);
            if (!query) {
                LOG_WARN(hrRetrieval, "Dense signal unavailable: no query embedding");
                return std::nullopt;
            }
            return m_store.searchDense(*query, limit);
        }
        case RetrievalSignal::Sparse: {
            const std::optional<SparseVector> query = m_embeddings.sparseForQuery(question);
            if (!query) {
                LOG_WARN(hrRetrieval, "Sparse signal unavailable: no query expansion");
                return std::nullopt;
            }
            return m_store.searchSparse(*query, limit);
        }
        }
    } catch (const std::exception& e) {
        LOG_ERROR(hrRetrieval, "%s signal threw: %s",
                  qUtf8Printable(signalToString(signal)), e.what());
    }
    return std::nullopt;
}

} // namespace hr
