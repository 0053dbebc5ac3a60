#pragma once

#include "core/index/document_store.h"
#include "core/retrieval/retriever.h"

#include <condition_variable>
#include <functional>
#include <mutex>
#include <optional>

namespace hr {

class EmbeddingGenerator;
struct Settings;

struct RetrieverConfig {
    int rrfK = 60;
    int minCandidatesPerSignal = 20;   // per-signal oversampling floor in fused modes
    int maxTopK = 20;
    int minQuestionChars = 3;
    int maxQuestionChars = 1000;
    int signalTimeoutMs = 10000;

    static RetrieverConfig fromSettings(const Settings& settings);
};

// HybridRetriever: runs the signals a SearchMode selects against the
// document store and fuses them.
//
// Each signal runs on its own worker thread; the retriever waits for all
// of them (or their timeout) before fusing. A signal that fails or times
// out is dropped and reported in failedSignals; the request fails only when
// every signal of the mode did.
class HybridRetriever : public Retriever {
public:
    HybridRetriever(DocumentStore& store, const EmbeddingGenerator& embeddings,
                    RetrieverConfig config = {});
    ~HybridRetriever() override;

    HybridRetriever(const HybridRetriever&) = delete;
    HybridRetriever& operator=(const HybridRetriever&) = delete;

    RetrievalResponse retrieve(const RetrievalRequest& request) override;

    // Error message for a request that must be rejected, nullopt if valid.
    std::optional<QString> validate(const RetrievalRequest& request) const;

    // Hits requested from each signal for a given topK and mode.
    int candidatesPerSignal(int topK, SearchMode mode) const;

    const RetrieverConfig& config() const { return m_config; }

protected:
    // Starts a detached worker for one signal. Throws std::system_error when
    // no thread can be created; that signal then counts as failed.
    virtual void launchWorker(RetrievalSignal signal, std::function<void()> work);

private:
    std::optional<std::vector<StoreHit>> runSignal(RetrievalSignal signal,
                                                   const QString& question, int limit);

    DocumentStore& m_store;
    const EmbeddingGenerator& m_embeddings;
    RetrieverConfig m_config;

    // Signal workers still running (possibly past their timeout).
    std::mutex m_inflightMutex;
    std::condition_variable m_inflightCv;
    int m_inflight = 0;
};

} // namespace hr
