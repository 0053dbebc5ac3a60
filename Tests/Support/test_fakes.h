#pragma once

#include "core/embedding/encoder.h"
#include "core/index/document_store.h"
#include "core/retrieval/retriever.h"

#include <QSet>
#include <QString>

#include <atomic>
#include <memory>

namespace hr::test {

// Deterministic bag-of-words dense encoder: each lowercase word adds 1 to
// bucket qHash(word) % dimensions, then the vector is L2-normalized.
class FakeDenseEncoder : public DenseEncoder {
public:
    explicit FakeDenseEncoder(int dimensions = 16);

    bool isAvailable() const override { return available; }
    int dimensions() const override { return m_dimensions; }

    std::optional<DenseVector> embed(const QString& text) override;
    std::optional<DenseVector> embedQuery(const QString& text) override;

    bool available = true;
    QString failOnSubstring;        // embed() returns nullopt when text contains it
    std::atomic<int> calls{0};

private:
    int m_dimensions;
};

// Sparse encoder mapping every lowercase word to weight 1.0.
class FakeSparseEncoder : public SparseEncoder {
public:
    bool isAvailable() const override { return available; }

    std::optional<SparseVector> expand(const QString& text) override;
    std::vector<std::optional<SparseVector>> expandBatch(
        const std::vector<QString>& texts) override;

    bool available = true;
    bool failBatch = false;
    bool dropLastInBatch = false;   // returns one entry fewer than requested
    std::atomic<int> expandCalls{0};
    std::atomic<int> batchCalls{0};
};

// Delegates to a real store, with per-operation fault injection.
class FaultInjectingStore : public DocumentStore {
public:
    explicit FaultInjectingStore(DocumentStore& inner) : m_inner(inner) {}

    bool ensureIndex() override;
    bool indexExists() override;
    bool deleteIndex() override;

    std::optional<UpsertOutcome> upsert(const ChunkDocument& doc) override;
    std::optional<ChunkDocument> get(const QString& documentId, int chunkId) override;
    int64_t count() override;

    std::optional<std::vector<StoreHit>> searchLexical(const QString& text, int limit) override;
    std::optional<std::vector<StoreHit>> searchDense(const DenseVector& vector, int limit) override;
    std::optional<std::vector<StoreHit>> searchSparse(const SparseVector& vector, int limit) override;

    StoreHealth health() override;

    QSet<QString> rejectKeys;       // composite keys whose upsert returns nullopt
    QSet<QString> throwKeys;        // composite keys whose upsert throws
    bool failLexical = false;
    bool failDense = false;
    bool failSparse = false;
    int sparseDelayMs = 0;
    std::atomic<int> upsertCalls{0};
    std::atomic<int> searchCalls{0};
    std::atomic<int> lastLimit{0};

private:
    DocumentStore& m_inner;
};

// Retriever returning a canned response and counting calls.
class CountingRetriever : public Retriever {
public:
    RetrievalResponse retrieve(const RetrievalRequest& request) override;

    RetrievalResponse response;
    std::atomic<int> calls{0};
};

// Lowercase alphanumeric words of text.
QStringList wordsOf(const QString& text);

} // namespace hr::test
