#include <QtTest/QtTest>
#include "core/embedding/circuit_breaker.h"
#include "core/embedding/embedding_manager.h"
#include "core/embedding/sparse_encoder.h"
#include "core/models/model_registry.h"

#include <QTemporaryDir>

#include <cmath>
#include <limits>

class TestEmbedding : public QObject {
    Q_OBJECT

private slots:
    // ── Unavailable models ───────────────────────────────────────
    void testDenseWithoutRegistryIsUnavailable();
    void testDenseWithoutManifestIsUnavailable();
    void testSparseWithoutModelIsUnavailable();

    // ── Dense normalization ──────────────────────────────────────
    void testNormalizeEmbeddingUnitLength();
    void testNormalizeZeroVectorUnchanged();

    // ── Sparse pruning ───────────────────────────────────────────
    void testPruneTermsKeepsHighestWeights();
    void testPruneTermsDropsNonPositiveAndNonFinite();
    void testPruneTermsTieBreaksByTerm();

    // ── Circuit breaker ──────────────────────────────────────────
    void testCircuitBreakerOpensAfterThreshold();
    void testCircuitBreakerResetsOnSuccess();
};

void TestEmbedding::testDenseWithoutRegistryIsUnavailable()
{
    hr::EmbeddingManager manager(nullptr);
    QVERIFY(!manager.initialize());
    QVERIFY(!manager.isAvailable());
    QCOMPARE(manager.dimensions(), 0);
    QVERIFY(!manager.embed(QStringLiteral("hello")).has_value());
    QVERIFY(!manager.embedQuery(QStringLiteral("hello")).has_value());
    QVERIFY(manager.embedBatch({QStringLiteral("a"), QStringLiteral("b")}).empty());
}

void TestEmbedding::testDenseWithoutManifestIsUnavailable()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    hr::ModelRegistry registry(dir.path());

    hr::EmbeddingManager manager(&registry);
    QVERIFY(!manager.initialize());
    QVERIFY(!manager.embed(QStringLiteral("hello")).has_value());
}

void TestEmbedding::testSparseWithoutModelIsUnavailable()
{
    QTemporaryDir dir;
    QVERIFY(dir.isValid());
    hr::ModelRegistry registry(dir.path());

    hr::SparseExpansionEncoder encoder(&registry, hr::SparseExpansionEncoder::Config{});
    QVERIFY(!encoder.initialize());
    QVERIFY(!encoder.isAvailable());
    QVERIFY(!encoder.expand(QStringLiteral("hello")).has_value());
    QVERIFY(encoder.expandBatch({QStringLiteral("a"), QStringLiteral("b")}).empty());
}

void TestEmbedding::testNormalizeEmbeddingUnitLength()
{
    const hr::DenseVector normalized = hr::EmbeddingManager::normalizeEmbedding({3.0f, 4.0f});
    QCOMPARE(normalized.size(), size_t{2});
    QVERIFY(std::abs(normalized[0] - 0.6f) < 1e-6f);
    QVERIFY(std::abs(normalized[1] - 0.8f) < 1e-6f);
}

void TestEmbedding::testNormalizeZeroVectorUnchanged()
{
    const hr::DenseVector normalized = hr::EmbeddingManager::normalizeEmbedding({0.0f, 0.0f, 0.0f});
    for (float v : normalized) {
        QCOMPARE(v, 0.0f);
    }
}

void TestEmbedding::testPruneTermsKeepsHighestWeights()
{
    hr::SparseVector weights;
    weights[QStringLiteral("alpha")] = 0.5f;
    weights[QStringLiteral("beta")] = 2.0f;
    weights[QStringLiteral("gamma")] = 1.0f;
    weights[QStringLiteral("delta")] = 0.1f;

    const hr::SparseVector pruned = hr::SparseExpansionEncoder::pruneTerms(weights, 2);
    QCOMPARE(pruned.size(), size_t{2});
    QVERIFY(pruned.count(QStringLiteral("beta")) == 1);
    QVERIFY(pruned.count(QStringLiteral("gamma")) == 1);
}

void TestEmbedding::testPruneTermsDropsNonPositiveAndNonFinite()
{
    hr::SparseVector weights;
    weights[QStringLiteral("zero")] = 0.0f;
    weights[QStringLiteral("negative")] = -1.0f;
    weights[QStringLiteral("inf")] = std::numeric_limits<float>::infinity();
    weights[QStringLiteral("nan")] = std::numeric_limits<float>::quiet_NaN();
    weights[QStringLiteral("kept")] = 0.25f;

    const hr::SparseVector pruned = hr::SparseExpansionEncoder::pruneTerms(weights, 10);
    QCOMPARE(pruned.size(), size_t{1});
    QCOMPARE(pruned.at(QStringLiteral("kept")), 0.25f);
}

void TestEmbedding::testPruneTermsTieBreaksByTerm()
{
    hr::SparseVector weights;
    weights[QStringLiteral("c")] = 1.0f;
    weights[QStringLiteral("a")] = 1.0f;
    weights[QStringLiteral("b")] = 1.0f;

    const hr::SparseVector pruned = hr::SparseExpansionEncoder::pruneTerms(weights, 2);
    QCOMPARE(pruned.size(), size_t{2});
    QVERIFY(pruned.count(QStringLiteral("a")) == 1);
    QVERIFY(pruned.count(QStringLiteral("b")) == 1);
}

void TestEmbedding::testCircuitBreakerOpensAfterThreshold()
{
    hr::EncoderCircuitBreaker breaker;
    for (int i = 0; i < hr::EncoderCircuitBreaker::kOpenThreshold - 1; ++i) {
        breaker.recordFailure();
        QVERIFY(!breaker.isOpen());
    }
    breaker.recordFailure();
    QVERIFY(breaker.isOpen());
}

void TestEmbedding::testCircuitBreakerResetsOnSuccess()
{
    hr::EncoderCircuitBreaker breaker;
    for (int i = 0; i < hr::EncoderCircuitBreaker::kOpenThreshold; ++i) {
        breaker.recordFailure();
    }
    QVERIFY(breaker.isOpen());
    breaker.recordSuccess();
    QVERIFY(!breaker.isOpen());
}

QTEST_MAIN(TestEmbedding)
#include "test_embedding.moc"
