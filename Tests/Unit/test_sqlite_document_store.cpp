#include <QtTest/QtTest>
#include "core/index/sqlite_document_store.h"

#include <QTemporaryDir>

#include <cmath>

namespace {

hr::ChunkDocument makeDoc(const QString& documentId, int chunkId, const QString& text)
{
    hr::ChunkDocument doc;
    doc.chunk.documentId = documentId;
    doc.chunk.chunkId = chunkId;
    doc.chunk.filename = documentId + QStringLiteral(".txt");
    doc.chunk.sourceUrl = QStringLiteral("https://example.org/") + documentId;
    doc.chunk.text = text;
    doc.chunk.charCount = static_cast<int>(text.size());
    doc.chunk.tokenCount = hr::estimateTokenCount(doc.chunk.charCount);
    return doc;
}

hr::DenseVector axis(int dims, int i)
{
    hr::DenseVector v(static_cast<size_t>(dims), 0.0f);
    v[static_cast<size_t>(i)] = 1.0f;
    return v;
}

} // anonymous namespace

class TestSQLiteDocumentStore : public QObject {
    Q_OBJECT

private slots:
    void init();
    void cleanup();

    // ── Index lifecycle ──────────────────────────────────────────
    void testEnsureIndexIsIdempotent();
    void testOperationsWithoutIndex();
    void testDeleteIndex();

    // ── Upsert / get ─────────────────────────────────────────────
    void testUpsertCreatesThenUpdates();
    void testGetRoundTrip();
    void testUpsertClearsAbsentVectors();
    void testUpsertRejectsInvalidDocuments();

    // ── Search ───────────────────────────────────────────────────
    void testLexicalSearch();
    void testLexicalSearchNoWords();
    void testDenseSearch();
    void testDenseSearchDimensionMismatch();
    void testSparseSearch();

    // ── Persistence / health ─────────────────────────────────────
    void testReopenRebuildsVectors();
    void testHealth();
    void testToFtsQuery();

private:
    QString dbPath() const { return m_dir->path() + QStringLiteral("/index.db"); }

    std::unique_ptr<QTemporaryDir> m_dir;
    std::unique_ptr<hr::SQLiteDocumentStore> m_store;
};

void TestSQLiteDocumentStore::init()
{
    m_dir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_dir->isValid());
    m_store = hr::SQLiteDocumentStore::open(dbPath());
    QVERIFY(m_store != nullptr);
}

void TestSQLiteDocumentStore::cleanup()
{
    m_store.reset();
    m_dir.reset();
}

void TestSQLiteDocumentStore::testEnsureIndexIsIdempotent()
{
    QVERIFY(!m_store->indexExists());
    QVERIFY(m_store->ensureIndex());
    QVERIFY(m_store->indexExists());

    QVERIFY(m_store->upsert(makeDoc(QStringLiteral("a"), 0, QStringLiteral("kept text"))).has_value());
    QVERIFY(m_store->ensureIndex());
    QCOMPARE(m_store->count(), int64_t{1});
}

void TestSQLiteDocumentStore::testOperationsWithoutIndex()
{
    QCOMPARE(m_store->count(), int64_t{0});
    QVERIFY(!m_store->upsert(makeDoc(QStringLiteral("a"), 0, QStringLiteral("text"))).has_value());
    QVERIFY(!m_store->searchLexical(QStringLiteral("text"), 5).has_value());
    QVERIFY(!m_store->searchDense(axis(4, 0), 5).has_value());
    QVERIFY(!m_store->searchSparse({{QStringLiteral("text"), 1.0f}}, 5).has_value());
    QVERIFY(!m_store->health().indexExists);
}

void TestSQLiteDocumentStore::testDeleteIndex()
{
    QVERIFY(m_store->ensureIndex());
    hr::ChunkDocument doc = makeDoc(QStringLiteral("a"), 0, QStringLiteral("text"));
    doc.denseEmbedding = axis(4, 0);
    QVERIFY(m_store->upsert(doc).has_value());

    QVERIFY(m_store->deleteIndex());
    QVERIFY(!m_store->indexExists());
    QCOMPARE(m_store->count(), int64_t{0});

    // A fresh index accepts a different dimensionality.
    QVERIFY(m_store->ensureIndex());
    doc.denseEmbedding = axis(8, 0);
    QVERIFY(m_store->upsert(doc).has_value());
    QCOMPARE(m_store->health().denseDimensions, 8);
}

void TestSQLiteDocumentStore::testUpsertCreatesThenUpdates()
{
    QVERIFY(m_store->ensureIndex());

    const auto first = m_store->upsert(makeDoc(QStringLiteral("doc"), 0, QStringLiteral("version one")));
    QVERIFY(first.has_value());
    QCOMPARE(*first, hr::UpsertOutcome::Created);

    const auto second = m_store->upsert(makeDoc(QStringLiteral("doc"), 0, QStringLiteral("version two")));
    QVERIFY(second.has_value());
    QCOMPARE(*second, hr::UpsertOutcome::Updated);
    QCOMPARE(m_store->count(), int64_t{1});

    const auto stored = m_store->get(QStringLiteral("doc"), 0);
    QVERIFY(stored.has_value());
    QCOMPARE(stored->chunk.text, QStringLiteral("version two"));

    // The lexical alias follows the update.
    QVERIFY(m_store->searchLexical(QStringLiteral("one"), 5)->empty());
    QCOMPARE(m_store->searchLexical(QStringLiteral("two"), 5)->size(), size_t{1});
}

void TestSQLiteDocumentStore::testGetRoundTrip()
{
    QVERIFY(m_store->ensureIndex());
    hr::ChunkDocument doc = makeDoc(QStringLiteral("doc"), 3, QStringLiteral("Ünïcode text, verbatim."));
    doc.denseEmbedding = axis(4, 2);
    doc.sparseExpansion = hr::SparseVector{{QStringLiteral("unicode"), 0.5f},
                                           {QStringLiteral("text"), 1.5f}};
    doc.indexedAt = 1700000000.0;
    QVERIFY(m_store->upsert(doc).has_value());

    const auto stored = m_store->get(QStringLiteral("doc"), 3);
    QVERIFY(stored.has_value());
    QCOMPARE(stored->chunk.text, doc.chunk.text);
    QCOMPARE(stored->chunk.filename, doc.chunk.filename);
    QCOMPARE(stored->chunk.sourceUrl, doc.chunk.sourceUrl);
    QCOMPARE(stored->chunk.charCount, doc.chunk.charCount);
    QCOMPARE(stored->chunk.tokenCount, doc.chunk.tokenCount);
    QVERIFY(stored->denseEmbedding.has_value());
    QCOMPARE(*stored->denseEmbedding, *doc.denseEmbedding);
    QVERIFY(stored->sparseExpansion.has_value());
    QCOMPARE(stored->sparseExpansion->size(), size_t{2});
    QCOMPARE(stored->sparseExpansion->at(QStringLiteral("text")), 1.5f);
    QCOMPARE(stored->indexedAt, 1700000000.0);

    QVERIFY(!m_store->get(QStringLiteral("doc"), 4).has_value());
}

void TestSQLiteDocumentStore::testUpsertClearsAbsentVectors()
{
    QVERIFY(m_store->ensureIndex());
    hr::ChunkDocument doc = makeDoc(QStringLiteral("doc"), 0, QStringLiteral("vector text"));
    doc.denseEmbedding = axis(4, 1);
    doc.sparseExpansion = hr::SparseVector{{QStringLiteral("vector"), 1.0f}};
    QVERIFY(m_store->upsert(doc).has_value());
    QCOMPARE(m_store->searchDense(axis(4, 1), 5)->size(), size_t{1});

    doc.denseEmbedding.reset();
    doc.sparseExpansion.reset();
    QCOMPARE(*m_store->upsert(doc), hr::UpsertOutcome::Updated);

    const auto stored = m_store->get(QStringLiteral("doc"), 0);
    QVERIFY(stored.has_value());
    QVERIFY(!stored->denseEmbedding.has_value());
    QVERIFY(!stored->sparseExpansion.has_value());
    QVERIFY(m_store->searchDense(axis(4, 1), 5)->empty());
    QVERIFY(m_store->searchSparse({{QStringLiteral("vector"), 1.0f}}, 5)->empty());

    const hr::StoreHealth health = m_store->health();
    QCOMPARE(health.denseCount, int64_t{0});
    QCOMPARE(health.sparseCount, int64_t{0});
}

void TestSQLiteDocumentStore::testUpsertRejectsInvalidDocuments()
{
    QVERIFY(m_store->ensureIndex());

    QVERIFY(!m_store->upsert(makeDoc(QString(), 0, QStringLiteral("no id"))).has_value());

    hr::ChunkDocument empty = makeDoc(QStringLiteral("doc"), 0, QStringLiteral("x"));
    empty.denseEmbedding = hr::DenseVector{};
    QVERIFY(!m_store->upsert(empty).has_value());

    hr::ChunkDocument four = makeDoc(QStringLiteral("doc"), 1, QStringLiteral("y"));
    four.denseEmbedding = axis(4, 0);
    QVERIFY(m_store->upsert(four).has_value());

    hr::ChunkDocument eight = makeDoc(QStringLiteral("doc"), 2, QStringLiteral("z"));
    eight.denseEmbedding = axis(8, 0);
    QVERIFY(!m_store->upsert(eight).has_value());

    QCOMPARE(m_store->count(), int64_t{1});
}

void TestSQLiteDocumentStore::testLexicalSearch()
{
    QVERIFY(m_store->ensureIndex());
    QVERIFY(m_store->upsert(makeDoc(QStringLiteral("a"), 0,
        QStringLiteral("The mitochondria is the powerhouse of the cell."))).has_value());
    QVERIFY(m_store->upsert(makeDoc(QStringLiteral("b"), 0,
        QStringLiteral("Photosynthesis happens in the chloroplast."))).has_value());
    QVERIFY(m_store->upsert(makeDoc(QStringLiteral("c"), 0,
        QStringLiteral("Mitochondria and chloroplasts both carry DNA."))).has_value());

    const auto hits = m_store->searchLexical(QStringLiteral("What is the mitochondria?"), 10);
    QVERIFY(hits.has_value());
    QVERIFY(hits->size() >= 2);
    for (size_t i = 1; i < hits->size(); ++i) {
        QVERIFY((*hits)[i - 1].score >= (*hits)[i].score);
    }

    QStringList ids;
    for (const hr::StoreHit& hit : *hits) {
        ids << hit.chunk.documentId;
    }
    QVERIFY(ids.contains(QStringLiteral("a")));
    QVERIFY(ids.contains(QStringLiteral("c")));

    const auto limited = m_store->searchLexical(QStringLiteral("mitochondria chloroplast"), 1);
    QCOMPARE(limited->size(), size_t{1});
}

void TestSQLiteDocumentStore::testLexicalSearchNoWords()
{
    QVERIFY(m_store->ensureIndex());
    QVERIFY(m_store->upsert(makeDoc(QStringLiteral("a"), 0, QStringLiteral("text"))).has_value());

    const auto hits = m_store->searchLexical(QStringLiteral("?!  ..."), 10);
    QVERIFY(hits.has_value());
    QVERIFY(hits->empty());

    // FTS operators in user text are treated as plain words.
    QVERIFY(m_store->searchLexical(QStringLiteral("text AND NOT \"(x"), 10).has_value());
}

void TestSQLiteDocumentStore::testDenseSearch()
{
    QVERIFY(m_store->ensureIndex());
    for (int i = 0; i < 4; ++i) {
        hr::ChunkDocument doc = makeDoc(QStringLiteral("doc"), i, QStringLiteral("chunk %1").arg(i));
        doc.denseEmbedding = axis(4, i);
        QVERIFY(m_store->upsert(doc).has_value());
    }

    const auto hits = m_store->searchDense(axis(4, 2), 2);
    QVERIFY(hits.has_value());
    QCOMPARE(hits->size(), size_t{2});
    QCOMPARE((*hits)[0].chunk.chunkId, 2);
    QCOMPARE((*hits)[0].chunk.text, QStringLiteral("chunk 2"));
    QVERIFY(std::abs((*hits)[0].score - 1.0) < 1e-5);
}

void TestSQLiteDocumentStore::testDenseSearchDimensionMismatch()
{
    QVERIFY(m_store->ensureIndex());

    // No vectors yet: nothing to match against.
    const auto none = m_store->searchDense(axis(4, 0), 5);
    QVERIFY(none.has_value());
    QVERIFY(none->empty());

    hr::ChunkDocument doc = makeDoc(QStringLiteral("doc"), 0, QStringLiteral("x"));
    doc.denseEmbedding = axis(4, 0);
    QVERIFY(m_store->upsert(doc).has_value());
    QVERIFY(!m_store->searchDense(axis(3, 0), 5).has_value());
}

void TestSQLiteDocumentStore::testSparseSearch()
{
    QVERIFY(m_store->ensureIndex());
    hr::ChunkDocument a = makeDoc(QStringLiteral("a"), 0, QStringLiteral("a"));
    a.sparseExpansion = hr::SparseVector{{QStringLiteral("cell"), 2.0f}, {QStringLiteral("energy"), 1.0f}};
    hr::ChunkDocument b = makeDoc(QStringLiteral("b"), 0, QStringLiteral("b"));
    b.sparseExpansion = hr::SparseVector{{QStringLiteral("cell"), 0.5f}};
    hr::ChunkDocument c = makeDoc(QStringLiteral("c"), 0, QStringLiteral("c"));
    c.sparseExpansion = hr::SparseVector{{QStringLiteral("leaf"), 3.0f}};
    QVERIFY(m_store->upsert(a).has_value());
    QVERIFY(m_store->upsert(b).has_value());
    QVERIFY(m_store->upsert(c).has_value());

    const auto hits = m_store->searchSparse(
        {{QStringLiteral("cell"), 1.0f}, {QStringLiteral("energy"), 1.0f}}, 10);
    QVERIFY(hits.has_value());
    QCOMPARE(hits->size(), size_t{2});
    QCOMPARE((*hits)[0].chunk.documentId, QStringLiteral("a"));
    QCOMPARE((*hits)[0].score, 3.0);
    QCOMPARE((*hits)[1].chunk.documentId, QStringLiteral("b"));
    QCOMPARE((*hits)[1].score, 0.5);

    QVERIFY(m_store->searchSparse({}, 10)->empty());
    QVERIFY(m_store->searchSparse({{QStringLiteral("cell"), 0.0f}}, 10)->empty());
}

void TestSQLiteDocumentStore::testReopenRebuildsVectors()
{
    QVERIFY(m_store->ensureIndex());
    for (int i = 0; i < 3; ++i) {
        hr::ChunkDocument doc = makeDoc(QStringLiteral("doc"), i, QStringLiteral("persisted %1").arg(i));
        doc.denseEmbedding = axis(4, i);
        QVERIFY(m_store->upsert(doc).has_value());
    }
    m_store.reset();

    m_store = hr::SQLiteDocumentStore::open(dbPath());
    QVERIFY(m_store != nullptr);
    QVERIFY(m_store->indexExists());
    QCOMPARE(m_store->count(), int64_t{3});

    const auto hits = m_store->searchDense(axis(4, 1), 1);
    QVERIFY(hits.has_value());
    QCOMPARE(hits->size(), size_t{1});
    QCOMPARE((*hits)[0].chunk.chunkId, 1);
    QCOMPARE(m_store->health().denseDimensions, 4);
}

void TestSQLiteDocumentStore::testHealth()
{
    QVERIFY(m_store->ensureIndex());
    hr::ChunkDocument a = makeDoc(QStringLiteral("a"), 0, QStringLiteral("a"));
    a.denseEmbedding = axis(4, 0);
    a.indexedAt = 100.0;
    hr::ChunkDocument b = makeDoc(QStringLiteral("b"), 0, QStringLiteral("b"));
    b.sparseExpansion = hr::SparseVector{{QStringLiteral("b"), 1.0f}};
    b.indexedAt = 200.0;
    QVERIFY(m_store->upsert(a).has_value());
    QVERIFY(m_store->upsert(b).has_value());

    const hr::StoreHealth health = m_store->health();
    QVERIFY(health.indexExists);
    QCOMPARE(health.chunkCount, int64_t{2});
    QCOMPARE(health.denseCount, int64_t{1});
    QCOMPARE(health.sparseCount, int64_t{1});
    QCOMPARE(health.denseDimensions, 4);
    QCOMPARE(health.lastIndexedAt, 200.0);
}

void TestSQLiteDocumentStore::testToFtsQuery()
{
    QCOMPARE(hr::SQLiteDocumentStore::toFtsQuery(QStringLiteral("What is RAG?")),
             QStringLiteral("\"What\" OR \"is\" OR \"RAG\""));
    QCOMPARE(hr::SQLiteDocumentStore::toFtsQuery(QStringLiteral("rag RAG Rag")),
             QStringLiteral("\"rag\""));
    QCOMPARE(hr::SQLiteDocumentStore::toFtsQuery(QStringLiteral("\"quoted\" (NEAR)")),
             QStringLiteral("\"quoted\" OR \"NEAR\""));
    QVERIFY(hr::SQLiteDocumentStore::toFtsQuery(QStringLiteral(" ?! ")).isEmpty());
}

QTEST_MAIN(TestSQLiteDocumentStore)
#include "test_sqlite_document_store.moc"
