#include <QtTest/QtTest>
#include "core/index/vector_index.h"

#include <cmath>

namespace {

std::vector<float> unit(int dims, int axis)
{
    std::vector<float> v(static_cast<size_t>(dims), 0.0f);
    v[static_cast<size_t>(axis)] = 1.0f;
    return v;
}

} // anonymous namespace

class TestVectorIndex : public QObject {
    Q_OBJECT

private slots:
    void testUnavailableUntilCreated();
    void testCreateRejectsNonPositiveDimensions();
    void testSearchFindsNearest();
    void testUpsertReplacesVector();
    void testRemove();
    void testDimensionMismatch();
    void testGrowsPastInitialCapacity();
};

void TestVectorIndex::testUnavailableUntilCreated()
{
    hr::VectorIndex index;
    QVERIFY(!index.isAvailable());
    QVERIFY(!index.upsert(1, unit(4, 0)));
    QVERIFY(index.search(unit(4, 0), 3).empty());
}

void TestVectorIndex::testCreateRejectsNonPositiveDimensions()
{
    hr::VectorIndex index;
    QVERIFY(!index.create(0));
    QVERIFY(!index.isAvailable());
}

void TestVectorIndex::testSearchFindsNearest()
{
    hr::VectorIndex index;
    QVERIFY(index.create(4));
    QVERIFY(index.upsert(10, unit(4, 0)));
    QVERIFY(index.upsert(11, unit(4, 1)));
    QVERIFY(index.upsert(12, unit(4, 2)));
    QCOMPARE(index.size(), 3);

    const auto results = index.search(unit(4, 1), 2);
    QCOMPARE(results.size(), size_t{2});
    QCOMPARE(results[0].label, uint64_t{11});
    QVERIFY(std::abs(results[0].similarity - 1.0f) < 1e-5f);
    QVERIFY(results[0].similarity >= results[1].similarity);
}

void TestVectorIndex::testUpsertReplacesVector()
{
    hr::VectorIndex index;
    QVERIFY(index.create(4));
    QVERIFY(index.upsert(1, unit(4, 0)));
    QVERIFY(index.upsert(2, unit(4, 3)));
    QVERIFY(index.upsert(1, unit(4, 2)));
    QCOMPARE(index.size(), 2);

    const auto results = index.search(unit(4, 2), 1);
    QCOMPARE(results.size(), size_t{1});
    QCOMPARE(results[0].label, uint64_t{1});
}

void TestVectorIndex::testRemove()
{
    hr::VectorIndex index;
    QVERIFY(index.create(4));
    QVERIFY(index.upsert(1, unit(4, 0)));
    QVERIFY(index.upsert(2, unit(4, 1)));

    QVERIFY(index.remove(1));
    QVERIFY(!index.contains(1));
    QVERIFY(!index.remove(1));
    QCOMPARE(index.size(), 1);

    const auto results = index.search(unit(4, 0), 5);
    QCOMPARE(results.size(), size_t{1});
    QCOMPARE(results[0].label, uint64_t{2});

    // A removed label can come back.
    QVERIFY(index.upsert(1, unit(4, 0)));
    QVERIFY(index.contains(1));
}

void TestVectorIndex::testDimensionMismatch()
{
    hr::VectorIndex index;
    QVERIFY(index.create(4));
    QVERIFY(!index.upsert(1, unit(3, 0)));
    QVERIFY(index.upsert(1, unit(4, 0)));
    QVERIFY(index.search(unit(3, 0), 1).empty());
}

void TestVectorIndex::testGrowsPastInitialCapacity()
{
    hr::VectorIndex index;
    QVERIFY(index.create(8, 4));
    for (uint64_t label = 0; label < 40; ++label) {
        std::vector<float> v(8, 0.1f);
        v[label % 8] = 1.0f + static_cast<float>(label);
        float norm = 0.0f;
        for (float x : v) {
            norm += x * x;
        }
        for (float& x : v) {
            x /= std::sqrt(norm);
        }
        QVERIFY(index.upsert(label, v));
    }
    QCOMPARE(index.size(), 40);
    QCOMPARE(index.search(unit(8, 3), 10).size(), size_t{10});
}

QTEST_MAIN(TestVectorIndex)
#include "test_vector_index.moc"
