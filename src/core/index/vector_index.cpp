#include "core/index/vector_index.h"

#include <hnswlib/hnswlib.h>

#include <QDebug>

#include <algorithm>

namespace hr {

VectorIndex::VectorIndex() = default;

VectorIndex::~VectorIndex() = default;

bool VectorIndex::create(int dimensions, int initialCapacity)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (dimensions <= 0) {
        qCritical() << "VectorIndex::create requires positive dimensions, got" << dimensions;
        return false;
    }

    try {
        auto space = std::make_unique<hnswlib::InnerProductSpace>(static_cast<size_t>(dimensions));
        auto index = std::make_unique<hnswlib::HierarchicalNSW<float>>(
            space.get(),
            static_cast<size_t>(std::max(initialCapacity, 1)),
            static_cast<size_t>(kM),
            static_cast<size_t>(kEfConstruction));
        index->setEf(static_cast<size_t>(kEfSearch));

        m_index = std::move(index);
        m_space = std::move(space);
        m_dimensions = dimensions;
        m_live.clear();
        return true;
    } catch (const std::exception& e) {
        qCritical() << "VectorIndex::create failed:" << e.what();
        m_index.reset();
        m_space.reset();
        m_dimensions = 0;
        m_live.clear();
        return false;
    }
}

void VectorIndex::reset()
{
    std::lock_guard<std::mutex> lock(m_mutex);
    m_index.reset();
    m_space.reset();
    m_dimensions = 0;
    m_live.clear();
}

bool VectorIndex::upsert(uint64_t label, const std::vector<float>& vector)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_index) {
        qWarning() << "VectorIndex::upsert called on unavailable index";
        return false;
    }
    if (static_cast<int>(vector.size()) != m_dimensions) {
        qWarning() << "VectorIndex::upsert dimension mismatch:" << vector.size()
                   << "expected" << m_dimensions;
        return false;
    }
    if (!ensureCapacityForOneMore()) {
        return false;
    }

    try {
        // An existing (or previously deleted) label is updated in place.
        m_index->addPoint(vector.data(), static_cast<hnswlib::labeltype>(label));
        m_live.insert(label);
        return true;
    } catch (const std::exception& e) {
        qCritical() << "VectorIndex::upsert failed:" << e.what();
        return false;
    }
}

bool VectorIndex::remove(uint64_t label)
{
    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_index || m_live.count(label) == 0) {
        return false;
    }

    try {
        m_index->markDelete(static_cast<hnswlib::labeltype>(label));
        m_live.erase(label);
        return true;
    } catch (const std::exception& e) {
        qCritical() << "VectorIndex::remove failed:" << e.what();
        return false;
    }
}

bool VectorIndex::contains(uint64_t label) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_live.count(label) > 0;
}

std::vector<VectorIndex::KnnResult> VectorIndex::search(const std::vector<float>& query, int k) const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    std::vector<KnnResult> results;
    if (!m_index || k <= 0 || m_live.empty()
        || static_cast<int>(query.size()) != m_dimensions) {
        return results;
    }

    const size_t want = std::min(static_cast<size_t>(k), m_live.size());
    try {
        m_index->setEf(std::max(static_cast<size_t>(kEfSearch), want));
        auto queue = m_index->searchKnn(query.data(), want);
        results.reserve(queue.size());
        while (!queue.empty()) {
            const auto& top = queue.top();
            results.push_back(KnnResult{static_cast<uint64_t>(top.second), 1.0f - top.first});
            queue.pop();
        }
        std::sort(results.begin(), results.end(), [](const KnnResult& a, const KnnResult& b) {
            if (a.similarity != b.similarity) {
                return a.similarity > b.similarity;
            }
            return a.label < b.label;
        });
        return results;
    } catch (const std::exception& e) {
        qCritical() << "VectorIndex::search failed:" << e.what();
        return {};
    }
}

int VectorIndex::size() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return static_cast<int>(m_live.size());
}

int VectorIndex::dimensions() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_dimensions;
}

bool VectorIndex::isAvailable() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_index != nullptr;
}

bool VectorIndex::ensureCapacityForOneMore()
{
    const size_t current = m_index->getCurrentElementCount();
    const size_t maxElements = m_index->getMaxElements();
    if (current < (maxElements * 8) / 10) {
        return true;
    }

    try {
        m_index->resizeIndex(std::max<size_t>(maxElements * 2, 16));
        return true;
    } catch (const std::exception& e) {
        qCritical() << "VectorIndex resize failed:" << e.what();
        return false;
    }
}

} // namespace hr
