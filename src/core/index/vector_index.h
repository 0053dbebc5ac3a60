#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <unordered_set>
#include <vector>

namespace hnswlib {
class InnerProductSpace;

template <typename dist_t>
class HierarchicalNSW;
} // namespace hnswlib

namespace hr {

// In-memory HNSW index over unit vectors, keyed by caller-chosen labels
// (the chunk row id). Inner-product space, so similarity = 1 - distance
// is the cosine for normalized inputs.
class VectorIndex {
public:
    struct KnnResult {
        uint64_t label = 0;
        float similarity = 0.0f;
    };

    static constexpr int kM = 16;
    static constexpr int kEfConstruction = 200;
    static constexpr int kEfSearch = 50;
    static constexpr int kInitialCapacity = 1024;

    VectorIndex();
    ~VectorIndex();

    VectorIndex(const VectorIndex&) = delete;
    VectorIndex& operator=(const VectorIndex&) = delete;

    // Drops any existing contents.
    bool create(int dimensions, int initialCapacity = kInitialCapacity);
    void reset();

    // Inserts or replaces the vector stored under label.
    bool upsert(uint64_t label, const std::vector<float>& vector);
    bool remove(uint64_t label);
    bool contains(uint64_t label) const;

    // Best first. Empty when unavailable, on dimension mismatch or failure.
    std::vector<KnnResult> search(const std::vector<float>& query, int k) const;

    int size() const;
    int dimensions() const;
    bool isAvailable() const;

private:
    bool ensureCapacityForOneMore();

    int m_dimensions = 0;
    std::unique_ptr<hnswlib::InnerProductSpace> m_space;
    std::unique_ptr<hnswlib::HierarchicalNSW<float>> m_index;
    std::unordered_set<uint64_t> m_live;
    mutable std::mutex m_mutex;
};

} // namespace hr
