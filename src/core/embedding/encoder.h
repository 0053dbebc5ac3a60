#pragma once

#include <QString>

#include <map>
#include <optional>
#include <vector>

namespace hr {

// Unit-length (L2) float vector.
using DenseVector = std::vector<float>;

// Expansion term -> non-negative weight.
using SparseVector = std::map<QString, float>;

// Text -> dense vector. Implementations never throw; an unavailable or
// failing model yields std::nullopt.
class DenseEncoder {
public:
    virtual ~DenseEncoder() = default;

    virtual bool isAvailable() const = 0;
    virtual int dimensions() const = 0;

    virtual std::optional<DenseVector> embed(const QString& text) = 0;

    // Same model with the query-side prefix applied.
    virtual std::optional<DenseVector> embedQuery(const QString& text) = 0;
};

// Text -> weighted term expansion. Never throws.
class SparseEncoder {
public:
    virtual ~SparseEncoder() = default;

    virtual bool isAvailable() const = 0;

    virtual std::optional<SparseVector> expand(const QString& text) = 0;

    // One model call for the whole batch. A failed batch returns an empty
    // vector; callers must also treat a size mismatch as failure.
    virtual std::vector<std::optional<SparseVector>> expandBatch(
        const std::vector<QString>& texts) = 0;
};

} // namespace hr
