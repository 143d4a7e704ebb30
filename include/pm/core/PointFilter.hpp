#pragma once

#include <cstddef>
#include <functional>
#include <vector>

#include "pm/core/PointSet.hpp"

namespace pm {

using PointPredicate = std::function<bool(const Point&)>;

/**
 * @brief Ordered indices of the points to process
 *
 * The identity selection covers every point and stores no index list.
 * Selections only choose which points are queried; neighbors are always
 * searched among the whole point set.
 */
class PointSelection
{
public:
    static PointSelection all(size_t total);

    // indices must be strictly increasing and below total
    PointSelection(std::vector<size_t> indices, size_t total);

    size_t size() const { return _identity ? _total : _indices.size(); }
    size_t total() const { return _total; }
    bool empty() const { return size() == 0; }

    // True when every point of the set is selected, with or without an index list
    bool selectsAll() const { return _identity || _indices.size() == _total; }
    bool isIdentity() const { return _identity; }

    // Point index of the i-th selected point
    size_t operator[](size_t i) const { return _identity ? i : _indices[i]; }

    // Empty for the identity selection
    const std::vector<size_t>& indices() const { return _indices; }

private:
    PointSelection(size_t total);

    bool _identity = false;
    size_t _total = 0;
    std::vector<size_t> _indices;
};

/**
 * @brief Evaluate predicate once per point, in point order
 * @param predicate May be empty, which selects every point without allocating
 * @throws PredicateEvaluationError with the point index if predicate throws
 */
PointSelection selectPoints(const PointSet& points, const PointPredicate& predicate);

} // namespace pm
