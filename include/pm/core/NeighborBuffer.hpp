#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include "pm/core/PointIndex.hpp"
#include "pm/core/PointSet.hpp"

namespace pm {

/**
 * @brief Reusable storage for the attributes of the k neighbors of one query
 *
 * One buffer is allocated per sweep and overwritten for every processed
 * point. Each requested field is exposed as a contiguous column of exactly
 * k values, in neighbor order (nearest first). Every fill() invalidates the
 * previous contents, so readers must be done with a column before the next
 * fill() on the same buffer.
 */
class NeighborBuffer
{
public:
    /**
     * @param points Point set the neighbors will be read from
     * @param fields X, Y, Z or attribute names; empty selects every field of points
     * @param k Number of neighbors per query
     * @throws InvalidArgumentError for a field that points does not have
     */
    NeighborBuffer(const PointSet& points, std::vector<std::string> fields, size_t k);

    // Reallocates only when k changes
    void resize(size_t k);

    /**
     * @brief Copy the requested fields of the neighbors in result
     * @param queryIndex Index of the point the neighborhood belongs to
     * @throws InvalidArgumentError if result does not hold exactly size() entries
     */
    void fill(const PointSet& points, const NeighborQueryResult& result, size_t queryIndex);

    size_t size() const { return _k; }
    size_t queryIndex() const { return _queryIndex; }

    const std::vector<std::string>& fields() const { return _fields; }
    bool has(const std::string& field) const { return _slots.count(field) > 0; }

    // @throws std::out_of_range if field was not requested
    const Column& column(const std::string& field) const;

    const Column& x() const { return column("X"); }
    const Column& y() const { return column("Y"); }
    const Column& z() const { return column("Z"); }

    const std::vector<size_t>& indices() const { return _indices; }
    const Column& distancesSq() const { return _distancesSq; }

private:
    void bind(const PointSet& points);
    bool boundTo(const PointSet& points) const;

    size_t _k = 0;
    size_t _queryIndex = 0;
    std::vector<std::string> _fields;
    std::unordered_map<std::string, size_t> _slots;
    std::vector<Column> _columns;

    // Source columns of the point set last filled from, held so they outlive it
    std::vector<ColumnPtr> _sources;

    std::vector<size_t> _indices;
    Column _distancesSq;
};

} // namespace pm
