#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

namespace pm {

class PointSet;

struct Neighbor {
    size_t index = 0;
    double distanceSq = 0.0;
};

// Always exactly k entries, ascending distance, ties by lower point index
using NeighborQueryResult = std::vector<Neighbor>;

inline bool neighborLess(const Neighbor& a, const Neighbor& b)
{
    if (a.distanceSq != b.distanceSq) {
        return a.distanceSq < b.distanceSq;
    }
    return a.index < b.index;
}

enum class IndexType {
    RTree,
    Linear
};

// "rtree" or "linear"
// @throws InvalidArgumentError for any other name
IndexType indexTypeFromString(const std::string& name);
std::string indexTypeName(IndexType type);

/**
 * @brief Exact k-nearest-neighbor search over an immutable point set
 *
 * Queries are by location, so a location that coincides with an indexed
 * point returns that point among its neighbors at distance zero.
 * Implementations are read-only after construction and can be queried from
 * several threads at once.
 */
class NeighborIndex
{
public:
    virtual ~NeighborIndex() = default;

    virtual size_t size() const = 0;

    /**
     * @brief Find the k points closest to location
     * @param location Query position, need not be an indexed point
     * @param k Number of neighbors, 1 <= k < size()
     * @param out Overwritten with the neighbors; reusing it across calls avoids reallocation
     * @throws InvalidArgumentError if k is out of range or location is not finite
     */
    void kNearest(const cv::Vec3d& location, size_t k, NeighborQueryResult& out) const;
    NeighborQueryResult kNearest(const cv::Vec3d& location, size_t k) const;

    // As kNearest, but the point with index excluded is never returned
    // @throws InvalidArgumentError if k or location is invalid, or excluded is not an indexed point
    void kNearestExcluding(const cv::Vec3d& location, size_t k, size_t excluded,
                           NeighborQueryResult& out) const;

protected:
    static constexpr size_t NO_EXCLUSION = static_cast<size_t>(-1);

    // k is already validated; out must end up with exactly k entries
    virtual void search(const cv::Vec3d& location, size_t k, size_t excluded,
                        NeighborQueryResult& out) const = 0;

private:
    void checkQuery(const cv::Vec3d& location, size_t k) const;
};

// Boost.Geometry R-tree over all points of a set
class PointIndex : public NeighborIndex
{
public:
    // @throws InvalidInputError if points is empty or holds non-finite coordinates
    explicit PointIndex(const PointSet& points);
    ~PointIndex() override;

    PointIndex(PointIndex&&) noexcept;
    PointIndex& operator=(PointIndex&&) noexcept;

    PointIndex(const PointIndex&) = delete;
    PointIndex& operator=(const PointIndex&) = delete;

    size_t size() const override;

protected:
    void search(const cv::Vec3d& location, size_t k, size_t excluded,
                NeighborQueryResult& out) const override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

// Brute force scan, O(n) per query
class LinearIndex : public NeighborIndex
{
public:
    // @throws InvalidInputError if points is empty or holds non-finite coordinates
    explicit LinearIndex(const PointSet& points);

    size_t size() const override { return _coords.size(); }

protected:
    void search(const cv::Vec3d& location, size_t k, size_t excluded,
                NeighborQueryResult& out) const override;

private:
    std::vector<cv::Vec3d> _coords;
};

std::unique_ptr<NeighborIndex> makeNeighborIndex(IndexType type, const PointSet& points);

} // namespace pm
