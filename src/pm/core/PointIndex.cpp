#include "pm/core/PointIndex.hpp"
#include "pm/core/Errors.hpp"
#include "pm/core/PointSet.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

#include <boost/geometry.hpp>
#include <boost/geometry/geometries/point.hpp>
#include <boost/geometry/index/rtree.hpp>

namespace bg = boost::geometry;
namespace bgi = boost::geometry::index;

namespace pm {

IndexType indexTypeFromString(const std::string& name)
{
    if (name == "rtree") return IndexType::RTree;
    if (name == "linear") return IndexType::Linear;
    throw InvalidArgumentError("Unknown index type '" + name + "', expected 'rtree' or 'linear'");
}

std::string indexTypeName(IndexType type)
{
    switch (type) {
        case IndexType::RTree: return "rtree";
        case IndexType::Linear: return "linear";
    }
    return "unknown";
}

void NeighborIndex::kNearest(const cv::Vec3d& location, size_t k, NeighborQueryResult& out) const
{
    checkQuery(location, k);
    search(location, k, NO_EXCLUSION, out);
}

void NeighborIndex::kNearestExcluding(const cv::Vec3d& location, size_t k, size_t excluded,
                                      NeighborQueryResult& out) const
{
    checkQuery(location, k);
    if (excluded >= size()) {
        throw InvalidArgumentError("Excluded point " + std::to_string(excluded) +
                                   " is not in an index of " + std::to_string(size()) + " points");
    }
    search(location, k, excluded, out);
}

NeighborQueryResult NeighborIndex::kNearest(const cv::Vec3d& location, size_t k) const
{
    NeighborQueryResult out;
    out.reserve(k);
    kNearest(location, k, out);
    return out;
}

void NeighborIndex::checkQuery(const cv::Vec3d& location, size_t k) const
{
    if (!std::isfinite(location[0]) || !std::isfinite(location[1]) || !std::isfinite(location[2])) {
        throw InvalidArgumentError("Query location must be finite, got (" + std::to_string(location[0]) + ", " +
                                   std::to_string(location[1]) + ", " + std::to_string(location[2]) + ")");
    }
    if (k < 1 || k >= size()) {
        throw InvalidArgumentError("k must be in [1, " + std::to_string(size()) +
                                   ") for a set of " + std::to_string(size()) +
                                   " points, got " + std::to_string(k));
    }
}

struct PointIndex::Impl {
    using Point3 = bg::model::point<double, 3, bg::cs::cartesian>;
    using Entry = std::pair<Point3, size_t>;
    using Tree = bgi::rtree<Entry, bgi::quadratic<16>>;

    Tree tree;

    static Point3 toBoost(const cv::Vec3d& p)
    {
        return Point3(p[0], p[1], p[2]);
    }
};

PointIndex::PointIndex(const PointSet& points) : impl_(std::make_unique<Impl>())
{
    points.validate();

    std::vector<Impl::Entry> entries;
    entries.reserve(points.size());
    for (size_t i = 0; i < points.size(); i++) {
        entries.emplace_back(Impl::toBoost(points.coordinate(i)), i);
    }

    // Packing construction, much faster than individual inserts
    impl_->tree = Impl::Tree(entries.begin(), entries.end());
}

PointIndex::~PointIndex() = default;

PointIndex::PointIndex(PointIndex&&) noexcept = default;
PointIndex& PointIndex::operator=(PointIndex&&) noexcept = default;

size_t PointIndex::size() const
{
    return impl_->tree.size();
}

void PointIndex::search(const cv::Vec3d& location, size_t k, size_t excluded,
                        NeighborQueryResult& out) const
{
    out.clear();

    const Impl::Point3 query = Impl::toBoost(location);
    const auto unbounded = static_cast<unsigned>(impl_->tree.size());

    // The incremental query yields entries by increasing distance. Reading
    // continues past the k-th entry while distances tie with it, otherwise the
    // tree's internal order would decide which of the tied points is kept.
    double kthDistSq = std::numeric_limits<double>::infinity();
    for (auto it = impl_->tree.qbegin(bgi::nearest(query, unbounded)); it != impl_->tree.qend(); ++it) {
        if (it->second == excluded) {
            continue;
        }
        const double distSq = bg::comparable_distance(query, it->first);
        if (out.size() >= k && distSq > kthDistSq) {
            break;
        }
        out.push_back({it->second, distSq});
        if (out.size() == k) {
            kthDistSq = distSq;
        }
    }

    std::sort(out.begin(), out.end(), neighborLess);
    out.resize(k);
}

std::unique_ptr<NeighborIndex> makeNeighborIndex(IndexType type, const PointSet& points)
{
    switch (type) {
        case IndexType::RTree: return std::make_unique<PointIndex>(points);
        case IndexType::Linear: return std::make_unique<LinearIndex>(points);
    }
    throw InvalidArgumentError("Unknown index type");
}

} // namespace pm
