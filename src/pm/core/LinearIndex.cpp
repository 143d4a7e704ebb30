#include "pm/core/PointIndex.hpp"
#include "pm/core/PointSet.hpp"

#include <algorithm>

#include <boost/geometry.hpp>
#include <boost/geometry/geometries/point.hpp>

namespace bg = boost::geometry;

namespace pm {

namespace {

using Point3 = bg::model::point<double, 3, bg::cs::cartesian>;

// Same arithmetic as the R-tree so both indices agree on exact ties
inline double squaredDistance(const cv::Vec3d& a, const cv::Vec3d& b)
{
    return bg::comparable_distance(Point3(a[0], a[1], a[2]), Point3(b[0], b[1], b[2]));
}

} // anonymous namespace

LinearIndex::LinearIndex(const PointSet& points)
{
    points.validate();

    _coords.reserve(points.size());
    for (size_t i = 0; i < points.size(); i++) {
        _coords.push_back(points.coordinate(i));
    }
}

void LinearIndex::search(const cv::Vec3d& location, size_t k, size_t excluded,
                         NeighborQueryResult& out) const
{
    out.clear();

    // Bounded max-heap on (distance, index); front is the current worst neighbor
    for (size_t i = 0; i < _coords.size(); i++) {
        if (i == excluded) {
            continue;
        }
        const Neighbor candidate{i, squaredDistance(location, _coords[i])};
        if (out.size() < k) {
            out.push_back(candidate);
            std::push_heap(out.begin(), out.end(), neighborLess);
        } else if (neighborLess(candidate, out.front())) {
            std::pop_heap(out.begin(), out.end(), neighborLess);
            out.back() = candidate;
            std::push_heap(out.begin(), out.end(), neighborLess);
        }
    }

    std::sort_heap(out.begin(), out.end(), neighborLess);
}

} // namespace pm
