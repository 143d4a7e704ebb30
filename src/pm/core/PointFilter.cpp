#include "pm/core/PointFilter.hpp"
#include "pm/core/Errors.hpp"

#include <exception>

namespace pm {

PointSelection::PointSelection(size_t total) : _identity(true), _total(total) {}

PointSelection::PointSelection(std::vector<size_t> indices, size_t total)
    : _identity(false), _total(total), _indices(std::move(indices))
{
    for (size_t i = 0; i < _indices.size(); i++) {
        if (_indices[i] >= _total || (i > 0 && _indices[i] <= _indices[i - 1])) {
            throw InvalidArgumentError("Selection indices must be increasing and below " +
                                       std::to_string(_total));
        }
    }
}

PointSelection PointSelection::all(size_t total)
{
    return PointSelection(total);
}

PointSelection selectPoints(const PointSet& points, const PointPredicate& predicate)
{
    if (!predicate) {
        return PointSelection::all(points.size());
    }

    std::vector<size_t> selected;
    for (size_t i = 0; i < points.size(); i++) {
        bool keep = false;
        try {
            keep = predicate(points.point(i));
        } catch (const std::exception& e) {
            throw PredicateEvaluationError(std::string("filter failed: ") + e.what(), i);
        }
        if (keep) {
            selected.push_back(i);
        }
    }
    return PointSelection(std::move(selected), points.size());
}

} // namespace pm
