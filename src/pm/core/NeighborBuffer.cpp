#include "pm/core/NeighborBuffer.hpp"
#include "pm/core/Errors.hpp"

#include <stdexcept>

namespace pm {

NeighborBuffer::NeighborBuffer(const PointSet& points, std::vector<std::string> fields, size_t k)
    : _fields(std::move(fields))
{
    if (_fields.empty()) {
        _fields = points.fieldNames();
    }

    for (size_t i = 0; i < _fields.size(); i++) {
        if (!_slots.emplace(_fields[i], i).second) {
            throw InvalidArgumentError("Field '" + _fields[i] + "' requested twice");
        }
    }
    _columns.resize(_fields.size());

    bind(points);
    resize(k);
}

void NeighborBuffer::resize(size_t k)
{
    if (k == _k) {
        return;
    }
    _k = k;
    for (auto& col : _columns) {
        col.resize(k);
    }
    _indices.resize(k);
    _distancesSq.resize(k);
}

void NeighborBuffer::bind(const PointSet& points)
{
    std::vector<ColumnPtr> sources;
    sources.reserve(_fields.size());
    for (const auto& name : _fields) {
        if (!points.hasField(name)) {
            throw InvalidArgumentError("Point set has no field named '" + name + "'");
        }
        sources.push_back(points.sharedField(name));
    }
    _sources = std::move(sources);
}

// Compares columns, not the PointSet address, which a later set may reuse
bool NeighborBuffer::boundTo(const PointSet& points) const
{
    for (size_t f = 0; f < _fields.size(); f++) {
        if (!points.hasField(_fields[f]) || &points.field(_fields[f]) != _sources[f].get()) {
            return false;
        }
    }
    return true;
}

void NeighborBuffer::fill(const PointSet& points, const NeighborQueryResult& result, size_t queryIndex)
{
    if (result.size() != _k) {
        throw InvalidArgumentError("Neighbor buffer holds " + std::to_string(_k) +
                                   " entries, query returned " + std::to_string(result.size()),
                                   queryIndex);
    }
    if (!boundTo(points)) {
        bind(points);
    }

    _queryIndex = queryIndex;
    for (size_t j = 0; j < _k; j++) {
        _indices[j] = result[j].index;
        _distancesSq[j] = result[j].distanceSq;
    }

    for (size_t f = 0; f < _columns.size(); f++) {
        const Column& src = *_sources[f];
        double* dst = _columns[f].data();
        for (size_t j = 0; j < _k; j++) {
            dst[j] = src[_indices[j]];
        }
    }
}

const Column& NeighborBuffer::column(const std::string& field) const
{
    auto it = _slots.find(field);
    if (it == _slots.end()) {
        throw std::out_of_range("Field '" + field + "' is not in the neighbor buffer");
    }
    return _columns[it->second];
}

} // namespace pm
