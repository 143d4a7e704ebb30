#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

#include <opencv2/core.hpp>

namespace pm {

using Column = std::vector<double>;
using ColumnPtr = std::shared_ptr<const Column>;

class PointSet;

// Read-only view of a single point, handed to filter predicates
class Point
{
public:
    Point(const PointSet& points, size_t index);

    size_t index() const { return _index; }

    double x() const;
    double y() const;
    double z() const;
    cv::Vec3d position() const;

    bool has(const std::string& field) const;

    // Value of X, Y, Z or a named attribute
    // @throws std::out_of_range if the point set has no such field
    double operator[](const std::string& field) const;

private:
    const PointSet* _points;
    size_t _index;
};

/**
 * @brief Ordered point cloud with XYZ coordinates and named scalar attributes
 *
 * Storage is column-wise. Columns are immutable and shared, so result tables
 * can hold the coordinate columns without copying them. Point order is stable
 * and defines the row order of everything computed from the set.
 */
class PointSet
{
public:
    PointSet();

    // @throws InvalidInputError if the three columns differ in length
    PointSet(Column x, Column y, Column z);
    explicit PointSet(const std::vector<cv::Vec3d>& coords);

    // @throws InvalidInputError on length mismatch, duplicate or reserved name
    void addAttribute(const std::string& name, Column values);

    size_t size() const { return _x->size(); }
    bool empty() const { return _x->empty(); }

    cv::Vec3d coordinate(size_t i) const
    {
        return {(*_x)[i], (*_y)[i], (*_z)[i]};
    }

    const Column& x() const { return *_x; }
    const Column& y() const { return *_y; }
    const Column& z() const { return *_z; }

    // X, Y, Z or an attribute
    bool hasField(const std::string& name) const;
    const Column& field(const std::string& name) const;
    ColumnPtr sharedField(const std::string& name) const;

    const std::vector<std::string>& attributeNames() const { return _attributeNames; }

    // X, Y, Z followed by the attributes in insertion order
    std::vector<std::string> fieldNames() const;

    Point point(size_t i) const { return Point(*this, i); }

    // @throws InvalidInputError if the set is empty or holds a non-finite coordinate
    void validate() const;

    static bool isCoordinateName(const std::string& name);

private:
    ColumnPtr _x;
    ColumnPtr _y;
    ColumnPtr _z;
    std::vector<std::string> _attributeNames;
    std::unordered_map<std::string, ColumnPtr> _attributes;
};

} // namespace pm
